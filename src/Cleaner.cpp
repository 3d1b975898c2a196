#include "Cleaner.h"
#include "CommonUtils.h"
#include "ScrubExceptions.h"
#include "StatsUtils.h"
#include <algorithm>
#include <cmath>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
std::vector<size_t> resolveColumns(const TypedDataset& data, const std::vector<std::string>& columnNames) {
    std::vector<size_t> indices;
    indices.reserve(columnNames.size());
    for (const auto& name : columnNames) {
        const int idx = data.findColumnIndex(name);
        if (idx < 0) throw Scrub::MissingColumnException(name);
        indices.push_back(static_cast<size_t>(idx));
    }
    return indices;
}

void requireKind(const TypedColumn& col, ColumnKind expected) {
    if (col.kind != expected) {
        throw Scrub::WrongColumnTypeException(col.name, columnKindName(expected), columnKindName(col.kind));
    }
}

void requireFactor(double factor) {
    if (!std::isfinite(factor) || factor < 0.0) {
        throw Scrub::InvalidArgumentException("IQR factor must be finite and >= 0, got " + std::to_string(factor));
    }
}

TypedColumn trimmedColumn(const TypedColumn& col) {
    TypedColumn out;
    out.name = col.name;
    out.kind = col.kind;
    TextCells cells = col.text();
    for (auto& cell : cells) {
        if (cell) *cell = CommonUtils::trim(*cell);
    }
    out.values = std::move(cells);
    return out;
}

IqrBounds fenceFor(const TypedColumn& col, double factor) {
    std::vector<double> observed;
    observed.reserve(col.size());
    for (const auto& cell : col.numeric()) {
        if (cell && std::isfinite(*cell)) observed.push_back(*cell);
    }

    IqrBounds bounds;
    bounds.observed = observed.size();
    if (observed.empty()) return bounds;

    std::sort(observed.begin(), observed.end());
    bounds.q1 = StatsUtils::percentileSorted(observed, 0.25);
    bounds.q3 = StatsUtils::percentileSorted(observed, 0.75);
    bounds.iqr = bounds.q3 - bounds.q1;
    if (StatsUtils::countDistinctSorted(observed) < 2 || bounds.iqr <= 0.0) {
        bounds.iqr = 0.0;
        bounds.lower = bounds.q1;
        bounds.upper = bounds.q3;
        return bounds;
    }
    bounds.lower = bounds.q1 - factor * bounds.iqr;
    bounds.upper = bounds.q3 + factor * bounds.iqr;
    return bounds;
}

const TypedColumn& numericColumn(const TypedDataset& data, const std::string& columnName) {
    const int idx = data.findColumnIndex(columnName);
    if (idx < 0) throw Scrub::MissingColumnException(columnName);
    const TypedColumn& col = data.columns()[static_cast<size_t>(idx)];
    requireKind(col, ColumnKind::NUMERIC);
    return col;
}
}

TypedDataset Cleaner::trim(const TypedDataset& data, const std::vector<std::string>& columnNames) {
    const std::vector<size_t> indices = resolveColumns(data, columnNames);
    for (size_t idx : indices) requireKind(data.columns()[idx], ColumnKind::TEXT);

    std::vector<size_t> unique = indices;
    std::sort(unique.begin(), unique.end());
    unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

    std::vector<TypedColumn> trimmed(unique.size());
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t pos = 0; pos < unique.size(); ++pos) {
        trimmed[pos] = trimmedColumn(data.columns()[unique[pos]]);
    }

    TypedDataset out = data;
    for (size_t pos = 0; pos < unique.size(); ++pos) {
        out.replaceColumn(unique[pos], std::move(trimmed[pos]));
    }
    return out;
}

TypedDataset Cleaner::dropInvalidRows(const TypedDataset& data, const std::vector<std::string>& columnNames) {
    const std::vector<size_t> indices = resolveColumns(data, columnNames);

    KeepMask keep(data.rowCount(), static_cast<uint8_t>(1));
    for (size_t idx : indices) {
        const TypedColumn& col = data.columns()[idx];
        for (size_t r = 0; r < keep.size(); ++r) {
            if (col.isMissing(r)) keep[r] = static_cast<uint8_t>(0);
        }
    }
    return data.filterRows(keep);
}

IqrBounds Cleaner::computeIqrBounds(const TypedDataset& data, const std::string& columnName, double factor) {
    const TypedColumn& col = numericColumn(data, columnName);
    requireFactor(factor);
    return fenceFor(col, factor);
}

TypedDataset Cleaner::removeOutliersIQR(const TypedDataset& data, const std::string& columnName, double factor) {
    const TypedColumn& col = numericColumn(data, columnName);
    requireFactor(factor);

    const IqrBounds bounds = fenceFor(col, factor);
    KeepMask keep(data.rowCount(), static_cast<uint8_t>(1));
    if (!bounds.valid()) return data.filterRows(keep);

    const auto& cells = col.numeric();
    for (size_t r = 0; r < cells.size(); ++r) {
        const NumericCell& cell = cells[r];
        if (!cell || std::isnan(*cell)) continue;
        if (*cell < bounds.lower || *cell > bounds.upper) keep[r] = static_cast<uint8_t>(0);
    }
    return data.filterRows(keep);
}
