#include "TerminalUI.h"
#include "DatasetExporter.h"
#include <algorithm>
#include <iomanip>
#include <vector>

namespace {
constexpr size_t kMaxCellWidth = 24;

std::string clip(std::string s) {
    if (s.size() <= kMaxCellWidth) return s;
    s.resize(kMaxCellWidth - 3);
    return s + "...";
}

std::string renderCell(const TypedColumn& col, size_t row) {
    if (col.isMissing(row)) return "<NA>";
    if (col.kind == ColumnKind::NUMERIC) return DatasetExporter::formatNumber(*col.numeric()[row]);
    return clip("\"" + *col.text()[row] + "\"");
}
}

void TerminalUI::printSummary(const TypedDataset& data, std::ostream& os) {
    size_t maxNameLen = 15;
    for (const auto& col : data.columns()) maxNameLen = std::max(maxNameLen, col.name.length());
    const int w = static_cast<int>(maxNameLen) + 2;

    os << "\n================================ DATASET SUMMARY ================================\n";
    os << "Rows: " << data.rowCount() << ", Columns: " << data.colCount() << "\n";
    os << std::left << std::setw(w) << "Column" << std::setw(10) << "Kind" << "Missing\n";
    os << std::string(static_cast<size_t>(w) + 17, '-') << "\n";
    for (const auto& col : data.columns()) {
        os << std::left << std::setw(w) << col.name
           << std::setw(10) << columnKindName(col.kind)
           << col.missingCount() << "\n";
    }
    os << "=================================================================================\n";
}

void TerminalUI::printPreview(const TypedDataset& data, size_t maxRows, std::ostream& os) {
    const size_t shown = std::min(maxRows, data.rowCount());
    const auto& cols = data.columns();

    std::vector<size_t> widths;
    widths.reserve(cols.size() + 1);
    widths.push_back(std::string("row_id").size());
    for (size_t r = 0; r < shown; ++r) widths[0] = std::max(widths[0], std::to_string(data.rowIds()[r]).size());
    for (const auto& col : cols) {
        size_t w = clip(col.name).size();
        for (size_t r = 0; r < shown; ++r) w = std::max(w, renderCell(col, r).size());
        widths.push_back(w);
    }

    os << std::left << std::setw(static_cast<int>(widths[0])) << "row_id";
    for (size_t c = 0; c < cols.size(); ++c) {
        os << "  " << std::setw(static_cast<int>(widths[c + 1])) << clip(cols[c].name);
    }
    os << "\n";

    for (size_t r = 0; r < shown; ++r) {
        os << std::left << std::setw(static_cast<int>(widths[0])) << data.rowIds()[r];
        for (size_t c = 0; c < cols.size(); ++c) {
            os << "  " << std::setw(static_cast<int>(widths[c + 1])) << renderCell(cols[c], r);
        }
        os << "\n";
    }
    if (shown < data.rowCount()) {
        os << "... " << (data.rowCount() - shown) << " more row(s)\n";
    }
}

void TerminalUI::printIqrBounds(const std::string& columnName, const IqrBounds& bounds, std::ostream& os) {
    if (!bounds.valid()) {
        os << "        -> " << columnName << ": no observed values, nothing to fence\n";
        return;
    }
    os << "        -> " << columnName << ": Q1=" << DatasetExporter::formatNumber(bounds.q1)
       << " Q3=" << DatasetExporter::formatNumber(bounds.q3)
       << " IQR=" << DatasetExporter::formatNumber(bounds.iqr)
       << " fence=[" << DatasetExporter::formatNumber(bounds.lower)
       << ", " << DatasetExporter::formatNumber(bounds.upper) << "]"
       << " over " << bounds.observed << " value(s)\n";
}
