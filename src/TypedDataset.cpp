#include "TypedDataset.h"
#include "ScrubExceptions.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

const char* columnKindName(ColumnKind kind) noexcept {
    switch (kind) {
        case ColumnKind::TEXT: return "text";
        case ColumnKind::NUMERIC: return "numeric";
        case ColumnKind::OTHER: return "other";
    }
    return "other";
}

namespace {
template <typename Cells>
Cells selectRows(const Cells& cells, const KeepMask& keepMask, size_t keptCount) {
    Cells next;
    next.reserve(keptCount);
    for (size_t i = 0; i < cells.size(); ++i) {
        if (!keepMask[i]) continue;
        next.push_back(cells[i]);
    }
    return next;
}

bool sameNumericCell(const NumericCell& a, const NumericCell& b) {
    if (a.has_value() != b.has_value()) return false;
    if (!a) return true;
    if (std::isnan(*a) && std::isnan(*b)) return true;
    return *a == *b;
}
}

size_t TypedColumn::size() const noexcept {
    return std::visit([](const auto& cells) { return cells.size(); }, values);
}

bool TypedColumn::isMissing(size_t row) const {
    return std::visit([row](const auto& cells) { return !cells.at(row).has_value(); }, values);
}

size_t TypedColumn::missingCount() const noexcept {
    return std::visit([](const auto& cells) {
        return static_cast<size_t>(std::count_if(cells.begin(), cells.end(), [](const auto& c) { return !c.has_value(); }));
    }, values);
}

bool TypedColumn::operator==(const TypedColumn& other) const {
    if (name != other.name || kind != other.kind) return false;
    if (values.index() != other.values.index()) return false;
    if (std::holds_alternative<TextCells>(values)) return text() == other.text();

    const auto& a = numeric();
    const auto& b = other.numeric();
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!sameNumericCell(a[i], b[i])) return false;
    }
    return true;
}

TypedDataset::TypedDataset(std::vector<RowId> rowIds)
    : rowIds_(std::move(rowIds)), rowIdsFixed_(true) {
    std::unordered_set<RowId> seen;
    seen.reserve(rowIds_.size());
    for (RowId id : rowIds_) {
        if (!seen.insert(id).second) {
            throw Scrub::DatasetException("Duplicate row identifier: " + std::to_string(id));
        }
    }
}

void TypedDataset::addColumn(TypedColumn column) {
    if (findColumnIndex(column.name) >= 0) {
        throw Scrub::DatasetException("Duplicate column name: " + column.name);
    }

    const bool numericStorage = std::holds_alternative<NumericCells>(column.values);
    if (numericStorage != (column.kind == ColumnKind::NUMERIC)) {
        throw Scrub::DatasetException("Column '" + column.name + "' storage does not match kind " +
                                      columnKindName(column.kind));
    }

    const size_t length = column.size();
    if (!rowIdsFixed_ && columns_.empty()) {
        rowIds_.resize(length);
        std::iota(rowIds_.begin(), rowIds_.end(), RowId{0});
        rowIdsFixed_ = true;
    } else if (length != rowIds_.size()) {
        throw Scrub::DatasetException("Column '" + column.name + "' has " + std::to_string(length) +
                                      " rows, dataset has " + std::to_string(rowIds_.size()));
    }

    columns_.push_back(std::move(column));
}

void TypedDataset::addTextColumn(std::string name, TextCells cells, ColumnKind kind) {
    TypedColumn col;
    col.name = std::move(name);
    col.kind = kind;
    col.values = std::move(cells);
    addColumn(std::move(col));
}

void TypedDataset::addNumericColumn(std::string name, NumericCells cells) {
    TypedColumn col;
    col.name = std::move(name);
    col.kind = ColumnKind::NUMERIC;
    col.values = std::move(cells);
    addColumn(std::move(col));
}

std::vector<std::string> TypedDataset::columnNames() const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& col : columns_) out.push_back(col.name);
    return out;
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

const TypedColumn& TypedDataset::column(const std::string& name) const {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Scrub::MissingColumnException(name);
    return columns_[static_cast<size_t>(idx)];
}

void TypedDataset::replaceColumn(size_t index, TypedColumn replacement) {
    if (index >= columns_.size()) {
        throw Scrub::DatasetException("Column index out of range: " + std::to_string(index));
    }
    const TypedColumn& current = columns_[index];
    if (replacement.name != current.name || replacement.kind != current.kind ||
        replacement.values.index() != current.values.index() || replacement.size() != rowIds_.size()) {
        throw Scrub::DatasetException("Replacement for column '" + current.name + "' changes its shape");
    }
    columns_[index] = std::move(replacement);
}

TypedDataset TypedDataset::filterRows(const KeepMask& keepMask) const {
    if (keepMask.size() != rowIds_.size()) throw Scrub::DatasetException("Row mask size mismatch");

    const size_t kept = static_cast<size_t>(std::count_if(keepMask.begin(), keepMask.end(), [](uint8_t k) { return k != 0; }));

    TypedDataset out;
    out.rowIdsFixed_ = true;
    out.rowIds_ = selectRows(rowIds_, keepMask, kept);
    out.columns_.reserve(columns_.size());
    for (const auto& col : columns_) {
        TypedColumn next;
        next.name = col.name;
        next.kind = col.kind;
        next.values = std::visit([&](const auto& cells) -> ColumnStorage {
            return selectRows(cells, keepMask, kept);
        }, col.values);
        out.columns_.push_back(std::move(next));
    }
    return out;
}

bool TypedDataset::operator==(const TypedDataset& other) const {
    return rowIds_ == other.rowIds_ && columns_ == other.columns_;
}
