#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class ColumnKind { TEXT, NUMERIC, OTHER };

using TextCell = std::optional<std::string>;
using NumericCell = std::optional<double>;
using TextCells = std::vector<TextCell>;
using NumericCells = std::vector<NumericCell>;
using ColumnStorage = std::variant<TextCells, NumericCells>;
using RowId = size_t;
using KeepMask = std::vector<uint8_t>;

const char* columnKindName(ColumnKind kind) noexcept;

struct TypedColumn {
    std::string name;
    ColumnKind kind = ColumnKind::TEXT;
    ColumnStorage values = TextCells{};

    size_t size() const noexcept;
    bool isMissing(size_t row) const;
    size_t missingCount() const noexcept;

    const TextCells& text() const { return std::get<TextCells>(values); }
    const NumericCells& numeric() const { return std::get<NumericCells>(values); }

    bool operator==(const TypedColumn& other) const;
    bool operator!=(const TypedColumn& other) const { return !(*this == other); }
};

/**
 * @brief In-memory table of named, kind-tagged columns with stable row identifiers.
 * @details Columns are aligned by position. rowIds() carries the original
 * identifier of each position and survives row filtering unchanged.
 */
class TypedDataset {
public:
    TypedDataset() = default;

    /**
     * @brief Creates an empty dataset whose rows will carry the given identifiers.
     * @throws Scrub::DatasetException when identifiers are not unique.
     */
    explicit TypedDataset(std::vector<RowId> rowIds);

    /**
     * @brief Appends a column.
     * @pre name is unique; storage alternative matches kind; length equals rowCount()
     * (the first column fixes the row count when no identifiers were given).
     * @throws Scrub::DatasetException on any violated precondition.
     */
    void addColumn(TypedColumn column);
    void addTextColumn(std::string name, TextCells cells, ColumnKind kind = ColumnKind::TEXT);
    void addNumericColumn(std::string name, NumericCells cells);

    size_t rowCount() const noexcept { return rowIds_.size(); }
    size_t colCount() const noexcept { return columns_.size(); }
    bool empty() const noexcept { return rowIds_.empty(); }

    const std::vector<RowId>& rowIds() const noexcept { return rowIds_; }
    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<std::string> columnNames() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;
    bool hasColumn(const std::string& name) const { return findColumnIndex(name) >= 0; }

    /**
     * @throws Scrub::MissingColumnException when absent.
     */
    const TypedColumn& column(const std::string& name) const;

    /**
     * @brief Replaces the column at index in place.
     * @pre replacement keeps name, kind and length of the column it replaces.
     * @throws Scrub::DatasetException on mismatch.
     */
    void replaceColumn(size_t index, TypedColumn replacement);

    /**
     * @brief Returns a copy containing rows where keepMask is non-zero.
     * @post Identifiers and relative order of kept rows are preserved.
     * @throws Scrub::DatasetException when mask size mismatches row count.
     */
    TypedDataset filterRows(const KeepMask& keepMask) const;

    bool operator==(const TypedDataset& other) const;
    bool operator!=(const TypedDataset& other) const { return !(*this == other); }

private:
    std::vector<RowId> rowIds_;
    bool rowIdsFixed_ = false;
    std::vector<TypedColumn> columns_;
};
