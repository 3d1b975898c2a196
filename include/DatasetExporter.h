#pragma once
#include "TypedDataset.h"
#include <ostream>
#include <string>
#include <vector>

struct ExportOptions {
    char delimiter = ',';
    bool includeRowIds = false;
    // Text values equal to one of these are quoted so a reload keeps them as values.
    std::vector<std::string> missingTokens = {"na", "n/a", "null", "none", "nan", "missing"};
};

class DatasetExporter {
public:
    /**
     * @brief Writes header plus one record per row. Missing cells become empty unquoted fields.
     * @throws Scrub::IOException when the file cannot be written.
     * @throws Scrub::DatasetException when includeRowIds is set and a column is already named row_id.
     */
    static void writeCsv(const TypedDataset& data, const std::string& path, const ExportOptions& options = ExportOptions{});
    static void writeCsv(const TypedDataset& data, std::ostream& out, const ExportOptions& options = ExportOptions{});

    /**
     * @brief Writes a Parquet file with nullable columns and a leading row_id column.
     * @throws Scrub::ConfigurationException when built without Arrow/Parquet support.
     * @throws Scrub::DatasetException when a column is already named row_id.
     * @throws Scrub::IOException on write failure.
     */
    static void writeParquet(const TypedDataset& data, const std::string& path);

    static bool parquetAvailable() noexcept;

    static std::string formatNumber(double value);
};
