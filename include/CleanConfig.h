#pragma once
#include "TypedDataset.h"
#include <string>
#include <unordered_map>
#include <vector>

struct CleanConfig {
    std::string datasetPath;
    std::string operation;                  // trim|drop_invalid|outliers_iqr
    std::vector<std::string> columns;
    double iqrFactor = 1.5;

    char delimiter = ',';
    std::vector<std::string> missingTokens = {"na", "n/a", "null", "none", "nan", "missing"};
    std::unordered_map<std::string, ColumnKind> columnKindOverrides;
    bool skipMalformed = false;

    std::string outputPath;                 // empty => no export
    std::string exportFormat = "auto";      // auto|csv|parquet
    bool includeRowIds = false;
    size_t previewRows = 10;
    bool verbose = false;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] is the dataset path (or a flag when --config supplies it).
     * @post Returns a validated config object.
     * @throws Scrub::ConfigurationException on invalid arguments or values.
     */
    static CleanConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws Scrub::ConfigurationException on parse/validation failures.
     */
    static CleanConfig fromFile(const std::string& configPath, const CleanConfig& base);

    /**
     * @throws Scrub::ConfigurationException on invalid values.
     */
    void validate() const;

    // csv or parquet, resolving "auto" from the output extension.
    std::string resolvedExportFormat() const;

    static std::string usage();
};
