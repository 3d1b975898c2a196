#pragma once
#include "CSVUtils.h"
#include "TypedDataset.h"
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

struct LoadOptions {
    char delimiter = ',';
    // Unquoted fields matching one of these (case-insensitive, trimmed) load as missing.
    std::vector<std::string> missingTokens = {"na", "n/a", "null", "none", "nan", "missing"};
    std::unordered_map<std::string, ColumnKind> kindOverrides;
    // Skip ragged or unterminated records instead of failing.
    bool skipMalformed = false;
    CSVUtils::ParseLimits limits;
};

struct LoadStats {
    size_t recordsRead = 0;
    size_t recordsSkipped = 0;
};

class DatasetLoader {
public:
    explicit DatasetLoader(LoadOptions options = LoadOptions{});

    /**
     * @brief Loads a CSV file and tags each column with an inferred kind.
     * @throws Scrub::IOException when the file cannot be opened.
     * @throws Scrub::DatasetException on malformed content or impossible kind override.
     */
    TypedDataset loadFile(const std::string& path);
    TypedDataset loadStream(std::istream& in);

    const LoadStats& lastStats() const noexcept { return stats_; }

    static bool parseNumber(const std::string& raw, double& out);
    static bool looksBoolean(const std::string& raw);
    static bool looksIsoDate(const std::string& raw);

private:
    LoadOptions options_;
    LoadStats stats_;

    bool isMissingToken(const std::string& raw, bool quoted) const;
};
