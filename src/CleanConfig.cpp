#include "CleanConfig.h"
#include "CommonUtils.h"
#include "ScrubExceptions.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Scrub::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Scrub::ScrubException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Scrub::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    if (lowered.rfind("kind.", 0) == 0) {
        // Column names keep their case.
        return "kind." + key.substr(5);
    }

    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

size_t parseSizeStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::trim(value);
    if (!v.empty() && v.front() == '-') {
        throw Scrub::ConfigurationException("Value for " + key + " must be >= 0");
    }
    unsigned long long parsed = parseNumericStrict<unsigned long long>(
        v,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<size_t>::max())) {
        throw Scrub::ConfigurationException("Value for " + key + " exceeds size range");
    }
    return static_cast<size_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        CommonUtils::trim(value),
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw Scrub::ConfigurationException("Value for " + key + " must be finite");
    }
    if (parsed < minValue) {
        throw Scrub::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Scrub::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value, const std::string& key) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw Scrub::ConfigurationException(key + " expects a single character");
    if (value[0] == '"' || value[0] == '\n' || value[0] == '\r') {
        throw Scrub::ConfigurationException(key + " cannot be a quote or newline");
    }
    // Exported numbers are written unquoted and use digits, letters, sign and point.
    const unsigned char ch = static_cast<unsigned char>(value[0]);
    if (std::isalnum(ch) || ch == '-' || ch == '+' || ch == '.') {
        throw Scrub::ConfigurationException(key + " cannot be a letter, digit, sign or decimal point: " + value);
    }
    return value[0];
}

ColumnKind parseColumnKind(const std::string& value, const std::string& column) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "text") return ColumnKind::TEXT;
    if (v == "numeric") return ColumnKind::NUMERIC;
    if (v == "other") return ColumnKind::OTHER;
    throw Scrub::ConfigurationException("invalid column kind override for '" + column + "': '" + value +
                                        "' (allowed: text, numeric, other)");
}

// --kind col=kind
void applyKindAssignment(CleanConfig& config, const std::string& assignment) {
    const size_t eq = assignment.rfind('=');
    if (eq == std::string::npos) {
        throw Scrub::ConfigurationException("--kind expects <column>=<text|numeric|other>");
    }
    const std::string column = CommonUtils::trim(assignment.substr(0, eq));
    if (column.empty()) throw Scrub::ConfigurationException("--kind requires a non-empty column name");
    config.columnKindOverrides[column] = parseColumnKind(assignment.substr(eq + 1), column);
}

void assignKeyValue(CleanConfig& config, const std::string& key, const std::string& value) {
    if (key.rfind("kind.", 0) == 0) {
        const std::string column = CommonUtils::trim(key.substr(5));
        if (column.empty()) throw Scrub::ConfigurationException("kind.<column> requires a non-empty column name");
        config.columnKindOverrides[column] = parseColumnKind(value, column);
        return;
    }
    if (key == "dataset" || key == "dataset_path") {
        config.datasetPath = value;
    } else if (key == "operation" || key == "op") {
        config.operation = CommonUtils::toLower(value);
    } else if (key == "columns") {
        config.columns = CommonUtils::splitList(value);
    } else if (key == "factor" || key == "iqr_factor") {
        config.iqrFactor = parseDoubleStrict(value, key, 0.0);
    } else if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, key);
    } else if (key == "missing_tokens") {
        config.missingTokens = CommonUtils::splitList(value);
    } else if (key == "skip_malformed") {
        config.skipMalformed = parseBoolStrict(value, key);
    } else if (key == "output" || key == "output_path") {
        config.outputPath = value;
    } else if (key == "export_format") {
        config.exportFormat = CommonUtils::toLower(value);
    } else if (key == "row_ids" || key == "include_row_ids") {
        config.includeRowIds = parseBoolStrict(value, key);
    } else if (key == "preview" || key == "preview_rows") {
        config.previewRows = parseSizeStrict(value, key);
    } else if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
    } else {
        throw Scrub::ConfigurationException("Unknown config key: " + key);
    }
}
}

std::string CleanConfig::usage() {
    return "Usage: scrub <dataset.csv> --op trim|drop_invalid|outliers_iqr --columns a,b\n"
           "Options:\n"
           "  --op <operation>               trim | drop_invalid | outliers_iqr\n"
           "  --columns <a,b,...>            Columns the operation applies to (outliers_iqr takes one)\n"
           "  --factor <val>                 IQR multiplier for outliers_iqr (default: 1.5)\n"
           "  --delimiter <char>             CSV delimiter character (default: ,)\n"
           "  --missing-tokens <a,b,...>     Unquoted tokens loaded as missing (default: na,n/a,null,none,nan,missing)\n"
           "  --kind <col>=<kind>            Force a column kind: text | numeric | other (repeatable)\n"
           "  --skip-malformed <true|false>  Skip ragged rows instead of failing (default: false)\n"
           "  --output, -o <file>            Write the cleaned dataset (csv or parquet)\n"
           "  --export-format <fmt>          auto | csv | parquet (default: auto, from extension)\n"
           "  --row-ids <true|false>         Write a leading row_id column (default: false)\n"
           "  --preview <rows>               Rows shown in the terminal preview (default: 10)\n"
           "  --verbose <true|false>         Detailed logs (default: false)\n"
           "  --config <file>                key: value config file; its entries override flags\n"
           "  --help                         Show this help message\n";
}

CleanConfig CleanConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Scrub::ConfigurationException(usage());
    }

    CleanConfig config;
    int first = 1;
    const std::string firstArg = argv[1];
    if (firstArg.rfind("-", 0) != 0) {
        config.datasetPath = firstArg;
        first = 2;
    }

    std::string configPath;
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw Scrub::ConfigurationException(arg + " expects a value");
            return argv[++i];
        };

        if (arg == "--config") {
            configPath = next();
        } else if (arg == "--op" || arg == "--operation") {
            config.operation = CommonUtils::toLower(next());
        } else if (arg == "--columns") {
            config.columns = CommonUtils::splitList(next());
        } else if (arg == "--factor") {
            config.iqrFactor = parseDoubleStrict(next(), arg, 0.0);
        } else if (arg == "--delimiter") {
            config.delimiter = parseDelimiter(next(), arg);
        } else if (arg == "--missing-tokens") {
            config.missingTokens = CommonUtils::splitList(next());
        } else if (arg == "--kind") {
            applyKindAssignment(config, next());
        } else if (arg == "--skip-malformed") {
            config.skipMalformed = parseBoolStrict(next(), arg);
        } else if (arg == "--output" || arg == "-o") {
            config.outputPath = next();
        } else if (arg == "--export-format") {
            config.exportFormat = CommonUtils::toLower(next());
        } else if (arg == "--row-ids") {
            config.includeRowIds = parseBoolStrict(next(), arg);
        } else if (arg == "--preview") {
            config.previewRows = parseSizeStrict(next(), arg);
        } else if (arg == "--verbose") {
            config.verbose = parseBoolStrict(next(), arg);
        } else {
            throw Scrub::ConfigurationException("Unknown argument: " + arg);
        }
    }

    if (!configPath.empty()) {
        const std::string cliDataset = config.datasetPath;
        config = fromFile(configPath, config);
        if (config.datasetPath.empty()) config.datasetPath = cliDataset;
    }

    config.validate();
    return config;
}

CleanConfig CleanConfig::fromFile(const std::string& configPath, const CleanConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Scrub::ConfigurationException("Could not open config file: " + configPath);

    CleanConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Scrub::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": expected 'key: value'");
        }

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Scrub::ScrubException& ex) {
            throw Scrub::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

std::string CleanConfig::resolvedExportFormat() const {
    if (exportFormat != "auto") return exportFormat;
    const std::string lower = CommonUtils::toLower(outputPath);
    const std::string ext = ".parquet";
    if (lower.size() >= ext.size() && lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0) {
        return "parquet";
    }
    return "csv";
}

void CleanConfig::validate() const {
    if (datasetPath.empty()) {
        throw Scrub::ConfigurationException("dataset path is required");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(operation, {"trim", "drop_invalid", "outliers_iqr"})) {
        throw Scrub::ConfigurationException("operation must be one of: trim, drop_invalid, outliers_iqr");
    }
    if (columns.empty()) {
        throw Scrub::ConfigurationException("columns must name at least one column");
    }
    if (operation == "outliers_iqr" && columns.size() != 1) {
        throw Scrub::ConfigurationException("outliers_iqr takes exactly one column");
    }
    if (!std::isfinite(iqrFactor) || iqrFactor < 0.0) {
        throw Scrub::ConfigurationException("factor must be finite and >= 0");
    }
    if (!isIn(exportFormat, {"auto", "csv", "parquet"})) {
        throw Scrub::ConfigurationException("export_format must be one of: auto, csv, parquet");
    }
    if (exportFormat == "parquet" && outputPath.empty()) {
        throw Scrub::ConfigurationException("parquet export requires an output path");
    }
}
