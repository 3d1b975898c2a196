#include "DatasetLoader.h"
#include "CommonUtils.h"
#include "ScrubExceptions.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>

namespace {
bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

ColumnKind inferKind(const TextCells& raw) {
    size_t observed = 0;
    bool allNumeric = true;
    bool allOther = true;
    for (const auto& cell : raw) {
        if (!cell) continue;
        ++observed;
        double ignored = 0.0;
        if (allNumeric && !DatasetLoader::parseNumber(*cell, ignored)) allNumeric = false;
        if (allOther && !DatasetLoader::looksBoolean(*cell) && !DatasetLoader::looksIsoDate(*cell)) allOther = false;
        if (!allNumeric && !allOther) return ColumnKind::TEXT;
    }
    // A column holding nothing but gaps is numeric, as in the dataframe convention.
    if (observed == 0 || allNumeric) return ColumnKind::NUMERIC;
    return ColumnKind::OTHER;
}

NumericCells toNumeric(const std::string& columnName, const TextCells& raw) {
    NumericCells out;
    out.reserve(raw.size());
    for (size_t r = 0; r < raw.size(); ++r) {
        if (!raw[r]) {
            out.emplace_back(std::nullopt);
            continue;
        }
        double v = 0.0;
        if (!DatasetLoader::parseNumber(*raw[r], v)) {
            throw Scrub::DatasetException("Column '" + columnName + "' forced numeric but row " +
                                          std::to_string(r) + " holds '" + *raw[r] + "'");
        }
        out.emplace_back(v);
    }
    return out;
}
}

DatasetLoader::DatasetLoader(LoadOptions options) : options_(std::move(options)) {
    for (auto& token : options_.missingTokens) token = CommonUtils::toLower(CommonUtils::trim(token));
}

bool DatasetLoader::parseNumber(const std::string& raw, double& out) {
    std::string cleaned = CommonUtils::trim(raw);
    if (!cleaned.empty() && cleaned.front() == '+') {
        cleaned.erase(cleaned.begin());
    }
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

bool DatasetLoader::looksBoolean(const std::string& raw) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(raw));
    return s == "true" || s == "false";
}

bool DatasetLoader::looksIsoDate(const std::string& raw) {
    const std::string s = CommonUtils::trim(raw);
    if (s.size() != 10 && s.size() != 19) return false;

    int year = 0;
    int month = 0;
    int day = 0;
    if (s[4] != '-' || s[7] != '-' ||
        !parseFixedInt(s, 0, 4, year) || !parseFixedInt(s, 5, 2, month) || !parseFixedInt(s, 8, 2, day)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) return false;
    if (s.size() == 10) return true;

    int hour = 0;
    int minute = 0;
    int second = 0;
    if ((s[10] != ' ' && s[10] != 'T') || s[13] != ':' || s[16] != ':' ||
        !parseFixedInt(s, 11, 2, hour) || !parseFixedInt(s, 14, 2, minute) || !parseFixedInt(s, 17, 2, second)) {
        return false;
    }
    return hour <= 23 && minute <= 59 && second <= 60;
}

bool DatasetLoader::isMissingToken(const std::string& raw, bool quoted) const {
    if (quoted) return false;
    if (raw.empty()) return true;
    const std::string s = CommonUtils::toLower(CommonUtils::trim(raw));
    return std::find(options_.missingTokens.begin(), options_.missingTokens.end(), s) != options_.missingTokens.end();
}

TypedDataset DatasetLoader::loadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Scrub::IOException("Could not open file: " + path);
    return loadStream(in);
}

TypedDataset DatasetLoader::loadStream(std::istream& in) {
    stats_ = LoadStats{};
    CSVUtils::skipBOM(in);

    CSVUtils::ParsedRecord headerRecord = CSVUtils::parseCSVRecord(in, options_.delimiter, options_.limits);
    if (headerRecord.malformed || headerRecord.limitExceeded || headerRecord.empty()) {
        throw Scrub::DatasetException("Malformed or empty CSV header");
    }
    const std::vector<std::string> header = CSVUtils::normalizeHeader(headerRecord.fields);
    for (const auto& entry : options_.kindOverrides) {
        if (std::find(header.begin(), header.end(), entry.first) == header.end()) {
            throw Scrub::DatasetException("Kind override names unknown column '" + entry.first + "'");
        }
    }
    size_t nextLine = 1 + std::max<size_t>(1, headerRecord.consumedLines);

    std::vector<TextCells> raw(header.size());
    while (in.peek() != EOF) {
        const size_t recordLine = nextLine;
        CSVUtils::ParsedRecord record = CSVUtils::parseCSVRecord(in, options_.delimiter, options_.limits);
        nextLine += std::max<size_t>(1, record.consumedLines);
        if (record.empty() && !record.malformed && !record.limitExceeded) continue;

        std::string problem;
        if (record.limitExceeded) {
            problem = "parse limit exceeded";
        } else if (record.malformed) {
            problem = "unterminated quoted field";
        } else if (record.fields.size() > header.size()) {
            problem = "expected " + std::to_string(header.size()) + " fields, found " + std::to_string(record.fields.size());
        }
        if (!problem.empty()) {
            if (!options_.skipMalformed) {
                throw Scrub::DatasetException("Line " + std::to_string(recordLine) + ": " + problem);
            }
            ++stats_.recordsSkipped;
            if (record.limitExceeded) break;
            continue;
        }

        for (size_t c = 0; c < header.size(); ++c) {
            if (c >= record.fields.size()) {
                raw[c].emplace_back(std::nullopt);
                continue;
            }
            if (isMissingToken(record.fields[c], record.quoted[c] != 0)) {
                raw[c].emplace_back(std::nullopt);
            } else {
                raw[c].emplace_back(std::move(record.fields[c]));
            }
        }
        ++stats_.recordsRead;
    }

    TypedDataset data;
    for (size_t c = 0; c < header.size(); ++c) {
        ColumnKind kind = inferKind(raw[c]);
        const auto it = options_.kindOverrides.find(header[c]);
        if (it != options_.kindOverrides.end()) kind = it->second;

        if (kind == ColumnKind::NUMERIC) {
            data.addNumericColumn(header[c], toNumeric(header[c], raw[c]));
        } else {
            data.addTextColumn(header[c], std::move(raw[c]), kind);
        }
    }
    return data;
}
