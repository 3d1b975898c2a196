#include "CSVUtils.h"

#include <algorithm>
#include <cstdint>
#include <unordered_set>

namespace CSVUtils {
void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != kBom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3 || matched == 0) return;

    // Partial match: hand the consumed bytes back.
    is.clear(is.rdstate() & ~std::ios::eofbit);
    while (matched-- > 0) is.unget();
}

ParsedRecord parseCSVRecord(std::istream& is, char delimiter, const ParseLimits& limits) {
    ParsedRecord record;
    if (is.peek() == EOF) return record;

    std::string val;
    bool inQuotes = false;
    bool currentFieldQuoted = false;
    bool hasRecordData = false;
    bool hadDelimiter = false;
    bool recordHadAnyNewline = false;
    size_t recordBytes = 0;
    size_t physicalLineCount = 1;
    char c;

    auto exceedsRecordBytes = [&](size_t delta) {
        if (limits.maxRecordBytes == 0) return false;
        if (recordBytes > limits.maxRecordBytes - delta) {
            record.limitExceeded = true;
            return true;
        }
        recordBytes += delta;
        return false;
    };

    auto exceedsFieldBytes = [&](size_t fieldSize) {
        if (limits.maxFieldBytes == 0) return false;
        if (fieldSize > limits.maxFieldBytes) {
            record.limitExceeded = true;
            return true;
        }
        return false;
    };

    auto pushField = [&]() {
        record.fields.push_back(val);
        record.quoted.push_back(static_cast<uint8_t>(currentFieldQuoted ? 1 : 0));
        if (limits.maxColumns > 0 && record.fields.size() > limits.maxColumns) {
            record.limitExceeded = true;
        }
    };

    auto newlineInsideQuotes = [&]() {
        ++physicalLineCount;
        if (limits.maxPhysicalLinesPerRecord > 0 && physicalLineCount > limits.maxPhysicalLinesPerRecord) {
            record.limitExceeded = true;
            return false;
        }
        val += '\n';
        return !exceedsFieldBytes(val.size());
    };

    while (is.get(c)) {
        if (exceedsRecordBytes(1)) break;

        if (c == '"') {
            if (!inQuotes && val.empty() && !currentFieldQuoted) {
                inQuotes = true;
                currentFieldQuoted = true;
                hasRecordData = true;
            } else if (inQuotes) {
                if (is.peek() == '"') {
                    is.get();
                    if (exceedsRecordBytes(1)) break;
                    val += '"';
                    if (exceedsFieldBytes(val.size())) break;
                } else {
                    int next = is.peek();
                    if (next == EOF || next == delimiter || next == '\n' || next == '\r') {
                        inQuotes = false;
                    } else {
                        val += c;
                        if (exceedsFieldBytes(val.size())) break;
                    }
                }
            } else {
                val += c;
                if (exceedsFieldBytes(val.size())) break;
                hasRecordData = true;
            }
        } else if (c == delimiter && !inQuotes) {
            pushField();
            if (record.limitExceeded) break;
            val.clear();
            currentFieldQuoted = false;
            hadDelimiter = true;
            hasRecordData = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            ++record.consumedLines;
            recordHadAnyNewline = true;
            if (!inQuotes) break;
            if (!newlineInsideQuotes()) break;
        } else {
            val += c;
            if (exceedsFieldBytes(val.size())) break;
            hasRecordData = true;
        }

        if (record.limitExceeded) break;
    }

    if (inQuotes) record.malformed = true;

    if (hasRecordData || hadDelimiter || !val.empty()) {
        pushField();
    }

    if (record.fields.size() == 1 && record.fields[0].empty() && !record.quoted[0] && !hadDelimiter && recordHadAnyNewline) {
        record.fields.clear();
        record.quoted.clear();
    }

    return record;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < header.size(); ++i) {
        const size_t b = header[i].find_first_not_of(" \t");
        std::string name = (b == std::string::npos)
            ? "column_" + std::to_string(i + 1)
            : header[i].substr(b, header[i].find_last_not_of(" \t") - b + 1);

        if (seen.count(name) > 0) {
            size_t suffix = 2;
            while (seen.count(name + "_" + std::to_string(suffix)) > 0) ++suffix;
            name += "_" + std::to_string(suffix);
        }
        seen.insert(name);
        out.push_back(std::move(name));
    }
    return out;
}
} // namespace CSVUtils
