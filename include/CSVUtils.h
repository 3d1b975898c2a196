#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and header normalization utilities.
// This module does not infer column kinds and keeps field whitespace intact.
struct ParseLimits {
	size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
	size_t maxRecordBytes = 64 * 1024 * 1024;         // 64 MiB
	size_t maxColumns = 20000;
	size_t maxPhysicalLinesPerRecord = 10000;
};

struct ParsedRecord {
	std::vector<std::string> fields;
	std::vector<uint8_t> quoted;    // 1 where the field was enclosed in quotes
	bool malformed = false;         // unterminated quote
	bool limitExceeded = false;
	size_t consumedLines = 0;

	bool empty() const noexcept { return fields.empty(); }
};

void skipBOM(std::istream& is);
ParsedRecord parseCSVRecord(std::istream& is, char delimiter, const ParseLimits& limits = ParseLimits{});
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
