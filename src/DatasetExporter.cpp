#include "DatasetExporter.h"
#include "CommonUtils.h"
#include "ScrubExceptions.h"
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <fstream>

#ifdef SCRUB_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
const char* const kRowIdColumn = "row_id";

void requireFreeRowIdName(const TypedDataset& data) {
    if (data.hasColumn(kRowIdColumn)) {
        throw Scrub::DatasetException(std::string("Column '") + kRowIdColumn +
                                      "' clashes with the exported row identifier column");
    }
}

bool needsQuoting(const std::string& value, const ExportOptions& options) {
    if (value.empty()) return true;
    if (CommonUtils::isAsciiSpace(value.front()) || CommonUtils::isAsciiSpace(value.back())) return true;
    if (value.front() == '"') return true;
    for (char ch : value) {
        if (ch == options.delimiter || ch == '"' || ch == '\n' || ch == '\r') return true;
    }
    const std::string lower = CommonUtils::toLower(CommonUtils::trim(value));
    return std::any_of(options.missingTokens.begin(), options.missingTokens.end(), [&](const std::string& token) {
        return CommonUtils::toLower(CommonUtils::trim(token)) == lower;
    });
}

void writeField(std::ostream& out, const std::string& value, const ExportOptions& options) {
    if (!needsQuoting(value, options)) {
        out << value;
        return;
    }
    out << '"';
    for (char ch : value) {
        if (ch == '"') out << '"';
        out << ch;
    }
    out << '"';
}

#ifdef SCRUB_USE_NATIVE_PARQUET
bool exportParquetNative(const TypedDataset& data,
                         const std::string& parquetPath,
                         std::string& errorOut) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(data.columns().size() + 1);
    arrays.reserve(data.columns().size() + 1);

    {
        arrow::UInt64Builder builder;
        for (RowId id : data.rowIds()) {
            if (!builder.Append(static_cast<uint64_t>(id)).ok()) {
                errorOut = "Failed to append row identifier";
                return false;
            }
        }
        std::shared_ptr<arrow::Array> arr;
        auto status = builder.Finish(&arr);
        if (!status.ok()) {
            errorOut = "Failed to finalize row_id Arrow array: " + status.ToString();
            return false;
        }
        fields.push_back(arrow::field(kRowIdColumn, arrow::uint64(), false));
        arrays.push_back(arr);
    }

    for (const auto& col : data.columns()) {
        std::shared_ptr<arrow::Array> arr;
        if (col.kind == ColumnKind::NUMERIC) {
            arrow::DoubleBuilder builder;
            for (const auto& cell : col.numeric()) {
                const arrow::Status st = cell ? builder.Append(*cell) : builder.AppendNull();
                if (!st.ok()) {
                    errorOut = "Failed to append numeric value for column '" + col.name + "'";
                    return false;
                }
            }
            auto status = builder.Finish(&arr);
            if (!status.ok()) {
                errorOut = "Failed to finalize numeric Arrow array for column '" + col.name + "': " + status.ToString();
                return false;
            }
            fields.push_back(arrow::field(col.name, arrow::float64(), true));
        } else {
            arrow::StringBuilder builder;
            for (const auto& cell : col.text()) {
                const arrow::Status st = cell ? builder.Append(*cell) : builder.AppendNull();
                if (!st.ok()) {
                    errorOut = "Failed to append text value for column '" + col.name + "'";
                    return false;
                }
            }
            auto status = builder.Finish(&arr);
            if (!status.ok()) {
                errorOut = "Failed to finalize text Arrow array for column '" + col.name + "': " + status.ToString();
                return false;
            }
            fields.push_back(arrow::field(col.name, arrow::utf8(), true));
        }
        arrays.push_back(arr);
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(data.rowCount()));

    auto outRes = arrow::io::FileOutputStream::Open(parquetPath);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(data.rowCount())));
    auto writeStatus = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#endif
}

std::string DatasetExporter::formatNumber(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    std::array<char, 64> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) return std::to_string(value);
    return std::string(buf.data(), ptr);
}

void DatasetExporter::writeCsv(const TypedDataset& data, std::ostream& out, const ExportOptions& options) {
    bool first = true;
    auto separator = [&]() {
        if (!first) out << options.delimiter;
        first = false;
    };

    if (options.includeRowIds) {
        requireFreeRowIdName(data);
        separator();
        writeField(out, kRowIdColumn, options);
    }
    for (const auto& col : data.columns()) {
        separator();
        writeField(out, col.name, options);
    }
    out << '\n';

    for (size_t r = 0; r < data.rowCount(); ++r) {
        first = true;
        if (options.includeRowIds) {
            separator();
            out << data.rowIds()[r];
        }
        for (const auto& col : data.columns()) {
            separator();
            if (col.kind == ColumnKind::NUMERIC) {
                const NumericCell& cell = col.numeric()[r];
                if (!cell) continue;
                const std::string text = formatNumber(*cell);
                if (text.find(options.delimiter) != std::string::npos) {
                    out << '"' << text << '"';
                } else {
                    out << text;
                }
            } else {
                const TextCell& cell = col.text()[r];
                if (cell) writeField(out, *cell, options);
            }
        }
        out << '\n';
    }
}

void DatasetExporter::writeCsv(const TypedDataset& data, const std::string& path, const ExportOptions& options) {
    if (options.includeRowIds) requireFreeRowIdName(data);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw Scrub::IOException("Could not open output file: " + path);
    writeCsv(data, out, options);
    out.flush();
    if (!out) throw Scrub::IOException("Failed writing output file: " + path);
}

bool DatasetExporter::parquetAvailable() noexcept {
#ifdef SCRUB_USE_NATIVE_PARQUET
    return true;
#else
    return false;
#endif
}

void DatasetExporter::writeParquet(const TypedDataset& data, const std::string& path) {
#ifdef SCRUB_USE_NATIVE_PARQUET
    requireFreeRowIdName(data);
    std::string error;
    if (!exportParquetNative(data, path, error)) {
        throw Scrub::IOException(error);
    }
#else
    (void)data;
    throw Scrub::ConfigurationException("parquet export requires a build with Arrow/Parquet (SCRUB_ENABLE_PARQUET) for " + path);
#endif
}
