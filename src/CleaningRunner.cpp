#include "CleaningRunner.h"
#include "DatasetExporter.h"
#include "DatasetLoader.h"
#include "ScrubExceptions.h"
#include "TerminalUI.h"

namespace {
std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}
}

CleaningRunner::CleaningRunner(CleanConfig config) : config_(std::move(config)) {}

TypedDataset CleaningRunner::apply(const TypedDataset& data, CleaningReport& report) const {
    config_.validate();
    report.operation = config_.operation;
    report.rowsBefore = data.rowCount();

    TypedDataset out;
    if (config_.operation == "trim") {
        out = Cleaner::trim(data, config_.columns);
    } else if (config_.operation == "drop_invalid") {
        out = Cleaner::dropInvalidRows(data, config_.columns);
    } else if (config_.operation == "outliers_iqr") {
        const std::string& column = config_.columns.front();
        report.bounds = Cleaner::computeIqrBounds(data, column, config_.iqrFactor);
        out = Cleaner::removeOutliersIQR(data, column, config_.iqrFactor);
    } else {
        throw Scrub::ConfigurationException("Unsupported operation: " + config_.operation);
    }

    report.rowsAfter = out.rowCount();
    return out;
}

CleaningReport CleaningRunner::run(std::ostream& log) const {
    config_.validate();

    LoadOptions loadOptions;
    loadOptions.delimiter = config_.delimiter;
    loadOptions.missingTokens = config_.missingTokens;
    loadOptions.kindOverrides = config_.columnKindOverrides;
    loadOptions.skipMalformed = config_.skipMalformed;

    DatasetLoader loader(loadOptions);
    const TypedDataset data = loader.loadFile(config_.datasetPath);
    log << "[Scrub][Load] " << config_.datasetPath << ": " << data.rowCount() << " row(s), "
        << data.colCount() << " column(s)\n";
    if (loader.lastStats().recordsSkipped > 0) {
        log << "[Scrub][Load] Skipped " << loader.lastStats().recordsSkipped << " malformed record(s)\n";
    }
    if (config_.verbose) TerminalUI::printSummary(data, log);

    CleaningReport report;
    const TypedDataset cleaned = apply(data, report);

    if (config_.operation == "trim") {
        log << "[Scrub][Trim] Stripped surrounding whitespace in: " << joinNames(config_.columns) << "\n";
    } else if (config_.operation == "drop_invalid") {
        log << "[Scrub][DropInvalid] Removed " << report.rowsRemoved() << " of " << report.rowsBefore
            << " row(s) with missing values in: " << joinNames(config_.columns) << "\n";
    } else {
        log << "[Scrub][Outliers] Removed " << report.rowsRemoved() << " of " << report.rowsBefore
            << " row(s) outside the IQR fence (factor " << config_.iqrFactor << ")\n";
        if (report.bounds) TerminalUI::printIqrBounds(config_.columns.front(), *report.bounds, log);
    }

    if (config_.previewRows > 0) {
        TerminalUI::printPreview(cleaned, config_.previewRows, log);
    }

    if (!config_.outputPath.empty()) {
        const std::string format = config_.resolvedExportFormat();
        if (format == "parquet") {
            DatasetExporter::writeParquet(cleaned, config_.outputPath);
        } else {
            ExportOptions exportOptions;
            exportOptions.delimiter = config_.delimiter;
            exportOptions.includeRowIds = config_.includeRowIds;
            exportOptions.missingTokens = config_.missingTokens;
            DatasetExporter::writeCsv(cleaned, config_.outputPath, exportOptions);
        }
        report.exportedPath = config_.outputPath;
        log << "[Scrub][Export] Wrote " << cleaned.rowCount() << " row(s) to " << config_.outputPath
            << " (" << format << ")\n";
    }

    log << "[Scrub] Done.\n";
    return report;
}
