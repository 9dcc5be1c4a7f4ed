#include "AutomationPipeline.h"
#include "CommonUtils.h"
#include "CuratorExceptions.h"
#include "ReportEngine.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace {
TypedDataset::DateLocaleHint parseLocaleHint(const std::string& hint) {
    if (hint == "dmy") return TypedDataset::DateLocaleHint::DMY;
    if (hint == "mdy") return TypedDataset::DateLocaleHint::MDY;
    return TypedDataset::DateLocaleHint::AUTO;
}

void writeTextFile(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    if (!out) {
        throw Curator::IOException("Failed to open output file: " + path);
    }
    out << content;
    if (!out.good()) {
        throw Curator::IOException("Failed while writing output file: " + path);
    }
}

void printSummary(const PipelineOutcome& outcome) {
    if (outcome.validation) {
        const ValidationResult& v = *outcome.validation;
        std::cout << "[Curator] Validation: " << (v.isValid ? "valid" : "invalid")
                  << " (" << v.validRows << "/" << v.totalRows << " rows valid, "
                  << v.errors.size() << " errors, " << v.warnings.size() << " warnings)\n";
    }
    if (outcome.cleaning) {
        const CleaningReport& c = *outcome.cleaning;
        std::cout << "[Curator] Cleaning: " << c.originalRows << " -> " << c.cleanedRows
                  << " rows, retention " << CommonUtils::formatNumber(c.retentionRate * 100.0) << "%"
                  << (c.meetsRetentionRequirement ? "" : " (below minimum)") << "\n";
    }
    if (outcome.transform) {
        const TransformResult& t = *outcome.transform;
        std::cout << "[Curator] Transform: " << t.transformationsApplied.size() << " transformations, "
                  << t.newColumns.size() << " new columns, " << t.removedColumns.size() << " removed\n";
    }
}
} // namespace

PipelineOptions AutomationPipeline::buildOptions(const PipelineConfig& config) {
    PipelineOptions options;
    options.runValidation = config.runValidation;
    options.runCleaning = config.runCleaning;
    options.runTransform = config.runTransform;
    options.cleaning = config.cleaning;
    options.transform = config.transform;
    options.verbose = config.verbose;
    if (!config.targetColumn.empty()) options.targetColumn = config.targetColumn;

    if (auto preset = CommonValidators::byName(config.preset)) {
        options.validator = std::move(*preset);
    }
    if (!config.cleaning.requiredColumns.empty()) {
        options.validator.addRequiredColumns(config.cleaning.requiredColumns);
    }
    return options;
}

int AutomationPipeline::run(const PipelineConfig& config) {
    TypedDataset data(config.datasetPath, config.delimiter);
    data.setDateLocaleHint(parseLocaleHint(config.datetimeLocaleHint));
    data.load();
    if (data.colCount() == 0) {
        throw Curator::DatasetException("Dataset has no usable columns");
    }

    if (config.verbose) {
        std::cout << "[Curator][Load] " << config.datasetPath << ": " << data.rowCount()
                  << " rows, " << data.colCount() << " columns\n";
    }
    if (!config.targetColumn.empty() && !data.hasColumn(config.targetColumn)) {
        throw Curator::ConfigurationException("Target column not found: " + config.targetColumn);
    }

    const PipelineOutcome outcome = DataPipeline::run(data, buildOptions(config));
    printSummary(outcome);

    if (!config.outputPath.empty()) {
        writeTextFile(config.outputPath, ReportEngine::toJson(outcome));
        std::cout << "[Curator] Results exported to: " << config.outputPath << "\n";
    }
    if (!config.reportPath.empty()) {
        const std::string datasetName = std::filesystem::path(config.datasetPath).filename().string();
        ReportEngine::qualityReport(datasetName, outcome).save(config.reportPath);
        std::cout << "[Curator] Report written to: " << config.reportPath << "\n";
    }
    return 0;
}
