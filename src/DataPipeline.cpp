#include "DataPipeline.h"
#include <iostream>

namespace {
void logStage(const PipelineOptions& options, const std::string& msg) {
    if (options.verbose) std::cout << "[Curator][Pipeline] " << msg << "\n";
}
} // namespace

PipelineOutcome DataPipeline::run(const TypedDataset& data, const PipelineOptions& options) {
    PipelineOutcome outcome{data, std::nullopt, std::nullopt, std::nullopt};

    if (options.runValidation) {
        logStage(options, "Validating " + std::to_string(options.validator.rules().size()) + " rules");
        outcome.validation = options.validator.validate(data);
        logStage(options, std::to_string(outcome.validation->validRows) + "/" +
                              std::to_string(outcome.validation->totalRows) + " rows valid, " +
                              std::to_string(outcome.validation->errors.size()) + " errors, " +
                              std::to_string(outcome.validation->warnings.size()) + " warnings");
    }

    if (options.runCleaning) {
        logStage(options, "Cleaning " + std::to_string(outcome.data.rowCount()) + " rows");
        outcome.cleaning = DataCleaner::run(outcome.data, options.cleaning);
    }

    if (options.runTransform) {
        logStage(options, "Transforming " + std::to_string(outcome.data.colCount()) + " columns");
        TransformOutcome transformed = DataTransformer::fitTransform(outcome.data, options.transform, options.targetColumn);
        outcome.data = std::move(transformed.data);
        outcome.transform = std::move(transformed.result);
    }

    return outcome;
}
