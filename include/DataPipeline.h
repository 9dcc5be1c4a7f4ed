#pragma once
#include "DataCleaner.h"
#include "DataTransformer.h"
#include "SchemaValidator.h"
#include "TypedDataset.h"
#include <optional>
#include <string>

struct PipelineOptions {
    bool runValidation = true;
    bool runCleaning = true;
    bool runTransform = true;

    SchemaValidator validator;
    CleaningConfig cleaning;
    TransformConfig transform;
    std::optional<std::string> targetColumn;
    bool verbose = false;
};

struct PipelineOutcome {
    TypedDataset data;
    // Each stage fills its slot only when it ran.
    std::optional<ValidationResult> validation;
    std::optional<CleaningReport> cleaning;
    std::optional<TransformResult> transform;
};

/**
 * @brief Runs validation, cleaning and transformation in that order.
 * @details Validation reads the input table; cleaning and transformation work on the
 * outcome's own copy. A failed validation does not stop the later stages.
 */
class DataPipeline {
public:
    static PipelineOutcome run(const TypedDataset& data, const PipelineOptions& options);
};
