#pragma once
#include "DataCleaner.h"
#include "DataTransformer.h"
#include <string>

struct PipelineConfig {
    std::string datasetPath;
    char delimiter = ',';
    std::string datetimeLocaleHint = "auto"; // auto|dmy|mdy

    std::string preset = "none";             // none|sales|purchases|products
    std::string targetColumn;

    bool runValidation = true;
    bool runCleaning = true;
    bool runTransform = true;

    std::string outputPath;                  // JSON results; empty = stdout summary only
    std::string reportPath;                  // Markdown quality report
    bool verbose = false;

    CleaningConfig cleaning;
    TransformConfig transform;

    static std::string usage();

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] is the dataset path.
     * @post Returns a validated config object.
     * @throws Curator::ConfigurationException on invalid arguments or values.
     */
    static PipelineConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws Curator::ConfigurationException carrying the line number on parse/validation failures.
     */
    static PipelineConfig fromFile(const std::string& configPath, const PipelineConfig& base);

    /**
     * @throws Curator::ConfigurationException on invalid values.
     */
    void validate() const;
};
