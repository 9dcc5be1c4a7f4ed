#pragma once
#include "DataCleaner.h"
#include "DataPipeline.h"
#include "DataTransformer.h"
#include "SchemaValidator.h"
#include <string>
#include <vector>

/**
 * @brief Markdown document builder plus JSON renderers for the stage reports.
 * @details JSON keys are emitted in a fixed order so two runs over the same input
 * produce byte-identical documents. Non-finite numbers are written as null.
 */
class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addSection(const std::string& title);
    void addParagraph(const std::string& text);
    void addBulletList(const std::vector<std::string>& items);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);

    const std::string& markdown() const noexcept { return body_; }

    /**
     * @throws Curator::IOException when the file cannot be written.
     */
    void save(const std::string& filePath) const;

    static std::string toJson(const ValidationResult& result);
    static std::string toJson(const CleaningReport& report);
    static std::string toJson(const TransformResult& result);
    // Keys validation/cleaning/transformation hold null for skipped stages.
    static std::string toJson(const PipelineOutcome& outcome);

    static std::string escapeJsonString(const std::string& input);

    /**
     * @brief Builds the Markdown quality report for a pipeline run.
     */
    static ReportEngine qualityReport(const std::string& datasetName, const PipelineOutcome& outcome);

private:
    std::string body_;
};
