/**
 * @file  test_report_engine.cpp
 * @brief JSON rendering of stage reports and the Markdown quality report.
 */

#include <gtest/gtest.h>
#include "CuratorExceptions.h"
#include "ReportEngine.h"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

// ─── Helpers ─────────────────────────────────────────────────────────────────

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static TypedDataset small_table() {
    return TypedDataset::fromRows({"fecha", "total"}, {{"2024-01-01", "10"}, {"2024-01-02", "-3"}});
}

// ─── JSON ────────────────────────────────────────────────────────────────────

TEST(ReportEngine_Json, EscapesControlCharactersAndQuotes) {
    EXPECT_EQ(ReportEngine::escapeJsonString("a\"b\\c\nd\te"), "a\\\"b\\\\c\\nd\\te");
    EXPECT_EQ(ReportEngine::escapeJsonString("plain"), "plain");
}

TEST(ReportEngine_Json, ValidationResultCarriesViolationsAndSummary) {
    SchemaValidator v;
    v.addRequiredColumns({"cantidad"}).addRangeRule("total", 0.0, std::nullopt, Severity::WARNING);
    const std::string json = ReportEngine::toJson(v.validate(small_table()));

    EXPECT_EQ(json.front(), '{');
    EXPECT_TRUE(contains(json, "\"is_valid\": false"));
    EXPECT_TRUE(contains(json, "\"total_rows\": 2"));
    EXPECT_TRUE(contains(json, "\"invalid_rows\": 1"));
    EXPECT_TRUE(contains(json, "\"error_count\": 1"));
    EXPECT_TRUE(contains(json, "\"warning_count\": 1"));
    EXPECT_TRUE(contains(json, "\"rule\": \"required_cantidad\""));
    EXPECT_TRUE(contains(json, "\"type\": \"range\""));
    EXPECT_TRUE(contains(json, "\"severity\": \"warning\""));
    EXPECT_TRUE(contains(json, "\"sample_values\": [\"-3\"]"));
    EXPECT_TRUE(contains(json, "\"column_types\": {\"fecha\": \"datetime\", \"total\": \"integer\"}"));
    EXPECT_TRUE(contains(json, "\"validity_rate\": 50"));
}

TEST(ReportEngine_Json, CleaningReportRoundsRetentionPercent) {
    CleaningReport report;
    report.originalRows = 3;
    report.cleanedRows = 2;
    report.retentionRate = 2.0 / 3.0;
    report.meetsRetentionRequirement = false;
    report.columnsDroppedNulls = {"notes"};
    report.outlierDetails = {{"total", 1}};
    report.warnings = {"Retention rate (66.7%) below required minimum (70%)"};

    const std::string json = ReportEngine::toJson(report);
    EXPECT_TRUE(contains(json, "\"retention\": {\"rate\": 66.67, \"meets_requirement\": false}"));
    EXPECT_TRUE(contains(json, "\"columns_dropped\": [\"notes\"]"));
    EXPECT_TRUE(contains(json, "\"by_column\": {\"total\": 1}"));
    EXPECT_TRUE(contains(json, "\"errors\": []"));
}

TEST(ReportEngine_Json, TransformResultListsParamsPerMethod) {
    TransformResult result;
    ScalingParams minmax;
    minmax.method = ScalingMethod::MINMAX;
    minmax.min = 10;
    minmax.max = 50;
    ScalingParams standard;
    standard.method = ScalingMethod::STANDARD;
    standard.mean = 4;
    standard.stddev = std::numeric_limits<double>::quiet_NaN();
    result.scalingParams = {{"v", minmax}, {"w", standard}};

    EncodingMap label;
    label.codes = {{"b", 0.0}, {"a", 1.0}};
    EncodingMap onehot;
    onehot.method = EncodingMethod::ONEHOT;
    onehot.categories = {"blue", "red"};
    result.encodingMaps = {{"cat", label}, {"color", onehot}};

    const std::string json = ReportEngine::toJson(result);
    EXPECT_TRUE(contains(json, "\"v\": {\"method\": \"minmax\", \"min\": 10, \"max\": 50}"));
    EXPECT_TRUE(contains(json, "\"w\": {\"method\": \"standard\", \"mean\": 4, \"std\": null}"));
    EXPECT_TRUE(contains(json, "\"cat\": {\"b\": 0, \"a\": 1}"));
    EXPECT_TRUE(contains(json, "\"color\": {\"blue\": \"color_blue\", \"red\": \"color_red\"}"));
}

TEST(ReportEngine_Json, SkippedStagesRenderAsNull) {
    PipelineOptions options;
    options.runCleaning = false;
    options.runTransform = false;
    const auto outcome = DataPipeline::run(small_table(), options);

    const std::string json = ReportEngine::toJson(outcome);
    EXPECT_TRUE(contains(json, "\"rows\": 2"));
    EXPECT_TRUE(contains(json, "\"columns\": [\"fecha\", \"total\"]"));
    EXPECT_TRUE(contains(json, "\"validation\": {"));
    EXPECT_TRUE(contains(json, "\"cleaning\": null"));
    EXPECT_TRUE(contains(json, "\"transformation\": null"));
    EXPECT_EQ(json.back(), '\n');
}

TEST(ReportEngine_Json, OutputIsDeterministic) {
    PipelineOptions options;
    options.validator = CommonValidators::sales();
    options.transform.scalingMethod = ScalingMethod::STANDARD;
    const auto table = small_table();
    EXPECT_EQ(ReportEngine::toJson(DataPipeline::run(table, options)),
              ReportEngine::toJson(DataPipeline::run(table, options)));
}

// ─── Markdown ────────────────────────────────────────────────────────────────

TEST(ReportEngine_Markdown, TableEscapesPipesAndNewlines) {
    ReportEngine report;
    report.addTable("Samples", {"Key", "Value"}, {{"a|b", "line1\nline2"}, {"short"}});
    const std::string& md = report.markdown();
    EXPECT_TRUE(contains(md, "### Samples\n| Key | Value |\n| --- | --- |\n"));
    EXPECT_TRUE(contains(md, "| a\\|b | line1<br>line2 |"));
    EXPECT_TRUE(contains(md, "| short |  |"));
}

TEST(ReportEngine_Markdown, TallTablesGetPreviewAndDetails) {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 130; ++i) rows.push_back({std::to_string(i)});
    ReportEngine report;
    report.addTable("Big", {"n"}, rows);
    EXPECT_TRUE(contains(report.markdown(), "120 of 130 rows"));
    EXPECT_TRUE(contains(report.markdown(), "<details>"));
}

TEST(ReportEngine_Markdown, QualityReportHasSectionPerStage) {
    PipelineOptions options;
    options.validator = CommonValidators::sales();
    options.runTransform = false;
    const auto outcome = DataPipeline::run(small_table(), options);

    const std::string md = ReportEngine::qualityReport("ventas.csv", outcome).markdown();
    EXPECT_EQ(md.rfind("# Data Quality Report", 0), 0u);
    EXPECT_TRUE(contains(md, "Dataset: ventas.csv"));
    EXPECT_TRUE(contains(md, "## Validation"));
    EXPECT_TRUE(contains(md, "**invalid**"));
    EXPECT_TRUE(contains(md, "| range_total | range | total | error | 1 |"));
    EXPECT_TRUE(contains(md, "## Cleaning"));
    EXPECT_TRUE(contains(md, "### Cleaning Summary"));
    EXPECT_TRUE(contains(md, "## Transformation\n\n_Skipped._"));
}

TEST(ReportEngine_Markdown, SaveToUnwritablePathThrows) {
    ReportEngine report;
    report.addTitle("x");
    EXPECT_THROW(report.save("/nonexistent/dir/report.md"), Curator::IOException);
}
