/**
 * @file  test_pipeline_config.cpp
 * @brief CLI flag parsing, key:value config files and cross-field validation.
 */

#include <gtest/gtest.h>
#include "CuratorExceptions.h"
#include "PipelineConfig.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// ─── Helpers ─────────────────────────────────────────────────────────────────

static PipelineConfig parse_args(std::vector<std::string> args) {
    args.insert(args.begin(), "curator");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return PipelineConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

static std::string write_config(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

static PipelineConfig base_with_dataset() {
    PipelineConfig base;
    base.datasetPath = "data.csv";
    return base;
}

// ─── fromArgs ────────────────────────────────────────────────────────────────

TEST(PipelineConfig_Args, DefaultsWithDatasetOnly) {
    auto config = parse_args({"ventas.csv"});
    EXPECT_EQ(config.datasetPath, "ventas.csv");
    EXPECT_EQ(config.preset, "none");
    EXPECT_TRUE(config.runValidation);
    EXPECT_TRUE(config.runCleaning);
    EXPECT_TRUE(config.runTransform);
    EXPECT_EQ(config.delimiter, ',');
}

TEST(PipelineConfig_Args, FlagsOverrideDefaults) {
    auto config = parse_args({"ventas.csv", "--preset", "Sales", "--target", "total",
                              "--delimiter", "tab", "--null-strategy", "fill_median",
                              "--outlier-method", "iqr", "--remove-outliers",
                              "--scaling", "robust", "--encoding", "onehot",
                              "--skip-validation", "--output", "out.json",
                              "--report", "report.md", "--verbose"});

    EXPECT_EQ(config.preset, "sales");
    EXPECT_EQ(config.targetColumn, "total");
    EXPECT_EQ(config.delimiter, '\t');
    EXPECT_EQ(config.cleaning.nullStrategy, NullStrategy::FILL_MEDIAN);
    EXPECT_EQ(config.cleaning.outlierMethod, OutlierMethod::IQR);
    EXPECT_TRUE(config.cleaning.removeOutliers);
    EXPECT_EQ(config.transform.scalingMethod, ScalingMethod::ROBUST);
    EXPECT_EQ(config.transform.encodingMethod, EncodingMethod::ONEHOT);
    EXPECT_FALSE(config.runValidation);
    EXPECT_EQ(config.outputPath, "out.json");
    EXPECT_EQ(config.reportPath, "report.md");
    EXPECT_TRUE(config.verbose);
    EXPECT_TRUE(config.cleaning.verbose);
    EXPECT_TRUE(config.transform.verbose);
}

TEST(PipelineConfig_Args, RejectsBadInvocations) {
    EXPECT_THROW(parse_args({}), Curator::ConfigurationException);
    EXPECT_THROW(parse_args({"--verbose"}), Curator::ConfigurationException);
    EXPECT_THROW(parse_args({"a.csv", "--frobnicate"}), Curator::ConfigurationException);
    EXPECT_THROW(parse_args({"a.csv", "--scaling"}), Curator::ConfigurationException);
    EXPECT_THROW(parse_args({"a.csv", "--scaling", "zscore"}), Curator::ConfigurationException);
    EXPECT_THROW(parse_args({"a.csv", "--preset", "inventory"}), Curator::ConfigurationException);
    EXPECT_THROW(parse_args({"a.csv", "--encoding", "target"}), Curator::ConfigurationException);
}

TEST(PipelineConfig_Args, UnknownFlagMessageCarriesUsage) {
    try {
        parse_args({"a.csv", "--frobnicate"});
        FAIL() << "expected ConfigurationException";
    } catch (const Curator::ConfigurationException& ex) {
        const std::string what = ex.what();
        EXPECT_NE(what.find("Unknown argument: --frobnicate"), std::string::npos);
        EXPECT_NE(what.find("Usage: curator"), std::string::npos);
    }
}

TEST(PipelineConfig_Args, ExplicitFlagsWinOverConfigFile) {
    const std::string path = write_config("curator_flags.yaml", "scaling_method: minmax\npreset: products\n");
    auto config = parse_args({"a.csv", "--config", path, "--scaling", "standard"});
    EXPECT_EQ(config.transform.scalingMethod, ScalingMethod::STANDARD);
    EXPECT_EQ(config.preset, "products");
    EXPECT_EQ(config.datasetPath, "a.csv");
    std::remove(path.c_str());
}

// ─── fromFile ────────────────────────────────────────────────────────────────

TEST(PipelineConfig_File, ParsesYamlStyleKeysCommentsAndLists) {
    const std::string path = write_config("curator_full.yaml",
                                          "# cleaning\n"
                                          "null-strategy: fill_mean\n"
                                          "null_threshold: 0.3\n"
                                          "required_columns: [fecha, \"total\"]\n"
                                          "min_retention_rate: 0.8\n"
                                          "\n"
                                          "# transform\n"
                                          "encoding_method: frequency\n"
                                          "date_features: [Year, hour]\n"
                                          "max_categories: 12\n"
                                          "infinity_replacement: 0\n"
                                          "mystery_key: ignored\n");
    auto config = PipelineConfig::fromFile(path, base_with_dataset());

    EXPECT_EQ(config.cleaning.nullStrategy, NullStrategy::FILL_MEAN);
    EXPECT_DOUBLE_EQ(config.cleaning.nullThreshold, 0.3);
    EXPECT_EQ(config.cleaning.requiredColumns, (std::vector<std::string>{"fecha", "total"}));
    EXPECT_DOUBLE_EQ(config.cleaning.minRetentionRate, 0.8);
    EXPECT_EQ(config.transform.encodingMethod, EncodingMethod::FREQUENCY);
    EXPECT_EQ(config.transform.dateFeatures, (std::vector<std::string>{"year", "hour"}));
    EXPECT_EQ(config.transform.maxCategories, 12u);
    ASSERT_TRUE(config.transform.infinityReplacement.has_value());
    EXPECT_DOUBLE_EQ(*config.transform.infinityReplacement, 0.0);
    std::remove(path.c_str());
}

TEST(PipelineConfig_File, AcceptsJsonStyleLines) {
    const std::string path = write_config("curator_json.cfg",
                                          "{\n"
                                          "  \"scaling_method\": \"maxabs\",\n"
                                          "  \"remove_duplicates\": \"false\",\n"
                                          "  \"delimiter\": \";\"\n"
                                          "}\n");
    auto config = PipelineConfig::fromFile(path, base_with_dataset());
    EXPECT_EQ(config.transform.scalingMethod, ScalingMethod::MAXABS);
    EXPECT_FALSE(config.cleaning.removeDuplicates);
    EXPECT_EQ(config.delimiter, ';');
    std::remove(path.c_str());
}

TEST(PipelineConfig_File, ParseErrorNamesTheLine) {
    const std::string path = write_config("curator_bad.yaml",
                                          "preset: sales\n"
                                          "# comment\n"
                                          "remove_outliers: sometimes\n");
    try {
        PipelineConfig::fromFile(path, base_with_dataset());
        FAIL() << "expected ConfigurationException";
    } catch (const Curator::ConfigurationException& ex) {
        const std::string what = ex.what();
        EXPECT_NE(what.find("line 3"), std::string::npos);
        EXPECT_NE(what.find("remove_outliers"), std::string::npos);
    }
    std::remove(path.c_str());
}

TEST(PipelineConfig_File, MissingFileThrows) {
    EXPECT_THROW(PipelineConfig::fromFile("/nonexistent/curator.yaml", base_with_dataset()),
                 Curator::ConfigurationException);
}

// ─── validate ────────────────────────────────────────────────────────────────

TEST(PipelineConfig_Validate, CrossFieldRules) {
    PipelineConfig config = base_with_dataset();
    EXPECT_NO_THROW(config.validate());

    config.datetimeLocaleHint = "ymd";
    EXPECT_THROW(config.validate(), Curator::ConfigurationException);
    config.datetimeLocaleHint = "dmy";

    config.transform.encodingMethod = EncodingMethod::TARGET;
    EXPECT_THROW(config.validate(), Curator::ConfigurationException);
    config.targetColumn = "total";
    EXPECT_NO_THROW(config.validate());

    config.cleaning.nullThreshold = 1.5;
    EXPECT_THROW(config.validate(), Curator::ConfigurationException);
    config.cleaning.nullThreshold = 0.5;

    config.datasetPath.clear();
    EXPECT_THROW(config.validate(), Curator::ConfigurationException);
}
