/**
 * @file  test_data_transformer.cpp
 * @brief Scaling, encoding, date features, replay and time-series helpers.
 *
 * Properties covered:
 *   • inverse(scale(x)) == x for every invertible scaling method
 *   • Degenerate statistics scale to zeros instead of NaN/Inf
 *   • Label codes are assigned in first-appearance order, deterministically
 */

#include <gtest/gtest.h>
#include "CuratorExceptions.h"
#include "DataTransformer.h"

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

// ─── Helpers ─────────────────────────────────────────────────────────────────

static TypedDataset numeric_table(const std::vector<double>& values) {
    return TypedDataset::fromRows({"v"}, [&] {
        std::vector<std::vector<std::string>> rows;
        for (double v : values) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", v);
            rows.push_back({buf});
        }
        return rows;
    }());
}

static const std::vector<double>& nums(const TypedDataset& d, const std::string& col) {
    return std::get<std::vector<double>>(d.column(col).values);
}

static TransformConfig scaling(ScalingMethod method) {
    TransformConfig c;
    c.scalingMethod = method;
    return c;
}

// ─── Scaling ─────────────────────────────────────────────────────────────────

TEST(DataTransformer_Scaling, MinMaxExampleAndExactInverse) {
    auto out = DataTransformer::fitTransform(numeric_table({10, 20, 30, 40, 50}), scaling(ScalingMethod::MINMAX));
    EXPECT_EQ(nums(out.data, "v"), (std::vector<double>{0.0, 0.25, 0.5, 0.75, 1.0}));

    const ScalingParams* params = out.result.findScaling("v");
    ASSERT_NE(params, nullptr);
    EXPECT_DOUBLE_EQ(params->min, 10.0);
    EXPECT_DOUBLE_EQ(params->max, 50.0);

    auto restored = DataTransformer::inverseTransformColumn(nums(out.data, "v"), "v", out.result);
    EXPECT_EQ(restored, (std::vector<double>{10, 20, 30, 40, 50}));
}

TEST(DataTransformer_Scaling, RoundTripForEveryInvertibleMethod) {
    const std::vector<double> original{1.0, 2.0, 3.0, 4.0, 10.0};
    for (ScalingMethod method : {ScalingMethod::MINMAX, ScalingMethod::STANDARD, ScalingMethod::ROBUST,
                                 ScalingMethod::MAXABS, ScalingMethod::LOG, ScalingMethod::SQRT}) {
        auto out = DataTransformer::fitTransform(numeric_table(original), scaling(method));
        auto restored = DataTransformer::inverseTransformColumn(nums(out.data, "v"), "v", out.result);
        ASSERT_EQ(restored.size(), original.size());
        for (size_t i = 0; i < original.size(); ++i) {
            EXPECT_NEAR(restored[i], original[i], 1e-9) << "method " << scalingMethodName(method);
        }
    }
}

TEST(DataTransformer_Scaling, StandardUsesSampleStatistics) {
    auto out = DataTransformer::fitTransform(numeric_table({2, 4, 6}), scaling(ScalingMethod::STANDARD));
    const ScalingParams* params = out.result.findScaling("v");
    ASSERT_NE(params, nullptr);
    EXPECT_DOUBLE_EQ(params->mean, 4.0);
    EXPECT_DOUBLE_EQ(params->stddev, 2.0);
    EXPECT_EQ(nums(out.data, "v"), (std::vector<double>{-1.0, 0.0, 1.0}));
}

TEST(DataTransformer_Scaling, DegenerateColumnsScaleToZero) {
    for (ScalingMethod method : {ScalingMethod::MINMAX, ScalingMethod::STANDARD, ScalingMethod::ROBUST}) {
        auto out = DataTransformer::fitTransform(numeric_table({7, 7, 7}), scaling(method));
        for (double v : nums(out.data, "v")) {
            EXPECT_EQ(v, 0.0) << "method " << scalingMethodName(method);
        }
    }
    auto zeros = DataTransformer::fitTransform(numeric_table({0, 0}), scaling(ScalingMethod::MAXABS));
    EXPECT_EQ(nums(zeros.data, "v"), (std::vector<double>{0.0, 0.0}));
}

TEST(DataTransformer_Scaling, NullsPassThroughAndNonNumericColumnWarns) {
    auto table = TypedDataset::fromRows({"v", "name"}, {{"1", "a"}, {"", "b"}, {"3", "c"}});
    TransformConfig c = scaling(ScalingMethod::MINMAX);
    c.scalingColumns = {"v", "name"};
    c.encodingColumns = {"ghost"};

    auto out = DataTransformer::fitTransform(table, c);
    EXPECT_TRUE(out.data.column("v").isMissing(1));
    EXPECT_DOUBLE_EQ(nums(out.data, "v")[2], 1.0);
    ASSERT_EQ(out.result.warnings.size(), 1u);
    EXPECT_NE(out.result.warnings[0].find("name"), std::string::npos);
}

TEST(DataTransformer_Scaling, InverseOfUnknownColumnIsIdentity) {
    TransformResult empty;
    std::vector<double> values{1.5, 2.5};
    EXPECT_EQ(DataTransformer::inverseTransformColumn(values, "nope", empty), values);
}

// ─── Encoding ────────────────────────────────────────────────────────────────

TEST(DataTransformer_Encoding, LabelCodesFollowFirstAppearance) {
    auto table = TypedDataset::fromRows({"cat"}, {{"b"}, {"a"}, {"b"}, {"c"}});
    auto first = DataTransformer::fitTransform(table, TransformConfig{});
    auto second = DataTransformer::fitTransform(table, TransformConfig{});

    EXPECT_EQ(nums(first.data, "cat"), (std::vector<double>{0, 1, 0, 2}));
    EXPECT_EQ(nums(second.data, "cat"), nums(first.data, "cat"));
    const EncodingMap* map = first.result.findEncoding("cat");
    ASSERT_NE(map, nullptr);
    EXPECT_EQ(map->lookup("c"), 2.0);
    EXPECT_FALSE(map->lookup("z").has_value());

    auto replayed = DataTransformer::transform(table, TransformConfig{}, first.result);
    EXPECT_EQ(nums(replayed, "cat"), nums(first.data, "cat"));
}

TEST(DataTransformer_Encoding, OrdinalCodesFollowSortedOrder) {
    auto table = TypedDataset::fromRows({"size"}, {{"m"}, {"l"}, {"s"}});
    TransformConfig c;
    c.encodingMethod = EncodingMethod::ORDINAL;
    auto out = DataTransformer::fitTransform(table, c);
    EXPECT_EQ(nums(out.data, "size"), (std::vector<double>{1, 0, 2}));
}

TEST(DataTransformer_Encoding, OneHotReplacesColumnWithIndicators) {
    auto table = TypedDataset::fromRows({"id", "color"}, {{"1", "red"}, {"2", "blue"}, {"3", "red"}});
    TransformConfig c;
    c.encodingMethod = EncodingMethod::ONEHOT;
    auto out = DataTransformer::fitTransform(table, c);

    EXPECT_FALSE(out.data.hasColumn("color"));
    EXPECT_EQ(out.data.column("color_blue").type, ColumnType::BOOLEAN);
    EXPECT_EQ(nums(out.data, "color_blue"), (std::vector<double>{0, 1, 0}));
    EXPECT_EQ(nums(out.data, "color_red"), (std::vector<double>{1, 0, 1}));
    EXPECT_EQ(out.result.removedColumns, (std::vector<std::string>{"color"}));
    EXPECT_EQ(out.result.newColumns, (std::vector<std::string>{"color_blue", "color_red"}));
}

TEST(DataTransformer_Encoding, OneHotOverCategoryLimitFallsBackToLabel) {
    auto table = TypedDataset::fromRows({"code"}, {{"x"}, {"y"}, {"z"}});
    TransformConfig c;
    c.encodingMethod = EncodingMethod::ONEHOT;
    c.maxCategories = 2;
    auto out = DataTransformer::fitTransform(table, c);

    EXPECT_EQ(out.data.column("code").type, ColumnType::NUMERIC);
    EXPECT_EQ(out.result.findEncoding("code")->method, EncodingMethod::LABEL);
    EXPECT_EQ(out.result.warnings.size(), 1u);
}

TEST(DataTransformer_Encoding, OneHotNeverOverwritesExistingColumn) {
    auto table = TypedDataset::fromRows({"color", "color_red"}, {{"red", "7"}, {"blue", "8"}});
    TransformConfig c;
    c.encodingMethod = EncodingMethod::ONEHOT;
    auto out = DataTransformer::fitTransform(table, c);

    EXPECT_EQ(nums(out.data, "color_red"), (std::vector<double>{7, 8}));
    EXPECT_EQ(out.data.column("color").type, ColumnType::NUMERIC);
    EXPECT_EQ(out.result.findEncoding("color")->method, EncodingMethod::LABEL);
    ASSERT_EQ(out.result.warnings.size(), 1u);
    EXPECT_NE(out.result.warnings[0].find("color_red"), std::string::npos);
}

TEST(DataTransformer_Replay, OneHotReplaySkipsClashingTable) {
    auto train = TypedDataset::fromRows({"color"}, {{"red"}, {"blue"}});
    TransformConfig c;
    c.encodingMethod = EncodingMethod::ONEHOT;
    auto fitted = DataTransformer::fitTransform(train, c);

    auto fresh = TypedDataset::fromRows({"color", "color_blue"}, {{"red", "5"}});
    auto replayed = DataTransformer::transform(fresh, c, fitted.result);
    EXPECT_DOUBLE_EQ(nums(replayed, "color_blue")[0], 5.0);
    EXPECT_TRUE(replayed.hasColumn("color"));
}

TEST(DataTransformer_Encoding, FrequencyCodesAreShares) {
    auto table = TypedDataset::fromRows({"k"}, {{"a"}, {"b"}, {"b"}, {"c"}, {"b"}, {"a"}});
    TransformConfig c;
    c.encodingMethod = EncodingMethod::FREQUENCY;
    auto out = DataTransformer::fitTransform(table, c);

    const EncodingMap* map = out.result.findEncoding("k");
    ASSERT_NE(map, nullptr);
    ASSERT_EQ(map->codes.size(), 3u);
    EXPECT_EQ(map->codes[0].first, "b");
    EXPECT_DOUBLE_EQ(map->codes[0].second, 0.5);
    EXPECT_DOUBLE_EQ(nums(out.data, "k")[3], 1.0 / 6.0);
}

TEST(DataTransformer_Encoding, TargetEncodingUsesCategoryMeans) {
    auto table = TypedDataset::fromRows({"city", "sales"}, {{"x", "1"}, {"x", "3"}, {"y", "10"}});
    TransformConfig c;
    c.encodingMethod = EncodingMethod::TARGET;
    auto out = DataTransformer::fitTransform(table, c, std::string("sales"));
    EXPECT_EQ(nums(out.data, "city"), (std::vector<double>{2, 2, 10}));

    auto noTarget = DataTransformer::fitTransform(table, c);
    EXPECT_EQ(noTarget.data.column("city").type, ColumnType::CATEGORICAL);
    EXPECT_TRUE(noTarget.result.warnings.empty());
}

TEST(DataTransformer_Encoding, TargetColumnIsNeverEncoded) {
    auto table = TypedDataset::fromRows({"segment", "region"}, {{"retail", "n"}, {"b2b", "s"}});
    auto out = DataTransformer::fitTransform(table, TransformConfig{}, std::string("segment"));
    EXPECT_EQ(out.data.column("segment").type, ColumnType::CATEGORICAL);
    EXPECT_EQ(out.data.column("region").type, ColumnType::NUMERIC);
}

// ─── Dates and infinity ──────────────────────────────────────────────────────

TEST(DataTransformer_Dates, ExtractsDefaultCalendarFeatures) {
    auto table = TypedDataset::fromRows({"fecha"}, {{"2024-01-15"}, {"2024-11-30"}});
    auto out = DataTransformer::fitTransform(table, TransformConfig{});

    EXPECT_EQ(nums(out.data, "fecha_year"), (std::vector<double>{2024, 2024}));
    EXPECT_EQ(nums(out.data, "fecha_month"), (std::vector<double>{1, 11}));
    EXPECT_EQ(nums(out.data, "fecha_day"), (std::vector<double>{15, 30}));
    EXPECT_EQ(nums(out.data, "fecha_dayofweek"), (std::vector<double>{0, 5}));
    EXPECT_EQ(nums(out.data, "fecha_quarter"), (std::vector<double>{1, 4}));
    EXPECT_EQ(out.result.dateColumns, (std::vector<std::string>{"fecha"}));
}

TEST(DataTransformer_Dates, OptionalFeatures) {
    auto table = TypedDataset::fromRows({"d"}, {{"2024-03-31 18:00:00"}, {"2021-01-03 00:00:00"}});
    TransformConfig c;
    c.dateFeatures = {"weekofyear", "hour", "is_weekend", "is_month_start", "is_month_end"};
    auto out = DataTransformer::fitTransform(table, c);

    EXPECT_EQ(nums(out.data, "d_weekofyear"), (std::vector<double>{13, 53}));
    EXPECT_EQ(nums(out.data, "d_hour"), (std::vector<double>{18, 0}));
    EXPECT_EQ(nums(out.data, "d_is_weekend"), (std::vector<double>{1, 1}));
    EXPECT_EQ(nums(out.data, "d_is_month_start"), (std::vector<double>{0, 0}));
    EXPECT_EQ(nums(out.data, "d_is_month_end"), (std::vector<double>{1, 0}));
}

TEST(DataTransformer_Dates, NumericDateColumnWarns) {
    auto table = TypedDataset::fromRows({"n"}, {{"1"}, {"2"}});
    TransformConfig c;
    c.dateColumns = {"n"};
    auto out = DataTransformer::fitTransform(table, c);
    EXPECT_EQ(out.result.warnings.size(), 1u);
    EXPECT_FALSE(out.data.hasColumn("n_year"));
}

TEST(DataTransformer_Infinity, ReplacedWithNullOrValue) {
    auto table = TypedDataset::fromRows({"v"}, {{"1"}, {"inf"}, {"-inf"}});
    auto asNull = DataTransformer::fitTransform(table, TransformConfig{});
    EXPECT_EQ(asNull.data.column("v").missingCount(), 2u);

    TransformConfig c;
    c.infinityReplacement = 0.0;
    auto asZero = DataTransformer::fitTransform(table, c);
    EXPECT_EQ(nums(asZero.data, "v"), (std::vector<double>{1, 0, 0}));
}

// ─── Replay ──────────────────────────────────────────────────────────────────

TEST(DataTransformer_Replay, TransformReusesFittedParameters) {
    auto train = TypedDataset::fromRows({"v", "city"}, {{"0", "a"}, {"10", "b"}});
    auto fresh = TypedDataset::fromRows({"v", "city"}, {{"5", "b"}, {"20", "z"}});
    TransformConfig c = scaling(ScalingMethod::MINMAX);

    auto fitted = DataTransformer::fitTransform(train, c);
    auto replayed = DataTransformer::transform(fresh, c, fitted.result);

    EXPECT_EQ(nums(replayed, "v"), (std::vector<double>{0.5, 2.0}));
    EXPECT_DOUBLE_EQ(nums(replayed, "city")[0], 1.0);
    EXPECT_TRUE(replayed.column("city").isMissing(1)) << "unseen category maps to null";
}

TEST(DataTransformer_Replay, UnfittedResultThrows) {
    EXPECT_THROW(DataTransformer::transform(numeric_table({1}), TransformConfig{}, TransformResult{}),
                 Curator::TransformException);
}

// ─── Time series ─────────────────────────────────────────────────────────────

TEST(DataTransformer_TimeSeries, SortsByDateAndAddsWindowFeatures) {
    auto table = TypedDataset::fromRows({"fecha", "ventas"},
                                        {{"2024-01-03", "30"}, {"2024-01-01", "10"}, {"2024-01-02", "20"}});
    auto out = DataTransformer::addTimeSeriesFeatures(table, "fecha", "ventas", {1}, {2});

    EXPECT_EQ(nums(out, "ventas"), (std::vector<double>{10, 20, 30}));
    EXPECT_TRUE(out.column("ventas_lag_1").isMissing(0));
    EXPECT_DOUBLE_EQ(nums(out, "ventas_lag_1")[2], 20.0);
    EXPECT_EQ(nums(out, "ventas_rolling_mean_2"), (std::vector<double>{10, 15, 25}));
    EXPECT_TRUE(out.column("ventas_rolling_std_2").isMissing(0));
    EXPECT_NEAR(nums(out, "ventas_rolling_std_2")[1], std::sqrt(50.0), 1e-12);
    EXPECT_DOUBLE_EQ(nums(out, "ventas_diff_1")[1], 10.0);
    EXPECT_DOUBLE_EQ(nums(out, "ventas_pct_change_1")[2], 0.5);
    EXPECT_EQ(out.column("ventas_diff_7").missingCount(), 3u);
}

TEST(DataTransformer_TimeSeries, RejectsNonNumericValueColumn) {
    auto table = TypedDataset::fromRows({"fecha", "label"}, {{"2024-01-01", "a"}});
    EXPECT_THROW(DataTransformer::addTimeSeriesFeatures(table, "fecha", "label"), Curator::DatasetException);
    EXPECT_THROW(DataTransformer::addTimeSeriesFeatures(table, "nope", "label"), Curator::DatasetException);
}

// ─── Configuration ───────────────────────────────────────────────────────────

TEST(DataTransformer_Config, RejectsInvalidValues) {
    TransformConfig c;
    c.dateFeatures = {"century"};
    EXPECT_THROW(c.validate(), Curator::ConfigurationException);
    c.dateFeatures = {"year"};
    c.maxCategories = 0;
    EXPECT_THROW(c.validate(), Curator::ConfigurationException);
    EXPECT_EQ(parseScalingMethod("MinMax"), ScalingMethod::MINMAX);
    EXPECT_THROW(parseEncodingMethod("hash"), Curator::ConfigurationException);
}
