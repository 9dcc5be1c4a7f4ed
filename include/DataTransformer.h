#pragma once
#include "TypedDataset.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class ScalingMethod { NONE, MINMAX, STANDARD, ROBUST, MAXABS, LOG, SQRT };
enum class EncodingMethod { LABEL, ONEHOT, ORDINAL, FREQUENCY, TARGET };

const char* scalingMethodName(ScalingMethod method) noexcept;
const char* encodingMethodName(EncodingMethod method) noexcept;
// Throw Curator::ConfigurationException on unknown names.
ScalingMethod parseScalingMethod(const std::string& name);
EncodingMethod parseEncodingMethod(const std::string& name);

struct ScalingParams {
    ScalingMethod method = ScalingMethod::NONE;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double stddev = 0.0;
    double median = 0.0;
    double q1 = 0.0;
    double q3 = 0.0;
    double maxAbs = 0.0;
};

/**
 * @brief Captured category mapping for one column.
 * @details Keys are cell text. One-hot maps keep the sorted category list and no codes.
 */
struct EncodingMap {
    EncodingMethod method = EncodingMethod::LABEL;
    std::vector<std::pair<std::string, double>> codes;
    std::vector<std::string> categories;

    std::optional<double> lookup(const std::string& category) const;
};

struct TransformConfig {
    ScalingMethod scalingMethod = ScalingMethod::NONE;
    // Empty means every NUMERIC column.
    std::vector<std::string> scalingColumns;

    EncodingMethod encodingMethod = EncodingMethod::LABEL;
    // Empty means every CATEGORICAL column except the target.
    std::vector<std::string> encodingColumns;
    size_t maxCategories = 50;

    bool extractDateFeatures = true;
    // Empty means auto-detect.
    std::vector<std::string> dateColumns;
    std::vector<std::string> dateFeatures = {"year", "month", "day", "dayofweek", "quarter"};

    bool handleInfinity = true;
    // nullopt replaces infinities with null.
    std::optional<double> infinityReplacement;

    bool verbose = false;

    /**
     * @throws Curator::ConfigurationException on maxCategories == 0 or an unknown date feature.
     */
    void validate() const;
};

struct TransformResult {
    std::vector<std::string> originalColumns;
    std::vector<std::string> transformedColumns;
    std::vector<std::string> newColumns;
    std::vector<std::string> removedColumns;
    std::vector<std::pair<std::string, ScalingParams>> scalingParams;
    std::vector<std::pair<std::string, EncodingMap>> encodingMaps;
    std::vector<std::string> dateColumns;
    std::vector<std::string> transformationsApplied;
    std::vector<std::string> warnings;
    bool fitted = false;

    const ScalingParams* findScaling(const std::string& column) const;
    const EncodingMap* findEncoding(const std::string& column) const;
};

struct TransformOutcome {
    TypedDataset data;
    TransformResult result;
};

class DataTransformer {
public:
    static const std::vector<std::string>& supportedDateFeatures();

    /**
     * @brief Learns and applies infinity handling, date features, encoding and scaling.
     * @details Stage order is fixed. A failure on one column becomes a warning and the
     * remaining columns still run. The returned result is the only state needed to replay.
     * @throws Curator::ConfigurationException on invalid config.
     */
    static TransformOutcome fitTransform(const TypedDataset& data,
                                         const TransformConfig& config,
                                         const std::optional<std::string>& targetColumn = std::nullopt);

    /**
     * @brief Replays captured parameters without refitting.
     * @throws Curator::TransformException when fitted.fitted is false.
     */
    static TypedDataset transform(const TypedDataset& data,
                                  const TransformConfig& config,
                                  const TransformResult& fitted);

    /**
     * @brief Reverses scaling for one column. NaN marks null and passes through.
     * Columns without captured parameters are returned unchanged.
     */
    static std::vector<double> inverseTransformColumn(const std::vector<double>& values,
                                                      const std::string& column,
                                                      const TransformResult& fitted);

    /**
     * @brief Sorts rows by date (stable, nulls last) and appends lag, rolling, diff and
     * percent change columns for valueColumn.
     * @throws Curator::DatasetException when a column is absent or valueColumn is not numeric.
     */
    static TypedDataset addTimeSeriesFeatures(const TypedDataset& data,
                                              const std::string& dateColumn,
                                              const std::string& valueColumn,
                                              const std::vector<size_t>& lags = {1, 7, 30},
                                              const std::vector<size_t>& windows = {7, 30});
};
