#pragma once
#include "TypedDataset.h"
#include <string>
#include <utility>
#include <vector>

enum class NullStrategy {
    DROP,
    FILL_ZERO,
    FILL_MEAN,
    FILL_MEDIAN,
    FILL_MODE,
    FILL_FORWARD,
    FILL_BACKWARD,
    FILL_INTERPOLATE
};

enum class DuplicateKeep { FIRST, LAST, NONE };
enum class OutlierMethod { ZSCORE, IQR };

const char* nullStrategyName(NullStrategy strategy) noexcept;
const char* duplicateKeepName(DuplicateKeep keep) noexcept;
const char* outlierMethodName(OutlierMethod method) noexcept;

// Accept the lowercase names printed by the *Name functions.
// Throw Curator::ConfigurationException on unknown names.
NullStrategy parseNullStrategy(const std::string& name);
DuplicateKeep parseDuplicateKeep(const std::string& name);
OutlierMethod parseOutlierMethod(const std::string& name);

struct CleaningConfig {
    bool removeDuplicates = true;
    // Empty means every column takes part in the duplicate key.
    std::vector<std::string> duplicateSubset;
    DuplicateKeep keepDuplicate = DuplicateKeep::FIRST;

    bool handleNulls = true;
    NullStrategy nullStrategy = NullStrategy::DROP;
    // Columns with a null ratio strictly above this are dropped.
    double nullThreshold = 0.5;
    std::vector<std::string> requiredColumns;

    bool detectOutliers = true;
    OutlierMethod outlierMethod = OutlierMethod::ZSCORE;
    double outlierThreshold = 3.0;
    double iqrMultiplier = 1.5;
    bool removeOutliers = false;

    bool normalizeText = true;
    bool stripWhitespace = true;
    bool lowercaseText = false;

    double minRetentionRate = 0.70;
    bool verbose = false;

    /**
     * @throws Curator::ConfigurationException when a threshold is out of range.
     */
    void validate() const;
};

struct CleaningReport {
    size_t originalRows = 0;
    size_t originalColumns = 0;
    size_t cleanedRows = 0;
    size_t cleanedColumns = 0;

    size_t duplicatesFound = 0;
    size_t duplicatesRemoved = 0;

    size_t nullsFound = 0;
    size_t nullsHandled = 0;
    std::vector<std::string> columnsDroppedNulls;

    size_t outliersDetected = 0;
    size_t outliersRemoved = 0;
    // Only columns with at least one flagged value, in column order.
    std::vector<std::pair<std::string, size_t>> outlierDetails;

    double retentionRate = 0.0;
    bool meetsRetentionRequirement = true;

    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

struct CleaningOutcome {
    TypedDataset data;
    CleaningReport report;
};

struct OutlierColumnSummary {
    std::string column;
    size_t count = 0;
    double mean = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    size_t zscoreOutliers = 0;
    size_t iqrOutliers = 0;
    std::vector<double> zscoreOutlierValues;
};

class DataCleaner {
public:
    static constexpr size_t kSummaryOutlierValues = 10;

    /**
     * @brief Runs the cleaning stages on a copy of the input.
     * @details Stage order: text normalization, duplicate removal, high-null column drop,
     * null handling, outlier handling, retention check. A retention shortfall is a warning.
     * @throws Curator::ConfigurationException on invalid config or unknown duplicate subset column.
     */
    static CleaningOutcome clean(const TypedDataset& data, const CleaningConfig& config);

    /**
     * @brief In-place variant of clean().
     */
    static CleaningReport run(TypedDataset& data, const CleaningConfig& config);

    /**
     * @brief Per NUMERIC column statistics with both Z-score and IQR outlier counts.
     */
    static std::vector<OutlierColumnSummary> outlierSummary(const TypedDataset& data, const CleaningConfig& config);
};
