#include "DataCleaner.h"
#include "CommonUtils.h"
#include "CuratorExceptions.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <type_traits>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;
using TimeVec = std::vector<int64_t>;

void logInfo(const CleaningConfig& config, const std::string& msg) {
    if (config.verbose) std::cout << "[Curator][Cleaner] " << msg << "\n";
}

void logWarning(CleaningReport& report, const std::string& msg) {
    std::cerr << "[Curator][Cleaner] Warning: " << msg << "\n";
    report.warnings.push_back(msg);
}

std::string percentText(double ratio, int decimals) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f%%", decimals, ratio * 100.0);
    return buf;
}

struct ObservedValues {
    NumVec values;
    std::vector<size_t> rows;
};

ObservedValues observedFinite(const TypedColumn& col) {
    ObservedValues out;
    const auto& values = std::get<NumVec>(col.values);
    out.values.reserve(values.size());
    out.rows.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (col.isMissing(i) || !std::isfinite(values[i])) continue;
        out.values.push_back(values[i]);
        out.rows.push_back(i);
    }
    return out;
}

std::vector<bool> zscoreFlags(const NumVec& values, double threshold) {
    std::vector<bool> flags(values.size(), false);
    if (values.size() < 2) return flags;

    const double mean = CommonUtils::mean(values);
    const double sd = CommonUtils::sampleStddev(values);
    if (!(sd > 0.0)) return flags;

    for (size_t i = 0; i < values.size(); ++i) {
        flags[i] = std::abs((values[i] - mean) / sd) > threshold;
    }
    return flags;
}

std::vector<bool> iqrFlags(const NumVec& values, double multiplier) {
    std::vector<bool> flags(values.size(), false);
    if (values.empty()) return flags;

    const double q1 = CommonUtils::quantileByNth(values, 0.25);
    const double q3 = CommonUtils::quantileByNth(values, 0.75);
    const double iqr = q3 - q1;
    const double lo = q1 - multiplier * iqr;
    const double hi = q3 + multiplier * iqr;

    for (size_t i = 0; i < values.size(); ++i) flags[i] = (values[i] < lo || values[i] > hi);
    return flags;
}

// Flags are expanded back to full row positions; nulls are never flagged.
std::vector<bool> outlierFlagsForColumn(const TypedColumn& col, const CleaningConfig& config) {
    std::vector<bool> flags(col.size(), false);
    const ObservedValues observed = observedFinite(col);
    if (observed.values.empty()) return flags;

    const std::vector<bool> obsFlags = (config.outlierMethod == OutlierMethod::ZSCORE)
        ? zscoreFlags(observed.values, config.outlierThreshold)
        : iqrFlags(observed.values, config.iqrMultiplier);
    for (size_t i = 0; i < obsFlags.size(); ++i) {
        flags[observed.rows[i]] = obsFlags[i];
    }
    return flags;
}

void normalizeTextColumns(TypedDataset& data, const CleaningConfig& config) {
    for (auto& col : data.columns()) {
        if (col.type != ColumnType::CATEGORICAL) continue;
        auto& values = std::get<StrVec>(col.values);
        for (size_t i = 0; i < values.size(); ++i) {
            if (col.missing[i]) continue;
            if (config.stripWhitespace) {
                values[i] = CommonUtils::trim(values[i]);
                if (values[i].empty() || values[i] == "nan") {
                    values[i].clear();
                    col.missing[i] = static_cast<uint8_t>(1);
                    continue;
                }
            }
            if (config.lowercaseText) values[i] = CommonUtils::toLower(values[i]);
        }
    }
}

// nullopt marks null, so no cell text can collide with it.
using RowKey = std::vector<std::optional<std::string>>;

std::optional<std::string> duplicateKeyPart(const TypedDataset& data, size_t colIdx, size_t row) {
    const TypedColumn& col = data.columns()[colIdx];
    if (col.isMissing(row)) return std::nullopt;
    if (col.type == ColumnType::NUMERIC) {
        const double v = std::get<NumVec>(col.values)[row];
        return CommonUtils::formatNumberExact(v == 0.0 ? 0.0 : v);
    }
    return data.cellText(colIdx, row);
}

size_t removeDuplicateRows(TypedDataset& data, const CleaningConfig& config) {
    std::vector<size_t> keyCols;
    if (config.duplicateSubset.empty()) {
        for (size_t c = 0; c < data.colCount(); ++c) keyCols.push_back(c);
    } else {
        for (const auto& name : config.duplicateSubset) {
            const int idx = data.findColumnIndex(name);
            if (idx < 0) throw Curator::ConfigurationException("Duplicate subset column not found: " + name);
            keyCols.push_back(static_cast<size_t>(idx));
        }
    }

    const size_t rows = data.rowCount();
    std::vector<RowKey> keys(rows);
    std::map<RowKey, size_t> counts;
    for (size_t r = 0; r < rows; ++r) {
        RowKey key;
        key.reserve(keyCols.size());
        for (size_t c : keyCols) key.push_back(duplicateKeyPart(data, c, r));
        keys[r] = std::move(key);
        ++counts[keys[r]];
    }

    MissingMask keep(rows, static_cast<uint8_t>(1));
    std::set<RowKey> seen;
    if (config.keepDuplicate == DuplicateKeep::FIRST) {
        for (size_t r = 0; r < rows; ++r) {
            if (!seen.insert(keys[r]).second) keep[r] = static_cast<uint8_t>(0);
        }
    } else if (config.keepDuplicate == DuplicateKeep::LAST) {
        for (size_t r = rows; r-- > 0;) {
            if (!seen.insert(keys[r]).second) keep[r] = static_cast<uint8_t>(0);
        }
    } else {
        for (size_t r = 0; r < rows; ++r) {
            if (counts[keys[r]] > 1) keep[r] = static_cast<uint8_t>(0);
        }
    }

    const size_t kept = static_cast<size_t>(std::count(keep.begin(), keep.end(), static_cast<uint8_t>(1)));
    if (kept != rows) data.removeRows(keep);
    return rows - kept;
}

std::vector<std::string> dropHighNullColumns(TypedDataset& data, const CleaningConfig& config) {
    std::vector<std::string> dropped;
    const size_t rows = data.rowCount();
    if (rows == 0) return dropped;

    for (const auto& col : data.columns()) {
        const double ratio = static_cast<double>(col.missingCount()) / static_cast<double>(rows);
        if (ratio <= config.nullThreshold) continue;
        if (std::find(config.requiredColumns.begin(), config.requiredColumns.end(), col.name) != config.requiredColumns.end()) continue;
        dropped.push_back(col.name);
    }
    if (!dropped.empty()) data.removeColumns(dropped);
    return dropped;
}

template <typename T>
bool modeOf(const std::vector<T>& values, const MissingMask& missing, T& out) {
    std::map<T, size_t> freq;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!missing[i]) ++freq[values[i]];
    }
    size_t best = 0;
    for (const auto& kv : freq) {
        // Ascending iteration keeps the smallest value on ties.
        if (kv.second > best) {
            best = kv.second;
            out = kv.first;
        }
    }
    return best > 0;
}

template <typename T>
void fillWith(std::vector<T>& values, MissingMask& missing, const T& fill) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (!missing[i]) continue;
        values[i] = fill;
        missing[i] = static_cast<uint8_t>(0);
    }
}

template <typename T>
void forwardFill(std::vector<T>& values, MissingMask& missing) {
    for (size_t i = 1; i < values.size(); ++i) {
        if (missing[i] && !missing[i - 1]) {
            values[i] = values[i - 1];
            missing[i] = static_cast<uint8_t>(0);
        }
    }
}

template <typename T>
void backwardFill(std::vector<T>& values, MissingMask& missing) {
    for (size_t i = values.size(); i-- > 1;) {
        if (missing[i - 1] && !missing[i]) {
            values[i - 1] = values[i];
            missing[i - 1] = static_cast<uint8_t>(0);
        }
    }
}

void interpolateInterior(NumVec& values, MissingMask& missing) {
    std::optional<size_t> lastKnown;
    for (size_t i = 0; i < values.size(); ++i) {
        if (missing[i]) continue;
        if (lastKnown && *lastKnown + 1 < i) {
            const size_t from = *lastKnown;
            const double left = values[from];
            const double right = values[i];
            const size_t span = i - from;
            for (size_t k = 1; k < span; ++k) {
                const double t = static_cast<double>(k) / static_cast<double>(span);
                values[from + k] = left + t * (right - left);
                missing[from + k] = static_cast<uint8_t>(0);
            }
        }
        lastKnown = i;
    }
}

double centralValue(NumVec observed, NullStrategy strategy) {
    return strategy == NullStrategy::FILL_MEDIAN ? CommonUtils::medianByNth(std::move(observed))
                                                 : CommonUtils::mean(observed);
}

void fillCentral(TypedColumn& col, NullStrategy strategy) {
    if (col.type == ColumnType::NUMERIC) {
        auto& values = std::get<NumVec>(col.values);
        NumVec observed;
        for (size_t i = 0; i < values.size(); ++i) if (!col.missing[i]) observed.push_back(values[i]);
        const double fill = observed.empty() ? 0.0 : centralValue(std::move(observed), strategy);
        fillWith(values, col.missing, fill);
    } else if (col.type == ColumnType::DATETIME) {
        auto& values = std::get<TimeVec>(col.values);
        NumVec observed;
        for (size_t i = 0; i < values.size(); ++i) if (!col.missing[i]) observed.push_back(static_cast<double>(values[i]));
        if (observed.empty()) return;
        fillWith(values, col.missing, static_cast<int64_t>(std::llround(centralValue(std::move(observed), strategy))));
    } else if (col.type == ColumnType::BOOLEAN) {
        auto& values = std::get<NumVec>(col.values);
        double fill = 0.0;
        if (!modeOf(values, col.missing, fill)) fill = 0.0;
        fillWith(values, col.missing, fill);
    } else {
        fillWith(std::get<StrVec>(col.values), col.missing, std::string());
    }
}

void fillMode(TypedColumn& col) {
    std::visit([&](auto& values) {
        using T = typename std::decay_t<decltype(values)>::value_type;
        T fill{};
        if (modeOf(values, col.missing, fill)) fillWith(values, col.missing, fill);
    }, col.values);
}

void fillZero(TypedColumn& col) {
    switch (col.type) {
        case ColumnType::NUMERIC:
        case ColumnType::BOOLEAN:
            fillWith(std::get<NumVec>(col.values), col.missing, 0.0);
            break;
        case ColumnType::DATETIME:
            fillWith(std::get<TimeVec>(col.values), col.missing, static_cast<int64_t>(0));
            break;
        case ColumnType::CATEGORICAL:
            fillWith(std::get<StrVec>(col.values), col.missing, std::string("0"));
            break;
    }
}

void handleNullValues(TypedDataset& data, const CleaningConfig& config, CleaningReport& report) {
    report.nullsFound = data.missingCount();
    const NullStrategy strategy = config.nullStrategy;

    if (strategy == NullStrategy::DROP) {
        const size_t before = data.rowCount();
        MissingMask keep(before, static_cast<uint8_t>(1));
        for (const auto& col : data.columns()) {
            for (size_t r = 0; r < before; ++r) {
                if (col.missing[r]) keep[r] = static_cast<uint8_t>(0);
            }
        }
        data.removeRows(keep);
        report.nullsHandled = before - data.rowCount();
        return;
    }

    for (auto& col : data.columns()) {
        if (col.missingCount() == 0) continue;
        switch (strategy) {
            case NullStrategy::FILL_ZERO:
                fillZero(col);
                break;
            case NullStrategy::FILL_MEAN:
            case NullStrategy::FILL_MEDIAN:
                fillCentral(col, strategy);
                break;
            case NullStrategy::FILL_MODE:
                fillMode(col);
                break;
            case NullStrategy::FILL_FORWARD:
                std::visit([&](auto& values) { forwardFill(values, col.missing); }, col.values);
                break;
            case NullStrategy::FILL_BACKWARD:
                std::visit([&](auto& values) { backwardFill(values, col.missing); }, col.values);
                break;
            case NullStrategy::FILL_INTERPOLATE:
                if (col.type == ColumnType::NUMERIC) interpolateInterior(std::get<NumVec>(col.values), col.missing);
                std::visit([&](auto& values) {
                    forwardFill(values, col.missing);
                    backwardFill(values, col.missing);
                }, col.values);
                break;
            case NullStrategy::DROP:
                break;
        }
    }
    report.nullsHandled = report.nullsFound - data.missingCount();
}

void handleOutliers(TypedDataset& data, const CleaningConfig& config, CleaningReport& report) {
    const std::vector<size_t> numericCols = data.numericColumnIndices();
    std::vector<std::vector<bool>> flagsByColumn(numericCols.size());

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t pos = 0; pos < numericCols.size(); ++pos) {
        flagsByColumn[pos] = outlierFlagsForColumn(data.columns()[numericCols[pos]], config);
    }

    MissingMask keep(data.rowCount(), static_cast<uint8_t>(1));
    size_t total = 0;
    for (size_t pos = 0; pos < numericCols.size(); ++pos) {
        const auto& flags = flagsByColumn[pos];
        const size_t count = static_cast<size_t>(std::count(flags.begin(), flags.end(), true));
        if (count == 0) continue;
        report.outlierDetails.emplace_back(data.columns()[numericCols[pos]].name, count);
        total += count;
        for (size_t r = 0; r < flags.size(); ++r) {
            if (flags[r]) keep[r] = static_cast<uint8_t>(0);
        }
    }
    report.outliersDetected = total;

    if (config.removeOutliers && total > 0) {
        const size_t before = data.rowCount();
        data.removeRows(keep);
        report.outliersRemoved = before - data.rowCount();
        logInfo(config, "Outlier rows removed: " + std::to_string(report.outliersRemoved));
    }
}
} // namespace

const char* nullStrategyName(NullStrategy strategy) noexcept {
    switch (strategy) {
        case NullStrategy::DROP: return "drop";
        case NullStrategy::FILL_ZERO: return "fill_zero";
        case NullStrategy::FILL_MEAN: return "fill_mean";
        case NullStrategy::FILL_MEDIAN: return "fill_median";
        case NullStrategy::FILL_MODE: return "fill_mode";
        case NullStrategy::FILL_FORWARD: return "fill_forward";
        case NullStrategy::FILL_BACKWARD: return "fill_backward";
        case NullStrategy::FILL_INTERPOLATE: return "fill_interpolate";
    }
    return "drop";
}

const char* duplicateKeepName(DuplicateKeep keep) noexcept {
    switch (keep) {
        case DuplicateKeep::FIRST: return "first";
        case DuplicateKeep::LAST: return "last";
        case DuplicateKeep::NONE: return "none";
    }
    return "first";
}

const char* outlierMethodName(OutlierMethod method) noexcept {
    return method == OutlierMethod::IQR ? "iqr" : "zscore";
}

NullStrategy parseNullStrategy(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    static const NullStrategy kAll[] = {
        NullStrategy::DROP, NullStrategy::FILL_ZERO, NullStrategy::FILL_MEAN, NullStrategy::FILL_MEDIAN,
        NullStrategy::FILL_MODE, NullStrategy::FILL_FORWARD, NullStrategy::FILL_BACKWARD, NullStrategy::FILL_INTERPOLATE};
    for (NullStrategy s : kAll) {
        if (n == nullStrategyName(s)) return s;
    }
    throw Curator::ConfigurationException("Unknown null strategy: " + name);
}

DuplicateKeep parseDuplicateKeep(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    if (n == "first") return DuplicateKeep::FIRST;
    if (n == "last") return DuplicateKeep::LAST;
    if (n == "none" || n == "false") return DuplicateKeep::NONE;
    throw Curator::ConfigurationException("Unknown duplicate keep policy: " + name);
}

OutlierMethod parseOutlierMethod(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    if (n == "zscore") return OutlierMethod::ZSCORE;
    if (n == "iqr") return OutlierMethod::IQR;
    throw Curator::ConfigurationException("Unknown outlier method: " + name);
}

void CleaningConfig::validate() const {
    if (!(nullThreshold >= 0.0 && nullThreshold <= 1.0)) {
        throw Curator::ConfigurationException("null_threshold must be within [0,1]");
    }
    if (!(outlierThreshold > 0.0)) {
        throw Curator::ConfigurationException("outlier_threshold must be > 0");
    }
    if (!(iqrMultiplier > 0.0)) {
        throw Curator::ConfigurationException("iqr_multiplier must be > 0");
    }
    if (!(minRetentionRate >= 0.0 && minRetentionRate <= 1.0)) {
        throw Curator::ConfigurationException("min_retention_rate must be within [0,1]");
    }
}

CleaningOutcome DataCleaner::clean(const TypedDataset& data, const CleaningConfig& config) {
    CleaningOutcome outcome{data, CleaningReport{}};
    outcome.report = run(outcome.data, config);
    return outcome;
}

CleaningReport DataCleaner::run(TypedDataset& data, const CleaningConfig& config) {
    config.validate();

    CleaningReport report;
    report.originalRows = data.rowCount();
    report.originalColumns = data.colCount();

    if (config.normalizeText) {
        normalizeTextColumns(data, config);
    }

    if (config.removeDuplicates) {
        report.duplicatesFound = removeDuplicateRows(data, config);
        report.duplicatesRemoved = report.duplicatesFound;
        if (report.duplicatesRemoved > 0) {
            logInfo(config, "Duplicate rows removed: " + std::to_string(report.duplicatesRemoved));
        }
    }

    report.columnsDroppedNulls = dropHighNullColumns(data, config);
    if (!report.columnsDroppedNulls.empty()) {
        std::string joined;
        for (size_t i = 0; i < report.columnsDroppedNulls.size(); ++i) {
            if (i) joined += ", ";
            joined += report.columnsDroppedNulls[i];
        }
        logWarning(report, "Columns dropped for excess nulls: " + joined);
    }

    if (config.handleNulls) {
        handleNullValues(data, config, report);
        if (report.nullsHandled > 0) {
            logInfo(config, "Null values handled (" + std::string(nullStrategyName(config.nullStrategy)) + "): " +
                                std::to_string(report.nullsHandled));
        }
    }

    if (config.detectOutliers) {
        handleOutliers(data, config, report);
    }

    report.cleanedRows = data.rowCount();
    report.cleanedColumns = data.colCount();
    report.retentionRate = report.originalRows > 0
        ? static_cast<double>(report.cleanedRows) / static_cast<double>(report.originalRows)
        : 1.0;
    report.meetsRetentionRequirement = report.retentionRate >= config.minRetentionRate;
    if (!report.meetsRetentionRequirement) {
        logWarning(report, "Retention rate (" + percentText(report.retentionRate, 1) +
                               ") below required minimum (" + percentText(config.minRetentionRate, 0) + ")");
    }

    logInfo(config, "Cleaning complete: " + std::to_string(report.cleanedRows) + "/" +
                        std::to_string(report.originalRows) + " rows (" + percentText(report.retentionRate, 1) + ")");
    return report;
}

std::vector<OutlierColumnSummary> DataCleaner::outlierSummary(const TypedDataset& data, const CleaningConfig& config) {
    std::vector<OutlierColumnSummary> summary;
    for (size_t colIdx : data.numericColumnIndices()) {
        const TypedColumn& col = data.columns()[colIdx];
        const ObservedValues observed = observedFinite(col);
        if (observed.values.empty()) continue;

        const NumVec& values = observed.values;
        OutlierColumnSummary s;
        s.column = col.name;
        s.count = values.size();
        s.mean = CommonUtils::mean(values);
        s.stddev = values.size() > 1 ? CommonUtils::sampleStddev(values) : std::nan("");
        s.min = *std::min_element(values.begin(), values.end());
        s.max = *std::max_element(values.begin(), values.end());
        s.q1 = CommonUtils::quantileByNth(values, 0.25);
        s.q3 = CommonUtils::quantileByNth(values, 0.75);
        s.iqr = s.q3 - s.q1;

        const std::vector<bool> zFlags = zscoreFlags(values, config.outlierThreshold);
        const std::vector<bool> qFlags = iqrFlags(values, config.iqrMultiplier);
        s.zscoreOutliers = static_cast<size_t>(std::count(zFlags.begin(), zFlags.end(), true));
        s.iqrOutliers = static_cast<size_t>(std::count(qFlags.begin(), qFlags.end(), true));
        for (size_t i = 0; i < values.size() && s.zscoreOutlierValues.size() < kSummaryOutlierValues; ++i) {
            if (zFlags[i]) s.zscoreOutlierValues.push_back(values[i]);
        }
        summary.push_back(std::move(s));
    }
    return summary;
}
