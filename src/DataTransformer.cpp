#include "DataTransformer.h"
#include "CommonUtils.h"
#include "CuratorExceptions.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <unordered_map>
#include <unordered_set>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;
using TimeVec = std::vector<int64_t>;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr size_t kDateSniffValues = 10;

class StageLog {
public:
    StageLog(const TransformConfig& config, TransformResult* result) : config_(config), result_(result) {}

    void info(const std::string& msg) const {
        if (config_.verbose) std::cout << "[Curator][Transform] " << msg << "\n";
    }

    void warn(const std::string& msg) const {
        std::cerr << "[Curator][Transform] Warning: " << msg << "\n";
        if (result_) result_->warnings.push_back(msg);
    }

    void applied(const std::string& step) const {
        if (result_) result_->transformationsApplied.push_back(step);
    }

    TransformResult* result() const { return result_; }

private:
    const TransformConfig& config_;
    TransformResult* result_;
};

// Adds the column, or replaces a same-named one in place.
void putColumn(TypedDataset& data, TypedColumn column) {
    const int idx = data.findColumnIndex(column.name);
    if (idx >= 0) {
        data.replaceColumn(static_cast<size_t>(idx), std::move(column));
    } else {
        data.addColumn(std::move(column));
    }
}

size_t requireColumn(const TypedDataset& data, const std::string& name) {
    const int idx = data.findColumnIndex(name);
    if (idx < 0) throw Curator::DatasetException("Column not found: " + name);
    return static_cast<size_t>(idx);
}

void replaceInfinity(TypedDataset& data, const TransformConfig& config) {
    const bool toNull = !config.infinityReplacement || std::isnan(*config.infinityReplacement);
    for (auto& col : data.columns()) {
        if (col.type != ColumnType::NUMERIC) continue;
        auto& values = std::get<NumVec>(col.values);
        for (size_t i = 0; i < values.size(); ++i) {
            if (col.missing[i] || !std::isinf(values[i])) continue;
            if (toNull) {
                values[i] = kNaN;
                col.missing[i] = static_cast<uint8_t>(1);
            } else {
                values[i] = *config.infinityReplacement;
            }
        }
    }
}

// ---------------------------------------------------------------------------
// Date features
// ---------------------------------------------------------------------------

int64_t dayNumber(int64_t unixSeconds) {
    int64_t q = unixSeconds / 86400;
    if (unixSeconds % 86400 < 0) --q;
    return q;
}

int daysInMonth(int year, unsigned month) {
    const int64_t first = TypedDataset::daysFromCivil(year, month, 1);
    const int64_t next = month == 12 ? TypedDataset::daysFromCivil(year + 1, 1, 1)
                                     : TypedDataset::daysFromCivil(year, month + 1, 1);
    return static_cast<int>(next - first);
}

int isoWeek(int64_t unixSeconds) {
    const CivilTime t = TypedDataset::civilFromUnixSeconds(unixSeconds);
    const int64_t thursday = dayNumber(unixSeconds) - t.dayOfWeek + 3;
    const int isoYear = TypedDataset::civilFromUnixSeconds(thursday * 86400).year;
    const int64_t jan1 = TypedDataset::daysFromCivil(isoYear, 1, 1);
    return static_cast<int>((thursday - jan1) / 7 + 1);
}

bool dateFeatureValue(const std::string& feature, int64_t ts, double& out) {
    const CivilTime t = TypedDataset::civilFromUnixSeconds(ts);
    if (feature == "year") out = t.year;
    else if (feature == "month") out = t.month;
    else if (feature == "day") out = t.day;
    else if (feature == "dayofweek") out = t.dayOfWeek;
    else if (feature == "quarter") out = (t.month - 1) / 3 + 1;
    else if (feature == "weekofyear") out = isoWeek(ts);
    else if (feature == "hour") out = t.hour;
    else if (feature == "is_weekend") out = t.dayOfWeek >= 5 ? 1.0 : 0.0;
    else if (feature == "is_month_start") out = t.day == 1 ? 1.0 : 0.0;
    else if (feature == "is_month_end") out = static_cast<int>(t.day) == daysInMonth(t.year, t.month) ? 1.0 : 0.0;
    else return false;
    return true;
}

bool looksLikeDates(const TypedDataset& data, const TypedColumn& col) {
    const auto& values = std::get<StrVec>(col.values);
    size_t checked = 0;
    for (size_t i = 0; i < values.size() && checked < kDateSniffValues; ++i) {
        if (col.isMissing(i)) continue;
        int64_t parsed = 0;
        if (!data.parseDateTime(values[i], parsed)) return false;
        ++checked;
    }
    return checked > 0;
}

std::vector<std::string> detectDateColumns(const TypedDataset& data, const TransformConfig& config) {
    if (!config.dateColumns.empty()) return config.dateColumns;

    std::vector<std::string> out;
    for (const auto& col : data.columns()) {
        if (col.type == ColumnType::DATETIME) {
            out.push_back(col.name);
        } else if (col.type == ColumnType::CATEGORICAL && looksLikeDates(data, col)) {
            out.push_back(col.name);
        }
    }
    return out;
}

void convertToDatetime(TypedDataset& data, size_t idx) {
    const TypedColumn& col = data.columns()[idx];
    if (col.type == ColumnType::DATETIME) return;
    if (col.type != ColumnType::CATEGORICAL) {
        throw Curator::DatasetException("Column '" + col.name + "' is " + columnTypeName(col.type) +
                                        " and cannot be read as dates");
    }

    const auto& text = std::get<StrVec>(col.values);
    TimeVec values(text.size(), 0);
    MissingMask missing(text.size(), static_cast<uint8_t>(0));
    for (size_t i = 0; i < text.size(); ++i) {
        if (col.isMissing(i) || !data.parseDateTime(text[i], values[i])) {
            values[i] = 0;
            missing[i] = static_cast<uint8_t>(1);
        }
    }
    data.replaceColumn(idx, TypedColumn::datetime(col.name, std::move(values), std::move(missing)));
}

void extractDateFeatures(TypedDataset& data,
                         const std::vector<std::string>& dateColumns,
                         const TransformConfig& config,
                         const StageLog& log) {
    for (const auto& name : dateColumns) {
        if (!data.hasColumn(name)) continue;
        try {
            convertToDatetime(data, requireColumn(data, name));

            const auto& supported = DataTransformer::supportedDateFeatures();
            for (const auto& feature : config.dateFeatures) {
                if (std::find(supported.begin(), supported.end(), feature) == supported.end()) continue;

                const TypedColumn& col = data.column(name);
                const auto& stamps = std::get<TimeVec>(col.values);
                NumVec values(stamps.size(), kNaN);
                MissingMask missing(stamps.size(), static_cast<uint8_t>(1));
                for (size_t i = 0; i < stamps.size(); ++i) {
                    if (col.isMissing(i)) continue;
                    if (dateFeatureValue(feature, stamps[i], values[i])) missing[i] = static_cast<uint8_t>(0);
                }
                putColumn(data, TypedColumn::numeric(name + "_" + feature, std::move(values), std::move(missing)));
            }

            if (log.result()) log.result()->dateColumns.push_back(name);
            log.applied("date_features_" + name);
        } catch (const std::exception& ex) {
            log.warn("Date feature extraction failed for '" + name + "': " + ex.what());
        }
    }
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

StrVec cellKeys(const TypedDataset& data, size_t idx) {
    StrVec keys(data.rowCount());
    for (size_t r = 0; r < keys.size(); ++r) keys[r] = data.cellText(idx, r);
    return keys;
}

StrVec distinctFirstSeen(const StrVec& keys, const MissingMask& missing) {
    StrVec out;
    std::unordered_set<std::string> seen;
    for (size_t r = 0; r < keys.size(); ++r) {
        if (missing[r]) continue;
        if (seen.insert(keys[r]).second) out.push_back(keys[r]);
    }
    return out;
}

EncodingMap fitCodesInOrder(EncodingMethod method, const StrVec& categories) {
    EncodingMap map;
    map.method = method;
    for (size_t i = 0; i < categories.size(); ++i) {
        map.codes.emplace_back(categories[i], static_cast<double>(i));
    }
    return map;
}

EncodingMap fitFrequency(const StrVec& keys, const MissingMask& missing) {
    const StrVec categories = distinctFirstSeen(keys, missing);
    std::unordered_map<std::string, size_t> counts;
    size_t total = 0;
    for (size_t r = 0; r < keys.size(); ++r) {
        if (missing[r]) continue;
        ++counts[keys[r]];
        ++total;
    }

    EncodingMap map;
    map.method = EncodingMethod::FREQUENCY;
    for (const auto& cat : categories) {
        map.codes.emplace_back(cat, static_cast<double>(counts[cat]) / static_cast<double>(total));
    }
    std::stable_sort(map.codes.begin(), map.codes.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return map;
}

EncodingMap fitTarget(const TypedDataset& data, const StrVec& keys, const MissingMask& missing, const std::string& target) {
    const TypedColumn& targetCol = data.column(target);
    if (targetCol.type != ColumnType::NUMERIC && targetCol.type != ColumnType::BOOLEAN) {
        throw Curator::DatasetException("Target column '" + target + "' is not numeric");
    }
    const auto& y = std::get<NumVec>(targetCol.values);

    std::unordered_map<std::string, std::pair<long double, size_t>> sums;
    for (size_t r = 0; r < keys.size(); ++r) {
        if (missing[r] || targetCol.isMissing(r)) continue;
        auto& acc = sums[keys[r]];
        acc.first += y[r];
        acc.second += 1;
    }

    EncodingMap map;
    map.method = EncodingMethod::TARGET;
    for (const auto& cat : distinctFirstSeen(keys, missing)) {
        const auto it = sums.find(cat);
        if (it == sums.end()) continue;
        map.codes.emplace_back(cat, static_cast<double>(it->second.first / static_cast<long double>(it->second.second)));
    }
    return map;
}

void applyCodes(TypedDataset& data, size_t idx, const EncodingMap& map) {
    const TypedColumn& col = data.columns()[idx];
    const StrVec keys = cellKeys(data, idx);
    NumVec values(keys.size(), kNaN);
    MissingMask missing(keys.size(), static_cast<uint8_t>(1));
    for (size_t r = 0; r < keys.size(); ++r) {
        if (col.isMissing(r)) continue;
        if (const auto code = map.lookup(keys[r])) {
            values[r] = *code;
            missing[r] = static_cast<uint8_t>(0);
        }
    }
    data.replaceColumn(idx, TypedColumn::numeric(col.name, std::move(values), std::move(missing)));
}

void applyOneHot(TypedDataset& data, size_t idx, const EncodingMap& map) {
    const std::string name = data.columns()[idx].name;
    const MissingMask sourceMissing = data.columns()[idx].missing;
    const StrVec keys = cellKeys(data, idx);
    data.removeColumns({name});

    for (const auto& category : map.categories) {
        NumVec values(keys.size(), 0.0);
        for (size_t r = 0; r < keys.size(); ++r) {
            if (!sourceMissing[r] && keys[r] == category) values[r] = 1.0;
        }
        putColumn(data, TypedColumn::boolean(name + "_" + category, std::move(values),
                                             MissingMask(keys.size(), static_cast<uint8_t>(0))));
    }
}

// First indicator name that would replace a column already in the table, or empty.
std::string oneHotCollision(const TypedDataset& data, const std::string& column, const StrVec& categories) {
    for (const auto& category : categories) {
        const std::string indicator = column + "_" + category;
        if (data.hasColumn(indicator)) return indicator;
    }
    return "";
}

void applyEncoding(TypedDataset& data, size_t idx, const EncodingMap& map) {
    if (map.method == EncodingMethod::ONEHOT) {
        applyOneHot(data, idx, map);
    } else {
        applyCodes(data, idx, map);
    }
}

void encodeCategorical(TypedDataset& data,
                       const TransformConfig& config,
                       const std::optional<std::string>& target,
                       TransformResult& result,
                       const StageLog& log) {
    std::vector<std::string> columns = config.encodingColumns;
    if (columns.empty()) {
        for (size_t idx : data.categoricalColumnIndices()) columns.push_back(data.columns()[idx].name);
    }
    if (target) {
        columns.erase(std::remove(columns.begin(), columns.end(), *target), columns.end());
    }

    const EncodingMethod method = config.encodingMethod;
    for (const auto& name : columns) {
        if (!data.hasColumn(name)) continue;
        if (method == EncodingMethod::TARGET && !target) continue;

        try {
            const size_t idx = requireColumn(data, name);
            const StrVec keys = cellKeys(data, idx);
            const MissingMask missing = data.columns()[idx].missing;

            EncodingMap map;
            switch (method) {
                case EncodingMethod::LABEL:
                    map = fitCodesInOrder(EncodingMethod::LABEL, distinctFirstSeen(keys, missing));
                    break;
                case EncodingMethod::ORDINAL: {
                    StrVec sorted = distinctFirstSeen(keys, missing);
                    std::sort(sorted.begin(), sorted.end());
                    map = fitCodesInOrder(EncodingMethod::ORDINAL, sorted);
                    break;
                }
                case EncodingMethod::ONEHOT: {
                    StrVec categories = distinctFirstSeen(keys, missing);
                    if (categories.size() > config.maxCategories) {
                        log.warn("Column '" + name + "' has " + std::to_string(categories.size()) +
                                 " categories, using label encoding instead");
                        map = fitCodesInOrder(EncodingMethod::LABEL, categories);
                        break;
                    }
                    const std::string clash = oneHotCollision(data, name, categories);
                    if (!clash.empty()) {
                        log.warn("One-hot column '" + clash + "' already exists, using label encoding for '" +
                                 name + "' instead");
                        map = fitCodesInOrder(EncodingMethod::LABEL, categories);
                        break;
                    }
                    std::sort(categories.begin(), categories.end());
                    map.method = EncodingMethod::ONEHOT;
                    map.categories = std::move(categories);
                    break;
                }
                case EncodingMethod::FREQUENCY:
                    map = fitFrequency(keys, missing);
                    break;
                case EncodingMethod::TARGET:
                    map = fitTarget(data, keys, missing, *target);
                    break;
            }

            applyEncoding(data, idx, map);
            result.encodingMaps.emplace_back(name, std::move(map));
            log.applied("encode_" + name);
        } catch (const std::exception& ex) {
            log.warn("Encoding failed for '" + name + "': " + ex.what());
        }
    }
}

// ---------------------------------------------------------------------------
// Scaling
// ---------------------------------------------------------------------------

bool isDegenerate(const ScalingParams& p) {
    switch (p.method) {
        case ScalingMethod::MINMAX: return p.max - p.min == 0.0;
        case ScalingMethod::STANDARD: return p.stddev == 0.0 || std::isnan(p.stddev);
        case ScalingMethod::ROBUST: return p.q3 - p.q1 == 0.0;
        case ScalingMethod::MAXABS: return p.maxAbs == 0.0;
        default: return false;
    }
}

double applyScaling(double x, const ScalingParams& p) {
    if (isDegenerate(p)) return 0.0;
    switch (p.method) {
        case ScalingMethod::MINMAX: return (x - p.min) / (p.max - p.min);
        case ScalingMethod::STANDARD: return (x - p.mean) / p.stddev;
        case ScalingMethod::ROBUST: return (x - p.median) / (p.q3 - p.q1);
        case ScalingMethod::MAXABS: return x / p.maxAbs;
        case ScalingMethod::LOG: return std::log1p(std::max(x, 0.0));
        case ScalingMethod::SQRT: return std::sqrt(std::max(x, 0.0));
        case ScalingMethod::NONE: break;
    }
    return x;
}

double invertScaling(double y, const ScalingParams& p) {
    switch (p.method) {
        case ScalingMethod::MINMAX: return y * (p.max - p.min) + p.min;
        case ScalingMethod::STANDARD: return y * p.stddev + p.mean;
        case ScalingMethod::ROBUST: return y * (p.q3 - p.q1) + p.median;
        case ScalingMethod::MAXABS: return y * p.maxAbs;
        case ScalingMethod::LOG: return std::expm1(y);
        case ScalingMethod::SQRT: return y * y;
        case ScalingMethod::NONE: break;
    }
    return y;
}

ScalingParams fitScaling(const NumVec& observed, ScalingMethod method) {
    ScalingParams p;
    p.method = method;
    switch (method) {
        case ScalingMethod::MINMAX:
            p.min = *std::min_element(observed.begin(), observed.end());
            p.max = *std::max_element(observed.begin(), observed.end());
            break;
        case ScalingMethod::STANDARD:
            p.mean = CommonUtils::mean(observed);
            p.stddev = CommonUtils::sampleStddev(observed);
            break;
        case ScalingMethod::ROBUST:
            p.median = CommonUtils::medianByNth(observed);
            p.q1 = CommonUtils::quantileByNth(observed, 0.25);
            p.q3 = CommonUtils::quantileByNth(observed, 0.75);
            break;
        case ScalingMethod::MAXABS:
            for (double v : observed) p.maxAbs = std::max(p.maxAbs, std::abs(v));
            break;
        default:
            break;
    }
    return p;
}

void scaleValues(TypedColumn& col, const ScalingParams& params) {
    auto& values = std::get<NumVec>(col.values);
    for (size_t i = 0; i < values.size(); ++i) {
        if (!col.missing[i]) values[i] = applyScaling(values[i], params);
    }
}

struct ScaledColumn {
    std::string name;
    bool observed = false;
    std::string error;
    ScalingParams params;
};

ScaledColumn fitColumnScaling(const TypedDataset& data, const std::string& name, ScalingMethod method) {
    ScaledColumn out;
    out.name = name;
    const int idx = data.findColumnIndex(name);
    if (idx < 0) {
        out.error = "column not found";
        return out;
    }
    const TypedColumn& col = data.columns()[static_cast<size_t>(idx)];
    if (col.type != ColumnType::NUMERIC) {
        out.error = std::string("column is ") + columnTypeName(col.type) + ", not numeric";
        return out;
    }

    const auto& values = std::get<NumVec>(col.values);
    NumVec observed;
    observed.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!col.missing[i] && std::isfinite(values[i])) observed.push_back(values[i]);
    }
    if (observed.empty()) return out;

    out.observed = true;
    out.params = fitScaling(observed, method);
    return out;
}

void scaleNumeric(TypedDataset& data, const TransformConfig& config, TransformResult& result, const StageLog& log) {
    if (config.scalingMethod == ScalingMethod::NONE) return;

    std::vector<std::string> columns;
    if (config.scalingColumns.empty()) {
        for (size_t idx : data.numericColumnIndices()) columns.push_back(data.columns()[idx].name);
    } else {
        for (const auto& name : config.scalingColumns) {
            if (data.hasColumn(name)) columns.push_back(name);
        }
    }

    std::vector<ScaledColumn> fitted(columns.size());
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t pos = 0; pos < columns.size(); ++pos) {
        fitted[pos] = fitColumnScaling(data, columns[pos], config.scalingMethod);
    }

    for (auto& f : fitted) {
        if (!f.error.empty()) {
            log.warn("Scaling failed for '" + f.name + "': " + f.error);
            continue;
        }
        if (!f.observed) {
            log.warn("Column '" + f.name + "' has no observed values; scaling skipped");
            continue;
        }
        scaleValues(data.column(f.name), f.params);
        result.scalingParams.emplace_back(f.name, f.params);
        log.applied("scale_" + f.name);
    }
}
} // namespace

const char* scalingMethodName(ScalingMethod method) noexcept {
    switch (method) {
        case ScalingMethod::NONE: return "none";
        case ScalingMethod::MINMAX: return "minmax";
        case ScalingMethod::STANDARD: return "standard";
        case ScalingMethod::ROBUST: return "robust";
        case ScalingMethod::MAXABS: return "maxabs";
        case ScalingMethod::LOG: return "log";
        case ScalingMethod::SQRT: return "sqrt";
    }
    return "none";
}

const char* encodingMethodName(EncodingMethod method) noexcept {
    switch (method) {
        case EncodingMethod::LABEL: return "label";
        case EncodingMethod::ONEHOT: return "onehot";
        case EncodingMethod::ORDINAL: return "ordinal";
        case EncodingMethod::FREQUENCY: return "frequency";
        case EncodingMethod::TARGET: return "target";
    }
    return "label";
}

ScalingMethod parseScalingMethod(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    for (ScalingMethod m : {ScalingMethod::NONE, ScalingMethod::MINMAX, ScalingMethod::STANDARD, ScalingMethod::ROBUST,
                            ScalingMethod::MAXABS, ScalingMethod::LOG, ScalingMethod::SQRT}) {
        if (n == scalingMethodName(m)) return m;
    }
    throw Curator::ConfigurationException("Unknown scaling method: " + name);
}

EncodingMethod parseEncodingMethod(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    for (EncodingMethod m : {EncodingMethod::LABEL, EncodingMethod::ONEHOT, EncodingMethod::ORDINAL,
                             EncodingMethod::FREQUENCY, EncodingMethod::TARGET}) {
        if (n == encodingMethodName(m)) return m;
    }
    throw Curator::ConfigurationException("Unknown encoding method: " + name);
}

std::optional<double> EncodingMap::lookup(const std::string& category) const {
    for (const auto& kv : codes) {
        if (kv.first == category) return kv.second;
    }
    return std::nullopt;
}

void TransformConfig::validate() const {
    if (maxCategories == 0) {
        throw Curator::ConfigurationException("max_categories must be > 0");
    }
    const auto& supported = DataTransformer::supportedDateFeatures();
    for (const auto& feature : dateFeatures) {
        if (std::find(supported.begin(), supported.end(), feature) == supported.end()) {
            throw Curator::ConfigurationException("Unknown date feature: " + feature);
        }
    }
}

const ScalingParams* TransformResult::findScaling(const std::string& column) const {
    for (const auto& kv : scalingParams) {
        if (kv.first == column) return &kv.second;
    }
    return nullptr;
}

const EncodingMap* TransformResult::findEncoding(const std::string& column) const {
    for (const auto& kv : encodingMaps) {
        if (kv.first == column) return &kv.second;
    }
    return nullptr;
}

const std::vector<std::string>& DataTransformer::supportedDateFeatures() {
    static const std::vector<std::string> kFeatures = {
        "year", "month", "day", "dayofweek", "quarter",
        "weekofyear", "hour", "is_weekend", "is_month_start", "is_month_end"};
    return kFeatures;
}

TransformOutcome DataTransformer::fitTransform(const TypedDataset& data,
                                               const TransformConfig& config,
                                               const std::optional<std::string>& targetColumn) {
    config.validate();

    TransformOutcome out{data, TransformResult{}};
    TypedDataset& table = out.data;
    TransformResult& result = out.result;
    const StageLog log(config, &result);
    result.originalColumns = data.columnNames();

    if (config.handleInfinity) {
        replaceInfinity(table, config);
    }

    if (config.extractDateFeatures) {
        extractDateFeatures(table, detectDateColumns(table, config), config, log);
    }

    encodeCategorical(table, config, targetColumn, result, log);
    scaleNumeric(table, config, result, log);

    result.transformedColumns = table.columnNames();
    const std::unordered_set<std::string> before(result.originalColumns.begin(), result.originalColumns.end());
    const std::unordered_set<std::string> after(result.transformedColumns.begin(), result.transformedColumns.end());
    for (const auto& name : result.transformedColumns) {
        if (!before.count(name)) result.newColumns.push_back(name);
    }
    for (const auto& name : result.originalColumns) {
        if (!after.count(name)) result.removedColumns.push_back(name);
    }
    result.fitted = true;

    log.info("Transform complete: " + std::to_string(result.originalColumns.size()) + " -> " +
             std::to_string(result.transformedColumns.size()) + " columns");
    return out;
}

TypedDataset DataTransformer::transform(const TypedDataset& data,
                                        const TransformConfig& config,
                                        const TransformResult& fitted) {
    if (!fitted.fitted) {
        throw Curator::TransformException("Transformer has not been fitted; call fitTransform first");
    }

    TypedDataset table = data;
    const StageLog log(config, nullptr);

    if (config.handleInfinity) {
        replaceInfinity(table, config);
    }

    if (config.extractDateFeatures) {
        extractDateFeatures(table, fitted.dateColumns, config, log);
    }

    for (const auto& [name, map] : fitted.encodingMaps) {
        const int idx = table.findColumnIndex(name);
        if (idx < 0) continue;
        if (map.method == EncodingMethod::ONEHOT) {
            const std::string clash = oneHotCollision(table, name, map.categories);
            if (!clash.empty()) {
                log.warn("One-hot column '" + clash + "' already exists; encoding of '" + name + "' skipped");
                continue;
            }
        }
        applyEncoding(table, static_cast<size_t>(idx), map);
    }

    for (const auto& [name, params] : fitted.scalingParams) {
        const int idx = table.findColumnIndex(name);
        if (idx < 0) continue;
        TypedColumn& col = table.columns()[static_cast<size_t>(idx)];
        if (col.type != ColumnType::NUMERIC) {
            log.warn("Column '" + name + "' is no longer numeric; scaling skipped");
            continue;
        }
        scaleValues(col, params);
    }

    return table;
}

std::vector<double> DataTransformer::inverseTransformColumn(const std::vector<double>& values,
                                                            const std::string& column,
                                                            const TransformResult& fitted) {
    const ScalingParams* params = fitted.findScaling(column);
    if (!params) return values;

    std::vector<double> out(values.size());
    std::transform(values.begin(), values.end(), out.begin(),
                   [params](double y) { return invertScaling(y, *params); });
    return out;
}

TypedDataset DataTransformer::addTimeSeriesFeatures(const TypedDataset& data,
                                                    const std::string& dateColumn,
                                                    const std::string& valueColumn,
                                                    const std::vector<size_t>& lags,
                                                    const std::vector<size_t>& windows) {
    TypedDataset table = data;
    const size_t dateIdx = requireColumn(table, dateColumn);
    const size_t valueIdx = requireColumn(table, valueColumn);
    if (table.columns()[valueIdx].type != ColumnType::NUMERIC) {
        throw Curator::DatasetException("Value column '" + valueColumn + "' is not numeric");
    }

    convertToDatetime(table, dateIdx);
    {
        const TypedColumn& dates = table.columns()[dateIdx];
        const auto& stamps = std::get<TimeVec>(dates.values);
        std::vector<size_t> order(table.rowCount());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const bool ma = dates.isMissing(a);
            const bool mb = dates.isMissing(b);
            if (ma || mb) return !ma && mb;
            return stamps[a] < stamps[b];
        });
        table.reorderRows(order);
    }

    const TypedColumn& valueCol = table.columns()[valueIdx];
    const size_t n = valueCol.size();
    NumVec v(n, kNaN);
    for (size_t i = 0; i < n; ++i) {
        if (!valueCol.isMissing(i)) v[i] = std::get<NumVec>(valueCol.values)[i];
    }

    auto emit = [&](const std::string& suffix, NumVec values) {
        putColumn(table, TypedColumn::numeric(valueColumn + "_" + suffix, std::move(values)));
    };

    for (size_t lag : lags) {
        NumVec out(n, kNaN);
        for (size_t i = lag; i < n; ++i) out[i] = v[i - lag];
        emit("lag_" + std::to_string(lag), std::move(out));
    }

    for (size_t window : windows) {
        if (window == 0) throw Curator::DatasetException("Rolling window must be > 0");
        NumVec means(n, kNaN);
        NumVec stds(n, kNaN);
        for (size_t i = 0; i < n; ++i) {
            NumVec inWindow;
            const size_t start = i + 1 >= window ? i + 1 - window : 0;
            for (size_t k = start; k <= i; ++k) {
                if (!std::isnan(v[k])) inWindow.push_back(v[k]);
            }
            if (!inWindow.empty()) means[i] = CommonUtils::mean(inWindow);
            if (inWindow.size() >= 2) stds[i] = CommonUtils::sampleStddev(inWindow);
        }
        emit("rolling_mean_" + std::to_string(window), std::move(means));
        emit("rolling_std_" + std::to_string(window), std::move(stds));
    }

    for (size_t period : {static_cast<size_t>(1), static_cast<size_t>(7)}) {
        NumVec out(n, kNaN);
        for (size_t i = period; i < n; ++i) out[i] = v[i] - v[i - period];
        emit("diff_" + std::to_string(period), std::move(out));
    }

    for (size_t period : {static_cast<size_t>(1), static_cast<size_t>(7)}) {
        NumVec out(n, kNaN);
        for (size_t i = period; i < n; ++i) out[i] = v[i] / v[i - period] - 1.0;
        emit("pct_change_" + std::to_string(period), std::move(out));
    }

    return table;
}
