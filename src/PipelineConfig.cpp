#include "PipelineConfig.h"
#include "CommonUtils.h"
#include "CuratorExceptions.h"
#include <algorithm>
#include <fstream>
#include <limits>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Curator::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Curator::CuratorException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Curator::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

// Accepts `a, b`, `[a, b]` and `["a", "b"]`.
std::vector<std::string> parseList(const std::string& raw) {
    std::string value = CommonUtils::trim(raw);
    if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
        value = value.substr(1, value.size() - 2);
    }
    std::vector<std::string> out;
    for (const auto& item : CommonUtils::splitList(value)) {
        std::string unquoted = maybeUnquote(item);
        if (!unquoted.empty()) out.push_back(std::move(unquoted));
    }
    return out;
}

size_t parseSizeStrict(const std::string& value, const std::string& key, unsigned long minValue) {
    const unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (!value.empty() && value.front() == '-') {
        throw Curator::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    if (parsed < minValue) {
        throw Curator::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Curator::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Curator::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw Curator::ConfigurationException("delimiter expects a single character");
    return value[0];
}

void assignKeyValue(PipelineConfig& config, const std::string& key, const std::string& value) {
    CleaningConfig& c = config.cleaning;
    TransformConfig& t = config.transform;

    if (key == "dataset" || key == "dataset_path") { config.datasetPath = value; return; }
    if (key == "delimiter") { config.delimiter = parseDelimiter(value); return; }
    if (key == "datetime_locale_hint") { config.datetimeLocaleHint = CommonUtils::toLower(value); return; }
    if (key == "preset") { config.preset = CommonUtils::toLower(value); return; }
    if (key == "target_column" || key == "target") { config.targetColumn = value; return; }
    if (key == "run_validation") { config.runValidation = parseBoolStrict(value, key); return; }
    if (key == "run_cleaning") { config.runCleaning = parseBoolStrict(value, key); return; }
    if (key == "run_transform") { config.runTransform = parseBoolStrict(value, key); return; }
    if (key == "output") { config.outputPath = value; return; }
    if (key == "report") { config.reportPath = value; return; }
    if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
        c.verbose = config.verbose;
        t.verbose = config.verbose;
        return;
    }

    if (key == "remove_duplicates") { c.removeDuplicates = parseBoolStrict(value, key); return; }
    if (key == "duplicate_subset") { c.duplicateSubset = parseList(value); return; }
    if (key == "keep_duplicate") { c.keepDuplicate = parseDuplicateKeep(value); return; }
    if (key == "handle_nulls") { c.handleNulls = parseBoolStrict(value, key); return; }
    if (key == "null_strategy") { c.nullStrategy = parseNullStrategy(value); return; }
    if (key == "null_threshold") { c.nullThreshold = parseDoubleStrict(value, key, 0.0); return; }
    if (key == "required_columns") { c.requiredColumns = parseList(value); return; }
    if (key == "detect_outliers") { c.detectOutliers = parseBoolStrict(value, key); return; }
    if (key == "outlier_method") { c.outlierMethod = parseOutlierMethod(value); return; }
    if (key == "outlier_threshold") { c.outlierThreshold = parseDoubleStrict(value, key, 0.0); return; }
    if (key == "iqr_multiplier") { c.iqrMultiplier = parseDoubleStrict(value, key, 0.0); return; }
    if (key == "remove_outliers") { c.removeOutliers = parseBoolStrict(value, key); return; }
    if (key == "normalize_text") { c.normalizeText = parseBoolStrict(value, key); return; }
    if (key == "strip_whitespace") { c.stripWhitespace = parseBoolStrict(value, key); return; }
    if (key == "lowercase_text") { c.lowercaseText = parseBoolStrict(value, key); return; }
    if (key == "min_retention_rate") { c.minRetentionRate = parseDoubleStrict(value, key, 0.0); return; }

    if (key == "scaling_method") { t.scalingMethod = parseScalingMethod(value); return; }
    if (key == "scaling_columns") { t.scalingColumns = parseList(value); return; }
    if (key == "encoding_method") { t.encodingMethod = parseEncodingMethod(value); return; }
    if (key == "encoding_columns") { t.encodingColumns = parseList(value); return; }
    if (key == "max_categories") { t.maxCategories = parseSizeStrict(value, key, 1); return; }
    if (key == "extract_date_features") { t.extractDateFeatures = parseBoolStrict(value, key); return; }
    if (key == "date_columns") { t.dateColumns = parseList(value); return; }
    if (key == "date_features") {
        t.dateFeatures = parseList(value);
        for (auto& f : t.dateFeatures) f = CommonUtils::toLower(f);
        return;
    }
    if (key == "handle_infinity") { t.handleInfinity = parseBoolStrict(value, key); return; }
    if (key == "infinity_replacement") {
        const std::string v = CommonUtils::toLower(value);
        if (v.empty() || v == "null" || v == "none" || v == "nan") {
            t.infinityReplacement.reset();
        } else {
            t.infinityReplacement = parseDoubleStrict(value, key, std::numeric_limits<double>::lowest());
        }
        return;
    }
}
} // namespace

std::string PipelineConfig::usage() {
    return "Usage: curator <dataset.csv> [--config path] [--preset sales|purchases|products|none] "
           "[--target col] [--delimiter ,] "
           "[--null-strategy drop|fill_zero|fill_mean|fill_median|fill_mode|fill_forward|fill_backward|fill_interpolate] "
           "[--outlier-method zscore|iqr] [--remove-outliers] "
           "[--scaling none|minmax|standard|robust|maxabs|log|sqrt] "
           "[--encoding label|onehot|ordinal|frequency|target] "
           "[--skip-validation] [--skip-cleaning] [--skip-transform] "
           "[--output results.json] [--report report.md] [--verbose] [--help]";
}

PipelineConfig PipelineConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
        throw Curator::ConfigurationException(usage());
    }

    PipelineConfig config;
    config.datasetPath = argv[1];

    // The config file is applied first so explicit flags win over it.
    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw Curator::ConfigurationException("--config expects a path");
            configPath = argv[i + 1];
        }
    }
    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        config.datasetPath = argv[1];
    }

    auto needValue = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw Curator::ConfigurationException(flag + " expects a value");
        return argv[++i];
    };

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
        } else if (arg == "--preset") {
            config.preset = CommonUtils::toLower(needValue(i, arg));
        } else if (arg == "--target") {
            config.targetColumn = needValue(i, arg);
        } else if (arg == "--delimiter") {
            config.delimiter = parseDelimiter(needValue(i, arg));
        } else if (arg == "--null-strategy") {
            config.cleaning.nullStrategy = parseNullStrategy(needValue(i, arg));
        } else if (arg == "--outlier-method") {
            config.cleaning.outlierMethod = parseOutlierMethod(needValue(i, arg));
        } else if (arg == "--remove-outliers") {
            config.cleaning.removeOutliers = true;
        } else if (arg == "--scaling") {
            config.transform.scalingMethod = parseScalingMethod(needValue(i, arg));
        } else if (arg == "--encoding") {
            config.transform.encodingMethod = parseEncodingMethod(needValue(i, arg));
        } else if (arg == "--skip-validation") {
            config.runValidation = false;
        } else if (arg == "--skip-cleaning") {
            config.runCleaning = false;
        } else if (arg == "--skip-transform") {
            config.runTransform = false;
        } else if (arg == "--output") {
            config.outputPath = needValue(i, arg);
        } else if (arg == "--report") {
            config.reportPath = needValue(i, arg);
        } else if (arg == "--verbose") {
            config.verbose = true;
            config.cleaning.verbose = true;
            config.transform.verbose = true;
        } else {
            throw Curator::ConfigurationException("Unknown argument: " + arg + "\n" + usage());
        }
    }

    config.validate();
    return config;
}

PipelineConfig PipelineConfig::fromFile(const std::string& configPath, const PipelineConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Curator::ConfigurationException("Could not open config file: " + configPath);

    PipelineConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Curator::CuratorException& ex) {
            throw Curator::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void PipelineConfig::validate() const {
    if (datasetPath.empty()) {
        throw Curator::ConfigurationException("dataset path is required");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(preset, {"none", "sales", "purchases", "products"})) {
        throw Curator::ConfigurationException("preset must be one of: none, sales, purchases, products");
    }
    if (!isIn(datetimeLocaleHint, {"auto", "dmy", "mdy"})) {
        throw Curator::ConfigurationException("datetime_locale_hint must be one of: auto, dmy, mdy");
    }
    if (transform.encodingMethod == EncodingMethod::TARGET && targetColumn.empty()) {
        throw Curator::ConfigurationException("target encoding requires target_column");
    }

    cleaning.validate();
    transform.validate();
}
