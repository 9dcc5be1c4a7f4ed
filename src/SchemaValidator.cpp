#include "SchemaValidator.h"
#include "CommonUtils.h"
#include "CuratorExceptions.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <regex>
#include <set>
#include <type_traits>
#include <unordered_map>

namespace {
using NumVec = std::vector<double>;

std::vector<std::string> acceptedTypes(const std::string& expected) {
    static const std::unordered_map<std::string, std::vector<std::string>> kTypeMapping = {
        {"string", {"string"}},
        {"integer", {"integer"}},
        {"float", {"float"}},
        {"numeric", {"integer", "float"}},
        {"date", {"datetime", "string"}},
        {"datetime", {"datetime"}},
        {"boolean", {"boolean"}},
    };
    auto it = kTypeMapping.find(expected);
    if (it != kTypeMapping.end()) return it->second;
    return {expected};
}

std::string boundText(const std::optional<double>& bound) {
    return bound ? CommonUtils::formatNumber(*bound) : std::string("none");
}

const TypedColumn* findColumn(const TypedDataset& data, const std::string& name) {
    const int idx = data.findColumnIndex(name);
    return idx < 0 ? nullptr : &data.columns()[static_cast<size_t>(idx)];
}

ValidationViolation makeViolation(const ValidationRule& rule, std::optional<std::string> column, std::string fallbackMessage) {
    ValidationViolation v;
    v.ruleName = rule.name;
    v.ruleType = rule.type();
    v.column = std::move(column);
    v.severity = rule.severity;
    v.message = rule.message.empty() ? std::move(fallbackMessage) : rule.message;
    return v;
}

void attachRows(ValidationViolation& v, const std::vector<size_t>& rows) {
    v.affectedRows = rows.size();
    const size_t keep = std::min(rows.size(), ValidationViolation::kMaxRowIndices);
    v.rowIndices.assign(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(keep));
}

void attachSamples(ValidationViolation& v, const TypedDataset& data, size_t colIdx, const std::vector<size_t>& rows) {
    for (size_t row : rows) {
        if (v.sampleValues.size() >= ValidationViolation::kMaxSamples) break;
        v.sampleValues.push_back(data.cellText(colIdx, row));
    }
}

struct RuleEvaluator {
    const TypedDataset& data;
    const ValidationRule& rule;
    // Rows referenced by the violation, before truncation.
    std::vector<size_t>& touched;

    std::optional<ValidationViolation> operator()(const RequiredRule& r) const {
        std::vector<std::string> absent;
        for (const auto& col : r.columns) {
            if (!data.hasColumn(col)) absent.push_back(col);
        }
        if (absent.empty()) return std::nullopt;

        std::string joined;
        for (size_t i = 0; i < absent.size(); ++i) {
            if (i) joined += ", ";
            joined += absent[i];
        }
        std::optional<std::string> column;
        if (r.columns.size() == 1) column = r.columns.front();
        return makeViolation(rule, column, "Required column '" + joined + "' not found");
    }

    std::optional<ValidationViolation> operator()(const TypeRule& r) const {
        const TypedColumn* col = findColumn(data, r.column);
        if (!col) return std::nullopt;

        const std::string actual = SchemaValidator::detectedTypeName(*col);
        const auto accepted = acceptedTypes(r.expectedType);
        if (std::find(accepted.begin(), accepted.end(), actual) != accepted.end()) return std::nullopt;

        const size_t colIdx = static_cast<size_t>(data.findColumnIndex(r.column));
        if (isCoercible(*col, colIdx, r.expectedType)) return std::nullopt;

        ValidationViolation v = makeViolation(rule, r.column,
                                              "Wrong type: expected " + r.expectedType + ", found " + actual);
        for (size_t row = 0; row < col->size() && row < ValidationViolation::kMaxSamples; ++row) {
            v.sampleValues.push_back(data.cellText(colIdx, row));
        }
        return v;
    }

    std::optional<ValidationViolation> operator()(const RangeRule& r) const {
        const TypedColumn* col = findColumn(data, r.column);
        if (!col) return std::nullopt;

        if (col->type != ColumnType::NUMERIC && col->type != ColumnType::BOOLEAN) {
            if (col->missingCount() == col->size()) return std::nullopt;
            throw Curator::DatasetException("Column '" + r.column + "' is " + columnTypeName(col->type) +
                                            " and cannot be compared against numeric bounds");
        }

        const auto& values = std::get<NumVec>(col->values);
        std::vector<size_t> rows;
        for (size_t i = 0; i < values.size(); ++i) {
            if (col->isMissing(i)) continue;
            const bool below = r.min && values[i] < *r.min;
            const bool above = r.max && values[i] > *r.max;
            if (below || above) rows.push_back(i);
        }
        if (rows.empty()) return std::nullopt;

        ValidationViolation v = makeViolation(rule, r.column,
                                              "Values of '" + r.column + "' out of range [" + boundText(r.min) + ", " + boundText(r.max) + "]");
        attachRows(v, rows);
        attachSamples(v, data, static_cast<size_t>(data.findColumnIndex(r.column)), rows);
        touched = std::move(rows);
        return v;
    }

    std::optional<ValidationViolation> operator()(const PatternRule& r) const {
        const TypedColumn* col = findColumn(data, r.column);
        if (!col) return std::nullopt;

        const std::regex re(r.pattern);
        const size_t colIdx = static_cast<size_t>(data.findColumnIndex(r.column));
        std::vector<size_t> rows;
        for (size_t i = 0; i < col->size(); ++i) {
            if (col->isMissing(i)) continue;
            const std::string text = data.cellText(colIdx, i);
            if (!std::regex_search(text, re, std::regex_constants::match_continuous)) rows.push_back(i);
        }
        if (rows.empty()) return std::nullopt;

        ValidationViolation v = makeViolation(rule, r.column, "Values of '" + r.column + "' do not match pattern");
        attachRows(v, rows);
        attachSamples(v, data, colIdx, rows);
        touched = std::move(rows);
        return v;
    }

    std::optional<ValidationViolation> operator()(const UniqueRule& r) const {
        const TypedColumn* col = findColumn(data, r.column);
        if (!col) return std::nullopt;

        const size_t colIdx = static_cast<size_t>(data.findColumnIndex(r.column));
        std::unordered_map<std::string, size_t> counts;
        std::vector<std::string> keys(col->size());
        for (size_t i = 0; i < col->size(); ++i) {
            if (col->isMissing(i)) continue;
            keys[i] = data.cellText(colIdx, i);
            ++counts[keys[i]];
        }

        std::vector<size_t> rows;
        std::vector<std::string> duplicated;
        std::set<std::string> seen;
        for (size_t i = 0; i < col->size(); ++i) {
            if (col->isMissing(i) || counts[keys[i]] < 2) continue;
            rows.push_back(i);
            if (seen.insert(keys[i]).second) duplicated.push_back(keys[i]);
        }
        if (rows.empty()) return std::nullopt;

        ValidationViolation v = makeViolation(rule, r.column, "Column '" + r.column + "' contains duplicate values");
        attachRows(v, rows);
        for (const auto& value : duplicated) {
            if (v.sampleValues.size() >= ValidationViolation::kMaxSamples) break;
            v.sampleValues.push_back(value);
        }
        touched = std::move(rows);
        return v;
    }

    std::optional<ValidationViolation> operator()(const CustomRule& r) const {
        if (!r.predicate) return std::nullopt;

        CustomCheck check = r.predicate(data);
        if (check.valid) return std::nullopt;

        ValidationViolation v = makeViolation(rule, std::nullopt, "");
        if (!check.message.empty()) v.message = check.message;
        attachRows(v, check.rowIndices);
        touched = std::move(check.rowIndices);
        return v;
    }

    bool isCoercible(const TypedColumn& col, size_t colIdx, const std::string& expected) const {
        const bool wantsNumber = expected == "numeric";
        const bool wantsDate = expected == "date" || expected == "datetime";
        if (!wantsNumber && !wantsDate) return false;

        for (size_t i = 0; i < col.size(); ++i) {
            if (col.isMissing(i)) continue;
            if (wantsNumber && col.type == ColumnType::NUMERIC) continue;
            if (wantsDate && col.type == ColumnType::DATETIME) continue;
            const std::string text = data.cellText(colIdx, i);
            if (wantsNumber) {
                double parsed = 0.0;
                if (!data.parseDouble(text, parsed)) return false;
            } else {
                int64_t parsed = 0;
                if (!data.parseDateTime(text, parsed)) return false;
            }
        }
        return true;
    }
};

std::optional<std::string> ruleColumn(const RuleSpec& spec) {
    return std::visit([](const auto& r) -> std::optional<std::string> {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, RequiredRule>) {
            if (r.columns.size() == 1) return r.columns.front();
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, CustomRule>) {
            return std::nullopt;
        } else {
            return r.column;
        }
    }, spec);
}
} // namespace

const char* severityName(Severity severity) noexcept {
    switch (severity) {
        case Severity::ERROR: return "error";
        case Severity::WARNING: return "warning";
        case Severity::INFO: return "info";
    }
    return "error";
}

const char* ruleTypeName(RuleType type) noexcept {
    switch (type) {
        case RuleType::REQUIRED: return "required";
        case RuleType::TYPE: return "type";
        case RuleType::RANGE: return "range";
        case RuleType::PATTERN: return "pattern";
        case RuleType::UNIQUE: return "unique";
        case RuleType::CUSTOM: return "custom";
    }
    return "custom";
}

RuleType ValidationRule::type() const noexcept {
    switch (spec.index()) {
        case 0: return RuleType::REQUIRED;
        case 1: return RuleType::TYPE;
        case 2: return RuleType::RANGE;
        case 3: return RuleType::PATTERN;
        case 4: return RuleType::UNIQUE;
        default: return RuleType::CUSTOM;
    }
}

std::string SchemaValidator::detectedTypeName(const TypedColumn& column) {
    switch (column.type) {
        case ColumnType::CATEGORICAL: return "string";
        case ColumnType::DATETIME: return "datetime";
        case ColumnType::BOOLEAN: return "boolean";
        case ColumnType::NUMERIC: break;
    }

    const auto& values = std::get<NumVec>(column.values);
    for (size_t i = 0; i < values.size(); ++i) {
        if (column.isMissing(i)) continue;
        if (!std::isfinite(values[i]) || std::floor(values[i]) != values[i]) return "float";
    }
    return "integer";
}

SchemaValidator& SchemaValidator::addRule(ValidationRule rule) {
    rules_.push_back(std::move(rule));
    return *this;
}

SchemaValidator& SchemaValidator::addRequiredColumns(const std::vector<std::string>& columns, Severity severity) {
    for (const auto& col : columns) {
        rules_.push_back({"required_" + col, RequiredRule{{col}}, severity,
                          "Required column '" + col + "' not found"});
    }
    return *this;
}

SchemaValidator& SchemaValidator::addTypeRule(const std::string& column, const std::string& expectedType, Severity severity) {
    rules_.push_back({"type_" + column, TypeRule{column, expectedType}, severity,
                      "Column '" + column + "' must be of type " + expectedType});
    return *this;
}

SchemaValidator& SchemaValidator::addRangeRule(const std::string& column,
                                               std::optional<double> min,
                                               std::optional<double> max,
                                               Severity severity) {
    rules_.push_back({"range_" + column, RangeRule{column, min, max}, severity,
                      "Values of '" + column + "' out of range [" + boundText(min) + ", " + boundText(max) + "]"});
    return *this;
}

SchemaValidator& SchemaValidator::addPatternRule(const std::string& column,
                                                 const std::string& pattern,
                                                 Severity severity,
                                                 const std::string& message) {
    rules_.push_back({"pattern_" + column, PatternRule{column, pattern}, severity,
                      message.empty() ? "Values of '" + column + "' do not match pattern" : message});
    return *this;
}

SchemaValidator& SchemaValidator::addUniqueRule(const std::string& column, Severity severity) {
    rules_.push_back({"unique_" + column, UniqueRule{column}, severity,
                      "Column '" + column + "' contains duplicate values"});
    return *this;
}

SchemaValidator& SchemaValidator::addCustomRule(const std::string& name,
                                                CustomPredicate predicate,
                                                Severity severity,
                                                const std::string& message) {
    rules_.push_back({name, CustomRule{std::move(predicate)}, severity, message});
    return *this;
}

ValidationResult SchemaValidator::validate(const TypedDataset& data) const {
    return validate(data, rules_);
}

ValidationResult SchemaValidator::validate(const TypedDataset& data, const std::vector<ValidationRule>& rules) {
    ValidationResult result;
    result.totalRows = data.rowCount();
    for (const auto& col : data.columns()) {
        result.columnTypes[col.name] = detectedTypeName(col);
    }

    std::set<size_t> invalidRows;
    for (const auto& rule : rules) {
        std::vector<size_t> touched;
        std::optional<ValidationViolation> violation;
        try {
            violation = std::visit(RuleEvaluator{data, rule, touched}, rule.spec);
        } catch (const std::exception& ex) {
            std::cerr << "[Curator][Validator] Rule '" << rule.name << "' failed: " << ex.what() << "\n";
            touched.clear();
            violation = makeViolation(rule, ruleColumn(rule.spec), "");
            violation->severity = Severity::ERROR;
            violation->message = std::string("Rule evaluation failed: ") + ex.what();
        } catch (...) {
            std::cerr << "[Curator][Validator] Rule '" << rule.name << "' failed with a non-standard exception\n";
            touched.clear();
            violation = makeViolation(rule, ruleColumn(rule.spec), "");
            violation->severity = Severity::ERROR;
            violation->message = "Rule evaluation failed: unknown error";
        }

        if (!violation) continue;
        invalidRows.insert(touched.begin(), touched.end());
        if (violation->severity == Severity::ERROR) {
            result.errors.push_back(*violation);
        } else if (violation->severity == Severity::WARNING) {
            result.warnings.push_back(*violation);
        }
        result.violations.push_back(std::move(*violation));
    }

    // Custom predicates may report indices past the end of the table.
    size_t inRange = 0;
    for (size_t row : invalidRows) {
        if (row < result.totalRows) ++inRange;
    }
    result.invalidRows = inRange;
    result.validRows = result.totalRows - result.invalidRows;
    result.isValid = result.errors.empty();

    result.summary.columnsValidated = data.colCount();
    result.summary.rulesApplied = rules.size();
    result.summary.rulesFailed = result.violations.size();
    result.summary.rulesPassed = rules.size() - result.violations.size();
    result.summary.validityRate = result.totalRows > 0
        ? static_cast<double>(result.validRows) / static_cast<double>(result.totalRows) * 100.0
        : 100.0;
    return result;
}

namespace CommonValidators {
SchemaValidator sales() {
    SchemaValidator v;
    v.addRequiredColumns({"fecha", "total"})
        .addTypeRule("fecha", "date")
        .addTypeRule("total", "numeric")
        .addRangeRule("total", 0.0, std::nullopt);
    return v;
}

SchemaValidator purchases() {
    SchemaValidator v;
    v.addRequiredColumns({"fecha", "total"})
        .addTypeRule("fecha", "date")
        .addTypeRule("total", "numeric")
        .addRangeRule("total", 0.0, std::nullopt);
    return v;
}

SchemaValidator products() {
    SchemaValidator v;
    v.addRequiredColumns({"sku", "nombre", "precio"})
        .addUniqueRule("sku")
        .addTypeRule("precio", "numeric")
        .addRangeRule("precio", 0.0, std::nullopt);
    return v;
}

std::optional<SchemaValidator> byName(const std::string& preset) {
    const std::string p = CommonUtils::toLower(CommonUtils::trim(preset));
    if (p == "sales") return sales();
    if (p == "purchases") return purchases();
    if (p == "products") return products();
    return std::nullopt;
}
}
