#pragma once
#include "TypedDataset.h"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class Severity { ERROR, WARNING, INFO };
enum class RuleType { REQUIRED, TYPE, RANGE, PATTERN, UNIQUE, CUSTOM };

const char* severityName(Severity severity) noexcept;
const char* ruleTypeName(RuleType type) noexcept;

struct CustomCheck {
    bool valid = true;
    std::vector<size_t> rowIndices;
    std::string message;
};

using CustomPredicate = std::function<CustomCheck(const TypedDataset&)>;

struct RequiredRule {
    std::vector<std::string> columns;
};

struct TypeRule {
    std::string column;
    std::string expectedType; // string|integer|float|numeric|date|datetime|boolean
};

struct RangeRule {
    std::string column;
    std::optional<double> min;
    std::optional<double> max;
};

struct PatternRule {
    std::string column;
    std::string pattern;
};

struct UniqueRule {
    std::string column;
};

struct CustomRule {
    CustomPredicate predicate;
};

using RuleSpec = std::variant<RequiredRule, TypeRule, RangeRule, PatternRule, UniqueRule, CustomRule>;

struct ValidationRule {
    std::string name;
    RuleSpec spec;
    Severity severity = Severity::ERROR;
    std::string message;

    RuleType type() const noexcept;
};

struct ValidationViolation {
    static constexpr size_t kMaxRowIndices = 100;
    static constexpr size_t kMaxSamples = 5;

    std::string ruleName;
    RuleType ruleType = RuleType::CUSTOM;
    std::optional<std::string> column;
    Severity severity = Severity::ERROR;
    std::string message;
    size_t affectedRows = 0;
    std::vector<size_t> rowIndices;
    std::vector<std::string> sampleValues;
};

struct ValidationSummary {
    size_t columnsValidated = 0;
    size_t rulesApplied = 0;
    size_t rulesPassed = 0;
    size_t rulesFailed = 0;
    double validityRate = 100.0;
};

struct ValidationResult {
    bool isValid = true;
    size_t totalRows = 0;
    size_t validRows = 0;
    size_t invalidRows = 0;
    std::vector<ValidationViolation> violations;
    std::vector<ValidationViolation> errors;
    std::vector<ValidationViolation> warnings;
    std::map<std::string, std::string> columnTypes;
    ValidationSummary summary;
};

/**
 * @brief Evaluates declarative rules against a table without mutating it.
 * @details Rules run in declaration order. A rule that throws is recorded as an
 * ERROR violation and the remaining rules still run.
 */
class SchemaValidator {
public:
    SchemaValidator() = default;
    explicit SchemaValidator(std::vector<ValidationRule> rules) : rules_(std::move(rules)) {}

    SchemaValidator& addRule(ValidationRule rule);
    SchemaValidator& addRequiredColumns(const std::vector<std::string>& columns,
                                        Severity severity = Severity::ERROR);
    SchemaValidator& addTypeRule(const std::string& column,
                                 const std::string& expectedType,
                                 Severity severity = Severity::ERROR);
    SchemaValidator& addRangeRule(const std::string& column,
                                  std::optional<double> min,
                                  std::optional<double> max,
                                  Severity severity = Severity::ERROR);
    SchemaValidator& addPatternRule(const std::string& column,
                                    const std::string& pattern,
                                    Severity severity = Severity::ERROR,
                                    const std::string& message = "");
    SchemaValidator& addUniqueRule(const std::string& column, Severity severity = Severity::ERROR);
    SchemaValidator& addCustomRule(const std::string& name,
                                   CustomPredicate predicate,
                                   Severity severity = Severity::ERROR,
                                   const std::string& message = "");

    const std::vector<ValidationRule>& rules() const noexcept { return rules_; }

    ValidationResult validate(const TypedDataset& data) const;
    static ValidationResult validate(const TypedDataset& data, const std::vector<ValidationRule>& rules);

    /**
     * @brief integer, float, string, datetime or boolean.
     */
    static std::string detectedTypeName(const TypedColumn& column);

private:
    std::vector<ValidationRule> rules_;
};

namespace CommonValidators {
SchemaValidator sales();
SchemaValidator purchases();
SchemaValidator products();
// Resolves a preset name (sales|purchases|products); nullopt for none or unknown.
std::optional<SchemaValidator> byName(const std::string& preset);
}
