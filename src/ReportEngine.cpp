#include "ReportEngine.h"
#include "CommonUtils.h"
#include "CuratorExceptions.h"
#include <algorithm>
#include <cmath>
#include <fstream>

namespace {
std::string escapeMarkdownTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

constexpr size_t kTallTableRowCap = 120;

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "|";
    for (const auto& h : headers) {
        body += " " + escapeMarkdownTableCell(h) + " |";
    }
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        body += " --- |";
    }
    body += "\n";

    for (const auto& row : rows) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < row.size() ? row[i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}

std::string jsonNumber(double value) {
    if (!std::isfinite(value)) return "null";
    return CommonUtils::formatNumber(value);
}

std::string jsonString(const std::string& value) {
    return "\"" + ReportEngine::escapeJsonString(value) + "\"";
}

std::string jsonBool(bool value) {
    return value ? "true" : "false";
}

std::string jsonStringArray(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += jsonString(values[i]);
    }
    return out + "]";
}

// Members are "key": value fragments already rendered.
std::string jsonObject(const std::vector<std::pair<std::string, std::string>>& members) {
    std::string out = "{";
    for (size_t i = 0; i < members.size(); ++i) {
        if (i > 0) out += ", ";
        out += jsonString(members[i].first) + ": " + members[i].second;
    }
    return out + "}";
}

std::string violationJson(const ValidationViolation& v) {
    std::vector<std::string> samples(v.sampleValues.begin(),
                                     v.sampleValues.begin() + static_cast<long>(std::min(v.sampleValues.size(), ValidationViolation::kMaxSamples)));
    return jsonObject({
        {"rule", jsonString(v.ruleName)},
        {"type", jsonString(ruleTypeName(v.ruleType))},
        {"column", v.column ? jsonString(*v.column) : "null"},
        {"severity", jsonString(severityName(v.severity))},
        {"message", jsonString(v.message)},
        {"affected_rows", std::to_string(v.affectedRows)},
        {"sample_values", jsonStringArray(samples)},
    });
}

std::string scalingParamsJson(const ScalingParams& p) {
    std::vector<std::pair<std::string, std::string>> members{{"method", jsonString(scalingMethodName(p.method))}};
    switch (p.method) {
        case ScalingMethod::MINMAX:
            members.emplace_back("min", jsonNumber(p.min));
            members.emplace_back("max", jsonNumber(p.max));
            break;
        case ScalingMethod::STANDARD:
            members.emplace_back("mean", jsonNumber(p.mean));
            members.emplace_back("std", jsonNumber(p.stddev));
            break;
        case ScalingMethod::ROBUST:
            members.emplace_back("median", jsonNumber(p.median));
            members.emplace_back("q1", jsonNumber(p.q1));
            members.emplace_back("q3", jsonNumber(p.q3));
            break;
        case ScalingMethod::MAXABS:
            members.emplace_back("max_abs", jsonNumber(p.maxAbs));
            break;
        default:
            break;
    }
    return jsonObject(members);
}

// One-hot maps point each category at its generated column.
std::string encodingMapJson(const std::string& column, const EncodingMap& map) {
    std::vector<std::pair<std::string, std::string>> members;
    if (map.method == EncodingMethod::ONEHOT) {
        for (const auto& category : map.categories) {
            members.emplace_back(category, jsonString(column + "_" + category));
        }
    } else {
        for (const auto& [category, code] : map.codes) {
            members.emplace_back(category, jsonNumber(code));
        }
    }
    return jsonObject(members);
}

double roundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addSection(const std::string& title) {
    body_ += "## " + title + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addBulletList(const std::vector<std::string>& items) {
    if (items.empty()) return;
    for (const auto& item : items) {
        body_ += "- " + item + "\n";
    }
    body_ += "\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ += "### " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }

    const bool tallTable = rows.size() > kTallTableRowCap;
    if (tallTable) {
        body_ += "_Tall table preview shown (" + std::to_string(kTallTableRowCap) + " of " + std::to_string(rows.size()) + " rows)._\n\n";
    }

    const size_t previewCount = tallTable ? kTallTableRowCap : rows.size();
    const std::vector<std::vector<std::string>> previewRows(rows.begin(), rows.begin() + static_cast<long>(previewCount));
    appendMarkdownTable(body_, headers, previewRows);

    if (tallTable) {
        body_ += "<details>\n";
        body_ += "<summary>Show full table (" + std::to_string(rows.size()) + " rows)</summary>\n\n";
        appendMarkdownTable(body_, headers, rows);
        body_ += "</details>\n\n";
    }
}

void ReportEngine::save(const std::string& filePath) const {
    std::ofstream out(filePath);
    if (!out) {
        throw Curator::IOException("Could not open report file for writing: " + filePath);
    }
    out << body_;
    if (!out.good()) {
        throw Curator::IOException("Failed while writing report file: " + filePath);
    }
}

std::string ReportEngine::escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    escaped += "?";
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

std::string ReportEngine::toJson(const ValidationResult& result) {
    std::string violations = "[";
    for (size_t i = 0; i < result.violations.size(); ++i) {
        if (i > 0) violations += ", ";
        violations += violationJson(result.violations[i]);
    }
    violations += "]";

    std::vector<std::pair<std::string, std::string>> types;
    for (const auto& [column, type] : result.columnTypes) {
        types.emplace_back(column, jsonString(type));
    }

    const ValidationSummary& s = result.summary;
    return jsonObject({
        {"is_valid", jsonBool(result.isValid)},
        {"total_rows", std::to_string(result.totalRows)},
        {"valid_rows", std::to_string(result.validRows)},
        {"invalid_rows", std::to_string(result.invalidRows)},
        {"error_count", std::to_string(result.errors.size())},
        {"warning_count", std::to_string(result.warnings.size())},
        {"violations", violations},
        {"column_types", jsonObject(types)},
        {"summary", jsonObject({
            {"columns_validated", std::to_string(s.columnsValidated)},
            {"rules_applied", std::to_string(s.rulesApplied)},
            {"rules_passed", std::to_string(s.rulesPassed)},
            {"rules_failed", std::to_string(s.rulesFailed)},
            {"validity_rate", jsonNumber(s.validityRate)},
        })},
    });
}

std::string ReportEngine::toJson(const CleaningReport& report) {
    std::vector<std::pair<std::string, std::string>> byColumn;
    for (const auto& [column, count] : report.outlierDetails) {
        byColumn.emplace_back(column, std::to_string(count));
    }

    return jsonObject({
        {"original_rows", std::to_string(report.originalRows)},
        {"original_columns", std::to_string(report.originalColumns)},
        {"cleaned_rows", std::to_string(report.cleanedRows)},
        {"cleaned_columns", std::to_string(report.cleanedColumns)},
        {"duplicates", jsonObject({
            {"found", std::to_string(report.duplicatesFound)},
            {"removed", std::to_string(report.duplicatesRemoved)},
        })},
        {"nulls", jsonObject({
            {"found", std::to_string(report.nullsFound)},
            {"handled", std::to_string(report.nullsHandled)},
            {"columns_dropped", jsonStringArray(report.columnsDroppedNulls)},
        })},
        {"outliers", jsonObject({
            {"detected", std::to_string(report.outliersDetected)},
            {"removed", std::to_string(report.outliersRemoved)},
            {"by_column", jsonObject(byColumn)},
        })},
        {"retention", jsonObject({
            {"rate", jsonNumber(roundTo2(report.retentionRate * 100.0))},
            {"meets_requirement", jsonBool(report.meetsRetentionRequirement)},
        })},
        {"warnings", jsonStringArray(report.warnings)},
        {"errors", jsonStringArray(report.errors)},
    });
}

std::string ReportEngine::toJson(const TransformResult& result) {
    std::vector<std::pair<std::string, std::string>> scaling;
    for (const auto& [column, params] : result.scalingParams) {
        scaling.emplace_back(column, scalingParamsJson(params));
    }
    std::vector<std::pair<std::string, std::string>> encoding;
    for (const auto& [column, map] : result.encodingMaps) {
        encoding.emplace_back(column, encodingMapJson(column, map));
    }

    return jsonObject({
        {"original_columns", jsonStringArray(result.originalColumns)},
        {"transformed_columns", jsonStringArray(result.transformedColumns)},
        {"new_columns", jsonStringArray(result.newColumns)},
        {"removed_columns", jsonStringArray(result.removedColumns)},
        {"transformations_applied", jsonStringArray(result.transformationsApplied)},
        {"scaling_params", jsonObject(scaling)},
        {"encoding_maps", jsonObject(encoding)},
        {"date_columns", jsonStringArray(result.dateColumns)},
        {"warnings", jsonStringArray(result.warnings)},
    });
}

std::string ReportEngine::toJson(const PipelineOutcome& outcome) {
    return jsonObject({
        {"rows", std::to_string(outcome.data.rowCount())},
        {"columns", jsonStringArray(outcome.data.columnNames())},
        {"validation", outcome.validation ? toJson(*outcome.validation) : "null"},
        {"cleaning", outcome.cleaning ? toJson(*outcome.cleaning) : "null"},
        {"transformation", outcome.transform ? toJson(*outcome.transform) : "null"},
    }) + "\n";
}

ReportEngine ReportEngine::qualityReport(const std::string& datasetName, const PipelineOutcome& outcome) {
    ReportEngine report;
    report.addTitle("Data Quality Report");
    report.addParagraph("Dataset: " + datasetName);
    report.addParagraph("Output rows: " + std::to_string(outcome.data.rowCount()) +
                        " | Output columns: " + std::to_string(outcome.data.colCount()));

    report.addSection("Validation");
    if (!outcome.validation) {
        report.addParagraph("_Skipped._");
    } else {
        const ValidationResult& v = *outcome.validation;
        report.addParagraph(std::string("Status: ") + (v.isValid ? "**valid**" : "**invalid**") +
                            " | Valid rows: " + std::to_string(v.validRows) + "/" + std::to_string(v.totalRows) +
                            " | Validity rate: " + CommonUtils::formatNumber(roundTo2(v.summary.validityRate)) + "%");

        std::vector<std::vector<std::string>> rows;
        for (const auto& violation : v.violations) {
            rows.push_back({violation.ruleName,
                            ruleTypeName(violation.ruleType),
                            violation.column.value_or("-"),
                            severityName(violation.severity),
                            std::to_string(violation.affectedRows),
                            violation.message});
        }
        if (rows.empty()) {
            report.addParagraph("No rule violations.");
        } else {
            report.addTable("Violations", {"Rule", "Type", "Column", "Severity", "Affected Rows", "Message"}, rows);
        }

        std::vector<std::vector<std::string>> typeRows;
        for (const auto& [column, type] : v.columnTypes) {
            typeRows.push_back({column, type});
        }
        report.addTable("Detected Column Types", {"Column", "Type"}, typeRows);
    }

    report.addSection("Cleaning");
    if (!outcome.cleaning) {
        report.addParagraph("_Skipped._");
    } else {
        const CleaningReport& c = *outcome.cleaning;
        report.addTable("Cleaning Summary", {"Metric", "Value"}, {
            {"Rows", std::to_string(c.originalRows) + " -> " + std::to_string(c.cleanedRows)},
            {"Columns", std::to_string(c.originalColumns) + " -> " + std::to_string(c.cleanedColumns)},
            {"Duplicates found / removed", std::to_string(c.duplicatesFound) + " / " + std::to_string(c.duplicatesRemoved)},
            {"Nulls found / handled", std::to_string(c.nullsFound) + " / " + std::to_string(c.nullsHandled)},
            {"Outliers detected / removed", std::to_string(c.outliersDetected) + " / " + std::to_string(c.outliersRemoved)},
            {"Retention rate", CommonUtils::formatNumber(roundTo2(c.retentionRate * 100.0)) + "%"},
            {"Meets retention requirement", c.meetsRetentionRequirement ? "yes" : "no"},
        });

        if (!c.outlierDetails.empty()) {
            std::vector<std::vector<std::string>> rows;
            for (const auto& [column, count] : c.outlierDetails) {
                rows.push_back({column, std::to_string(count)});
            }
            report.addTable("Outliers by Column", {"Column", "Outliers"}, rows);
        }
        if (!c.columnsDroppedNulls.empty()) {
            report.addParagraph("Columns dropped for excess nulls:");
            report.addBulletList(c.columnsDroppedNulls);
        }
        if (!c.warnings.empty()) {
            report.addParagraph("Warnings:");
            report.addBulletList(c.warnings);
        }
    }

    report.addSection("Transformation");
    if (!outcome.transform) {
        report.addParagraph("_Skipped._");
    } else {
        const TransformResult& t = *outcome.transform;
        report.addParagraph("New columns: " + std::to_string(t.newColumns.size()) +
                            " | Removed columns: " + std::to_string(t.removedColumns.size()));
        report.addBulletList(t.transformationsApplied);

        if (!t.scalingParams.empty()) {
            std::vector<std::vector<std::string>> rows;
            for (const auto& [column, p] : t.scalingParams) {
                rows.push_back({column, scalingMethodName(p.method),
                                CommonUtils::formatNumber(p.min), CommonUtils::formatNumber(p.max),
                                CommonUtils::formatNumber(p.mean), CommonUtils::formatNumber(p.stddev),
                                CommonUtils::formatNumber(p.median), CommonUtils::formatNumber(p.maxAbs)});
            }
            report.addTable("Scaling Parameters", {"Column", "Method", "Min", "Max", "Mean", "Std", "Median", "Max Abs"}, rows);
        }
        if (!t.encodingMaps.empty()) {
            std::vector<std::vector<std::string>> rows;
            for (const auto& [column, map] : t.encodingMaps) {
                const size_t categories = map.method == EncodingMethod::ONEHOT ? map.categories.size() : map.codes.size();
                rows.push_back({column, encodingMethodName(map.method), std::to_string(categories)});
            }
            report.addTable("Encodings", {"Column", "Method", "Categories"}, rows);
        }
        if (!t.warnings.empty()) {
            report.addParagraph("Warnings:");
            report.addBulletList(t.warnings);
        }
    }

    return report;
}
