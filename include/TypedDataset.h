#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL, DATETIME, BOOLEAN };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>>;
using MissingMask = std::vector<uint8_t>;

const char* columnTypeName(ColumnType type) noexcept;

/**
 * @brief One named column. NUMERIC and BOOLEAN store doubles (BOOLEAN as 0/1),
 * CATEGORICAL stores strings, DATETIME stores unix seconds.
 */
struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    size_t size() const noexcept { return missing.size(); }
    size_t missingCount() const noexcept;
    bool isMissing(size_t row) const noexcept { return row < missing.size() && missing[row] != 0; }

    // NaN entries are marked missing when no mask is supplied.
    static TypedColumn numeric(std::string name, std::vector<double> values, MissingMask missing = {});
    static TypedColumn boolean(std::string name, std::vector<double> values, MissingMask missing = {});
    // Empty strings are marked missing when no mask is supplied.
    static TypedColumn categorical(std::string name, std::vector<std::string> values, MissingMask missing = {});
    static TypedColumn datetime(std::string name, std::vector<int64_t> values, MissingMask missing = {});
};

struct CivilTime {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int dayOfWeek = 3; // 0 = Monday
};

class TypedDataset {
public:
    enum class DateLocaleHint {
        AUTO,
        DMY,
        MDY
    };

    TypedDataset() = default;
    explicit TypedDataset(std::string filename, char delimiter = ',');

    void setDateLocaleHint(DateLocaleHint hint) noexcept { dateLocaleHint_ = hint; }
    void setColumnTypeOverride(std::string columnNameLower, ColumnType type) { columnTypeOverrides_[std::move(columnNameLower)] = type; }
    void setColumnTypeOverrides(std::unordered_map<std::string, ColumnType> overrides) { columnTypeOverrides_ = std::move(overrides); }

    /**
     * @brief Loads CSV content and infers per-column types.
     * @details Tokenization is delegated to CSVUtils; this class owns type inference and typed storage.
     * @pre file exists and is readable.
     * @post columns() is populated with aligned typed vectors and missing masks.
     * @throws Curator::IOException / Curator::DatasetException on IO or parse failure.
     */
    void load();

    /**
     * @brief Builds a dataset from raw string cells with the same inference as load().
     * @throws Curator::DatasetException when a row is wider than the header.
     */
    static TypedDataset fromRows(const std::vector<std::string>& header,
                                 const std::vector<std::vector<std::string>>& rows,
                                 DateLocaleHint hint = DateLocaleHint::AUTO);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<TypedColumn>& columns() noexcept { return columns_; }
    std::vector<std::string> columnNames() const;

    std::vector<size_t> numericColumnIndices() const;
    std::vector<size_t> categoricalColumnIndices() const;
    std::vector<size_t> datetimeColumnIndices() const;
    std::vector<size_t> booleanColumnIndices() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;
    bool hasColumn(const std::string& name) const { return findColumnIndex(name) >= 0; }

    /**
     * @throws Curator::DatasetException when the column is absent.
     */
    const TypedColumn& column(const std::string& name) const;
    TypedColumn& column(const std::string& name);

    /**
     * @brief Appends a column.
     * @throws Curator::DatasetException on duplicate name or row count mismatch.
     */
    void addColumn(TypedColumn column);

    /**
     * @brief Replaces the column at index, keeping its position.
     * @throws Curator::DatasetException on row count mismatch or name clash.
     */
    void replaceColumn(size_t index, TypedColumn column);

    /**
     * @brief Removes rows where keepMask is false across all columns.
     * @pre keepMask.size() == rowCount().
     * @post All typed columns keep row alignment after filtering.
     * @throws Curator::DatasetException when mask size mismatches row count.
     */
    void removeRows(const MissingMask& keepMask);

    /**
     * @brief Reorders rows so that row i of the result is row order[i] of the input.
     * @throws Curator::DatasetException when order is not a permutation of the rows.
     */
    void reorderRows(const std::vector<size_t>& order);

    void removeColumns(const std::vector<std::string>& names);

    /**
     * @brief Text form of a cell; empty for missing cells.
     */
    std::string cellText(size_t col, size_t row) const;
    size_t missingCount() const noexcept;

    bool parseDouble(const std::string& v, double& out) const;
    bool parseDateTime(const std::string& v, int64_t& outUnixSeconds) const;
    static bool parseBoolean(const std::string& v, bool& out);
    static std::string formatDateTime(int64_t unixSeconds);
    static CivilTime civilFromUnixSeconds(int64_t unixSeconds);
    static int64_t daysFromCivil(int year, unsigned month, unsigned day);

private:
    std::string filename_;
    char delimiter_ = ',';
    DateLocaleHint dateLocaleHint_ = DateLocaleHint::AUTO;
    std::unordered_map<std::string, ColumnType> columnTypeOverrides_;
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;

    void buildColumns(const std::vector<std::string>& header, const std::vector<std::vector<std::string>>& rows);
};
