#include "TypedDataset.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "CuratorExceptions.h"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <unordered_set>

namespace {
using NumVec = std::vector<double>;
using StrVec = std::vector<std::string>;
using TimeVec = std::vector<int64_t>;

bool isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t civilToDays(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

int64_t floorDiv(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    const int64_t r = value % divisor;
    if (r != 0 && ((r > 0) != (divisor > 0))) --q;
    return q;
}

bool parseTimePart(const std::string& timePart, int& hour, int& minute, int& second) {
    hour = minute = second = 0;
    if (timePart.empty()) return true;
    // HH:MM or HH:MM:SS, optional fractional seconds and trailing Z.
    std::string t = timePart;
    if (!t.empty() && (t.back() == 'Z' || t.back() == 'z')) t.pop_back();
    const size_t dot = t.find('.');
    if (dot != std::string::npos) t = t.substr(0, dot);

    if (t.size() == 5) {
        return parseFixedInt(t, 0, 2, hour) && t[2] == ':' && parseFixedInt(t, 3, 2, minute);
    }
    if (t.size() != 8) return false;
    return parseFixedInt(t, 0, 2, hour) && t[2] == ':' &&
           parseFixedInt(t, 3, 2, minute) && t[5] == ':' &&
           parseFixedInt(t, 6, 2, second);
}

bool parseDatePart(const std::string& datePart, TypedDataset::DateLocaleHint localeHint, int& year, int& month, int& day) {
    // ISO: YYYY-MM-DD or YYYY/MM/DD
    if (datePart.size() == 10 && (datePart[4] == '-' || datePart[4] == '/') && datePart[7] == datePart[4]) {
        return parseFixedInt(datePart, 0, 4, year) &&
               parseFixedInt(datePart, 5, 2, month) &&
               parseFixedInt(datePart, 8, 2, day);
    }

    // Slash format: dd/mm/yyyy or mm/dd/yyyy based on locale hint.
    if (datePart.size() == 10 && datePart[2] == '/' && datePart[5] == '/') {
        int a = 0;
        int b = 0;
        if (!parseFixedInt(datePart, 0, 2, a) ||
            !parseFixedInt(datePart, 3, 2, b) ||
            !parseFixedInt(datePart, 6, 4, year)) {
            return false;
        }

        if (localeHint == TypedDataset::DateLocaleHint::DMY) {
            day = a;
            month = b;
        } else if (localeHint == TypedDataset::DateLocaleHint::MDY) {
            month = a;
            day = b;
        } else if (a > 12 && b <= 12) {
            day = a;
            month = b;
        } else {
            month = a;
            day = b;
        }
        return true;
    }

    // DMY: DD-MM-YYYY
    if (datePart.size() == 10 && datePart[2] == '-' && datePart[5] == '-') {
        return parseFixedInt(datePart, 0, 2, day) &&
               parseFixedInt(datePart, 3, 2, month) &&
               parseFixedInt(datePart, 6, 4, year);
    }

    return false;
}

std::string cellKeyForNumber(double v) {
    return CommonUtils::formatNumber(v);
}

template <typename T>
void filterByMask(std::vector<T>& values, const MissingMask& keepMask) {
    std::vector<T> next;
    next.reserve(values.size());
    for (size_t i = 0; i < values.size() && i < keepMask.size(); ++i) {
        if (keepMask[i]) next.push_back(std::move(values[i]));
    }
    values = std::move(next);
}

template <typename T>
void permute(std::vector<T>& values, const std::vector<size_t>& order) {
    std::vector<T> next;
    next.reserve(order.size());
    for (size_t idx : order) next.push_back(std::move(values[idx]));
    values = std::move(next);
}

size_t storageSize(const ColumnStorage& storage) {
    return std::visit([](const auto& v) { return v.size(); }, storage);
}

bool storageMatchesType(const TypedColumn& col) {
    switch (col.type) {
        case ColumnType::NUMERIC:
        case ColumnType::BOOLEAN:
            return std::holds_alternative<NumVec>(col.values);
        case ColumnType::CATEGORICAL:
            return std::holds_alternative<StrVec>(col.values);
        case ColumnType::DATETIME:
            return std::holds_alternative<TimeVec>(col.values);
    }
    return false;
}

void checkColumnShape(const TypedColumn& col) {
    if (!storageMatchesType(col)) {
        throw Curator::DatasetException("Column '" + col.name + "' storage does not match its declared type");
    }
    if (storageSize(col.values) != col.missing.size()) {
        throw Curator::DatasetException("Column '" + col.name + "' missing mask size mismatch");
    }
}
} // namespace

const char* columnTypeName(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::NUMERIC: return "numeric";
        case ColumnType::CATEGORICAL: return "categorical";
        case ColumnType::DATETIME: return "datetime";
        case ColumnType::BOOLEAN: return "boolean";
    }
    return "categorical";
}

size_t TypedColumn::missingCount() const noexcept {
    return static_cast<size_t>(std::count(missing.begin(), missing.end(), static_cast<uint8_t>(1)));
}

TypedColumn TypedColumn::numeric(std::string name, std::vector<double> values, MissingMask missing) {
    if (missing.empty()) {
        missing.assign(values.size(), static_cast<uint8_t>(0));
        for (size_t i = 0; i < values.size(); ++i) {
            if (std::isnan(values[i])) missing[i] = static_cast<uint8_t>(1);
        }
    }
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::NUMERIC;
    col.values = std::move(values);
    col.missing = std::move(missing);
    checkColumnShape(col);
    return col;
}

TypedColumn TypedColumn::boolean(std::string name, std::vector<double> values, MissingMask missing) {
    TypedColumn col = numeric(std::move(name), std::move(values), std::move(missing));
    col.type = ColumnType::BOOLEAN;
    return col;
}

TypedColumn TypedColumn::categorical(std::string name, std::vector<std::string> values, MissingMask missing) {
    if (missing.empty()) {
        missing.assign(values.size(), static_cast<uint8_t>(0));
        for (size_t i = 0; i < values.size(); ++i) {
            if (values[i].empty()) missing[i] = static_cast<uint8_t>(1);
        }
    }
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::CATEGORICAL;
    col.values = std::move(values);
    col.missing = std::move(missing);
    checkColumnShape(col);
    return col;
}

TypedColumn TypedColumn::datetime(std::string name, std::vector<int64_t> values, MissingMask missing) {
    if (missing.empty()) missing.assign(values.size(), static_cast<uint8_t>(0));
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::DATETIME;
    col.values = std::move(values);
    col.missing = std::move(missing);
    checkColumnShape(col);
    return col;
}

TypedDataset::TypedDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

bool TypedDataset::parseDouble(const std::string& v, double& out) const {
    std::string cleaned = CommonUtils::trim(v);
    if (isMissingToken(cleaned)) return false;

    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;

    const std::string lower = CommonUtils::toLower(cleaned);
    if (lower == "inf" || lower == "infinity") {
        out = std::numeric_limits<double>::infinity();
        return true;
    }
    if (lower == "-inf" || lower == "-infinity") {
        out = -std::numeric_limits<double>::infinity();
        return true;
    }

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && !std::isnan(out);
}

bool TypedDataset::parseDateTime(const std::string& v, int64_t& outUnixSeconds) const {
    std::string s = CommonUtils::trim(v);
    if (s.empty() || isMissingToken(s)) return false;

    std::string datePart = s;
    std::string timePart;
    const size_t sep = s.find_first_of(" T");
    if (sep != std::string::npos) {
        datePart = s.substr(0, sep);
        timePart = CommonUtils::trim(s.substr(sep + 1));
    }

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parseDatePart(datePart, dateLocaleHint_, year, month, day)) return false;
    if (!parseTimePart(timePart, hour, minute, second)) return false;

    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    if (hour > 23 || minute > 59 || second > 60) return false;

    const int64_t days = civilToDays(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    outUnixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}

bool TypedDataset::parseBoolean(const std::string& v, bool& out) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(v));
    if (s == "true" || s == "yes") { out = true; return true; }
    if (s == "false" || s == "no") { out = false; return true; }
    return false;
}

CivilTime TypedDataset::civilFromUnixSeconds(int64_t unixSeconds) {
    int64_t z = floorDiv(unixSeconds, 86400);
    const int64_t secs = unixSeconds - z * 86400;
    const int64_t days = z;
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;

    CivilTime out;
    out.day = doy - (153 * mp + 2) / 5 + 1;
    out.month = mp < 10 ? mp + 3 : mp - 9;
    out.year = static_cast<int>(yoe) + static_cast<int>(era) * 400 + (out.month <= 2 ? 1 : 0);
    out.hour = static_cast<int>(secs / 3600);
    out.minute = static_cast<int>((secs / 60) % 60);
    out.second = static_cast<int>(secs % 60);
    // 1970-01-01 was a Thursday.
    out.dayOfWeek = static_cast<int>((days + 3) - 7 * floorDiv(days + 3, 7));
    return out;
}

int64_t TypedDataset::daysFromCivil(int year, unsigned month, unsigned day) {
    return civilToDays(year, month, day);
}

std::string TypedDataset::formatDateTime(int64_t unixSeconds) {
    const CivilTime t = civilFromUnixSeconds(unixSeconds);
    char buf[48];
    if (t.hour == 0 && t.minute == 0 && t.second == 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", t.year, t.month, t.day);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d", t.year, t.month, t.day, t.hour, t.minute, t.second);
    }
    return buf;
}

void TypedDataset::buildColumns(const std::vector<std::string>& header, const std::vector<std::vector<std::string>>& rows) {
    const size_t width = header.size();
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() > width) {
            throw Curator::DatasetException("Row " + std::to_string(r + 1) + " has " + std::to_string(rows[r].size()) +
                                            " fields, header has " + std::to_string(width));
        }
    }

    columns_.clear();
    columns_.reserve(width);
    rowCount_ = rows.size();

    for (size_t c = 0; c < width; ++c) {
        std::vector<std::string> raw(rows.size());
        MissingMask missing(rows.size(), static_cast<uint8_t>(0));
        size_t nonMissing = 0;
        size_t numericHits = 0;
        size_t boolHits = 0;
        size_t datetimeHits = 0;

        for (size_t r = 0; r < rows.size(); ++r) {
            raw[r] = c < rows[r].size() ? rows[r][c] : std::string();
            if (isMissingToken(raw[r])) {
                missing[r] = static_cast<uint8_t>(1);
                continue;
            }
            ++nonMissing;
            double dv = 0.0;
            int64_t tv = 0;
            bool bv = false;
            if (parseDouble(raw[r], dv)) ++numericHits;
            if (parseBoolean(raw[r], bv)) ++boolHits;
            if (parseDateTime(raw[r], tv)) ++datetimeHits;
        }

        ColumnType type = ColumnType::CATEGORICAL;
        const auto forced = columnTypeOverrides_.find(CommonUtils::toLower(header[c]));
        if (forced != columnTypeOverrides_.end()) {
            type = forced->second;
        } else if (numericHits == nonMissing) {
            // All-null columns land here too and behave as empty numeric columns.
            type = ColumnType::NUMERIC;
        } else if (boolHits == nonMissing) {
            type = ColumnType::BOOLEAN;
        } else if (datetimeHits == nonMissing) {
            type = ColumnType::DATETIME;
        }

        TypedColumn col;
        col.name = header[c];
        col.type = type;
        if (type == ColumnType::NUMERIC || type == ColumnType::BOOLEAN) {
            NumVec values(rows.size(), 0.0);
            for (size_t r = 0; r < rows.size(); ++r) {
                if (missing[r]) continue;
                bool ok = false;
                if (type == ColumnType::BOOLEAN) {
                    bool bv = false;
                    ok = parseBoolean(raw[r], bv);
                    values[r] = bv ? 1.0 : 0.0;
                } else {
                    ok = parseDouble(raw[r], values[r]);
                }
                if (!ok) {
                    values[r] = 0.0;
                    missing[r] = static_cast<uint8_t>(1);
                }
            }
            col.values = std::move(values);
        } else if (type == ColumnType::DATETIME) {
            TimeVec values(rows.size(), 0);
            for (size_t r = 0; r < rows.size(); ++r) {
                if (missing[r]) continue;
                if (!parseDateTime(raw[r], values[r])) {
                    values[r] = 0;
                    missing[r] = static_cast<uint8_t>(1);
                }
            }
            col.values = std::move(values);
        } else {
            for (size_t r = 0; r < rows.size(); ++r) {
                if (missing[r]) raw[r].clear();
            }
            col.values = std::move(raw);
        }
        col.missing = std::move(missing);
        columns_.push_back(std::move(col));
    }
}

TypedDataset TypedDataset::fromRows(const std::vector<std::string>& header,
                                    const std::vector<std::vector<std::string>>& rows,
                                    DateLocaleHint hint) {
    TypedDataset data;
    data.setDateLocaleHint(hint);
    data.buildColumns(CSVUtils::normalizeHeader(header), rows);
    return data;
}

void TypedDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw Curator::IOException("Could not open file: " + filename_);

    CSVUtils::skipBOM(in);

    std::vector<std::string> header;
    CSVUtils::RecordStatus status = CSVUtils::readRecord(in, delimiter_, header);
    if (status != CSVUtils::RecordStatus::OK || header.empty()) {
        throw Curator::DatasetException("Malformed or empty CSV header in " + filename_);
    }
    header = CSVUtils::normalizeHeader(header);

    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> fields;
    size_t recordNo = 1;
    while ((status = CSVUtils::readRecord(in, delimiter_, fields)) != CSVUtils::RecordStatus::END_OF_INPUT) {
        ++recordNo;
        if (status == CSVUtils::RecordStatus::UNTERMINATED_QUOTE) {
            throw Curator::DatasetException("Unterminated quoted field at record " + std::to_string(recordNo));
        }
        if (status == CSVUtils::RecordStatus::LIMIT_EXCEEDED) {
            throw Curator::DatasetException("CSV parse limits exceeded at record " + std::to_string(recordNo));
        }
        rows.push_back(fields);
    }
    if (in.bad()) throw Curator::IOException("Read failure on " + filename_);

    buildColumns(header, rows);
}

std::vector<std::string> TypedDataset::columnNames() const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& col : columns_) out.push_back(col.name);
    return out;
}

std::vector<size_t> TypedDataset::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::NUMERIC) out.push_back(i);
    return out;
}

std::vector<size_t> TypedDataset::categoricalColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::CATEGORICAL) out.push_back(i);
    return out;
}

std::vector<size_t> TypedDataset::datetimeColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::DATETIME) out.push_back(i);
    return out;
}

std::vector<size_t> TypedDataset::booleanColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::BOOLEAN) out.push_back(i);
    return out;
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

const TypedColumn& TypedDataset::column(const std::string& name) const {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Curator::DatasetException("Column not found: " + name);
    return columns_[static_cast<size_t>(idx)];
}

TypedColumn& TypedDataset::column(const std::string& name) {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Curator::DatasetException("Column not found: " + name);
    return columns_[static_cast<size_t>(idx)];
}

void TypedDataset::addColumn(TypedColumn column) {
    checkColumnShape(column);
    if (hasColumn(column.name)) throw Curator::DatasetException("Duplicate column name: " + column.name);
    if (columns_.empty()) {
        rowCount_ = column.size();
    } else if (column.size() != rowCount_) {
        throw Curator::DatasetException("Column '" + column.name + "' has " + std::to_string(column.size()) +
                                        " rows, dataset has " + std::to_string(rowCount_));
    }
    columns_.push_back(std::move(column));
}

void TypedDataset::replaceColumn(size_t index, TypedColumn column) {
    if (index >= columns_.size()) throw Curator::DatasetException("Column index out of range");
    checkColumnShape(column);
    if (column.size() != rowCount_) {
        throw Curator::DatasetException("Replacement column '" + column.name + "' row count mismatch");
    }
    const int existing = findColumnIndex(column.name);
    if (existing >= 0 && static_cast<size_t>(existing) != index) {
        throw Curator::DatasetException("Duplicate column name: " + column.name);
    }
    columns_[index] = std::move(column);
}

void TypedDataset::removeRows(const MissingMask& keepMask) {
    if (keepMask.size() != rowCount_) throw Curator::DatasetException("Row mask size mismatch");

    for (auto& col : columns_) {
        std::visit([&](auto& values) { filterByMask(values, keepMask); }, col.values);
        filterByMask(col.missing, keepMask);
    }

    rowCount_ = static_cast<size_t>(std::count_if(keepMask.begin(), keepMask.end(), [](uint8_t k) { return k != 0; }));
}

void TypedDataset::reorderRows(const std::vector<size_t>& order) {
    if (order.size() != rowCount_) throw Curator::DatasetException("Row order size mismatch");
    std::vector<uint8_t> seen(rowCount_, static_cast<uint8_t>(0));
    for (size_t idx : order) {
        if (idx >= rowCount_ || seen[idx]) throw Curator::DatasetException("Row order is not a permutation");
        seen[idx] = static_cast<uint8_t>(1);
    }

    for (auto& col : columns_) {
        std::visit([&](auto& values) { permute(values, order); }, col.values);
        permute(col.missing, order);
    }
}

void TypedDataset::removeColumns(const std::vector<std::string>& names) {
    const std::unordered_set<std::string> drop(names.begin(), names.end());
    columns_.erase(std::remove_if(columns_.begin(), columns_.end(),
                                  [&](const TypedColumn& col) { return drop.count(col.name) != 0; }),
                   columns_.end());
}

std::string TypedDataset::cellText(size_t col, size_t row) const {
    if (col >= columns_.size() || row >= rowCount_) return "";
    const TypedColumn& c = columns_[col];
    if (c.isMissing(row)) return "";

    switch (c.type) {
        case ColumnType::NUMERIC:
            return cellKeyForNumber(std::get<NumVec>(c.values)[row]);
        case ColumnType::BOOLEAN:
            return std::get<NumVec>(c.values)[row] != 0.0 ? "true" : "false";
        case ColumnType::DATETIME:
            return formatDateTime(std::get<TimeVec>(c.values)[row]);
        case ColumnType::CATEGORICAL:
            return std::get<StrVec>(c.values)[row];
    }
    return "";
}

size_t TypedDataset::missingCount() const noexcept {
    size_t total = 0;
    for (const auto& col : columns_) total += col.missingCount();
    return total;
}
