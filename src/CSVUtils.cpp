#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    const std::streampos start = is.tellg();
    for (unsigned char expected : kBom) {
        const int ch = is.get();
        if (ch == EOF || static_cast<unsigned char>(ch) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
    }
}

RecordStatus readRecord(std::istream& is,
                        char delimiter,
                        std::vector<std::string>& fields,
                        const ParseLimits& limits) {
    fields.clear();

    // Blank lines between records carry no data.
    while (is.peek() == '\n' || is.peek() == '\r') is.get();
    if (is.peek() == EOF) return RecordStatus::END_OF_INPUT;

    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;

    auto pushField = [&]() {
        fields.push_back(fieldQuoted ? field : trimUnquotedField(field));
        field.clear();
        fieldQuoted = false;
    };

    char c;
    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    field += '"';
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                field += '\n';
            } else {
                field += c;
            }
        } else if (c == '"' && field.find_first_not_of(" \t") == std::string::npos) {
            inQuotes = true;
            fieldQuoted = true;
            field.clear();
        } else if (c == delimiter) {
            pushField();
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && is.peek() == '\n') is.get();
            pushField();
            return RecordStatus::OK;
        } else {
            field += c;
        }

        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) return RecordStatus::LIMIT_EXCEEDED;
        if (limits.maxColumns > 0 && fields.size() > limits.maxColumns) return RecordStatus::LIMIT_EXCEEDED;
    }

    if (inQuotes) return RecordStatus::UNTERMINATED_QUOTE;
    pushField();
    return RecordStatus::OK;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }

        const std::string original = out[i];
        if (seen.count(out[i]) != 0) {
            size_t suffix = 2;
            while (seen.count(original + "_" + std::to_string(suffix)) != 0) {
                ++suffix;
            }
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }

    return out;
}
} // namespace CSVUtils
