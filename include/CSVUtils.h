#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and header normalization utilities.
// This module does not infer semantic types.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;   // 8 MiB
    size_t maxColumns = 20000;
};

enum class RecordStatus {
    OK,
    END_OF_INPUT,
    UNTERMINATED_QUOTE,
    LIMIT_EXCEEDED
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record; quoted fields may span lines and use "" escapes.
 * @post Blank lines are skipped; END_OF_INPUT is returned once the stream is drained.
 */
RecordStatus readRecord(std::istream& is,
                        char delimiter,
                        std::vector<std::string>& fields,
                        const ParseLimits& limits = ParseLimits{});

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
