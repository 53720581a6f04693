#pragma once

#include <fstream>
#include <string>
#include <vector>

namespace kbg {

// ============================================================================
// String helpers
// ============================================================================

/**
 * @brief Split on a single character, keeping empty fields
 *
 * "a||b" yields {"a", "", "b"} and "" yields {""}.
 */
std::vector<std::string> split(const std::string& text, char delimiter);

/**
 * @brief Split and drop empty fields and the given sentinel
 */
std::vector<std::string> split_values(const std::string& text, char delimiter,
                                      const std::string& sentinel = "");

std::string trim(const std::string& text);

bool starts_with(const std::string& text, const std::string& prefix);

/**
 * @brief Remove a trailing "! comment" from an OBO tag value
 */
std::string strip_obo_comment(const std::string& value);

/**
 * @brief Remove a trailing "{modifier}" and "! comment" from an OBO tag value
 *
 * Only unescaped '!' and '{' count. "a {source=x} ! b" becomes "a".
 */
std::string strip_obo_trailing(const std::string& value);

/**
 * @brief Strip a trailing carriage return left by CRLF files
 */
void chomp(std::string& line);

/**
 * @brief Open a file for reading or throw MissingFileError
 */
std::ifstream open_input(const std::string& path);

// ============================================================================
// Delimited records
// ============================================================================

/**
 * @brief Reader for delimiter-separated records with optional quoting
 *
 * Follows the usual CSV dialect: a field starting with '"' runs until the
 * matching quote, '""' inside it is a literal quote, and quoted fields may
 * span lines.
 */
class DelimitedReader {
public:
    DelimitedReader(const std::string& path, char delimiter, bool quoting = true);

    /**
     * @brief Read the next record
     * @return false at end of file
     */
    bool next(std::vector<std::string>& fields);

    /**
     * @brief 1-based line on which the last record started
     */
    size_t line_number() const { return record_line_; }

    /**
     * @brief 1-based index of the last record
     */
    size_t record_number() const { return record_count_; }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ifstream stream_;
    char delimiter_;
    bool quoting_;
    size_t line_ = 0;
    size_t record_line_ = 0;
    size_t record_count_ = 0;
};

} // namespace kbg
