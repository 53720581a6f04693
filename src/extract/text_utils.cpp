#include "extract/text_utils.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace kbg {

// ============================================================================
// String helpers
// ============================================================================

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(text.substr(start));
            break;
        }
        fields.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::vector<std::string> split_values(const std::string& text, char delimiter,
                                      const std::string& sentinel) {
    std::vector<std::string> values;
    for (auto& field : split(text, delimiter)) {
        if (field.empty() || (!sentinel.empty() && field == sentinel)) continue;
        values.push_back(std::move(field));
    }
    return values;
}

std::string trim(const std::string& text) {
    size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
        --last;
    }
    return text.substr(first, last - first);
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string strip_obo_comment(const std::string& value) {
    // "GO:0008150 ! biological_process" -> "GO:0008150"
    size_t pos = value.find(" !");
    if (pos == std::string::npos) {
        return trim(value);
    }
    return trim(value.substr(0, pos));
}

namespace {

size_t find_unescaped(const std::string& text, char c) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
        } else if (text[i] == c) {
            return i;
        }
    }
    return std::string::npos;
}

}  // namespace

std::string strip_obo_trailing(const std::string& value) {
    std::string result = trim(value.substr(0, find_unescaped(value, '!')));
    if (!result.empty() && result.back() == '}') {
        size_t open = find_unescaped(result, '{');
        if (open != std::string::npos) {
            result = trim(result.substr(0, open));
        }
    }
    return result;
}

void chomp(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

std::ifstream open_input(const std::string& path) {
    if (!fs::is_regular_file(path)) {
        throw MissingFileError(path);
    }
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw MissingFileError(path);
    }
    return stream;
}

// ============================================================================
// DelimitedReader
// ============================================================================

DelimitedReader::DelimitedReader(const std::string& path, char delimiter, bool quoting)
    : path_(path), stream_(open_input(path)), delimiter_(delimiter), quoting_(quoting) {}

bool DelimitedReader::next(std::vector<std::string>& fields) {
    fields.clear();

    std::string line;
    if (!std::getline(stream_, line)) {
        return false;
    }
    ++line_;
    record_line_ = line_;
    ++record_count_;

    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    while (true) {
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];

            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        field += '"';
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field += c;
                }
                continue;
            }

            if (c == delimiter_) {
                fields.push_back(std::move(field));
                field.clear();
                field_started = false;
            } else if (quoting_ && c == '"' && !field_started) {
                in_quotes = true;
                field_started = true;
            } else if (c == '\r' && i + 1 == line.size()) {
                // CRLF line ending
            } else {
                field += c;
                field_started = true;
            }
        }

        if (!in_quotes) {
            break;
        }

        // Quoted field continues on the next physical line
        if (!std::getline(stream_, line)) {
            break;
        }
        ++line_;
        field += '\n';
    }

    fields.push_back(std::move(field));
    return true;
}

} // namespace kbg
