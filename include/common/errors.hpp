#pragma once

#include <stdexcept>
#include <string>

namespace kbg {

/**
 * @brief Failure categories surfaced by ingestion and export
 */
enum class ErrorKind {
    UnknownFormat,     ///< No extractor matches the (kb, format) pair
    MalformedRecord,   ///< Row or stanza lacks a required field
    MissingFile        ///< Declared input path does not exist
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownFormat: return "unknown_format";
        case ErrorKind::MalformedRecord: return "malformed_record";
        case ErrorKind::MissingFile: return "missing_file";
    }
    return "unknown";
}

/**
 * @brief Base class for all ingestion errors
 */
class IngestError : public std::runtime_error {
public:
    IngestError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class UnknownFormatError : public IngestError {
public:
    UnknownFormatError(const std::string& kb, const std::string& format)
        : IngestError(ErrorKind::UnknownFormat,
                      "No extractor for knowledge base '" + kb + "' with format '" + format + "'"),
          kb_(kb), format_(format) {}

    const std::string& kb() const { return kb_; }
    const std::string& format() const { return format_; }

private:
    std::string kb_;
    std::string format_;
};

class MalformedRecordError : public IngestError {
public:
    MalformedRecordError(const std::string& file, size_t line, const std::string& reason)
        : IngestError(ErrorKind::MalformedRecord,
                      file + ":" + std::to_string(line) + ": " + reason),
          file_(file), line_(line) {}

    const std::string& file() const { return file_; }
    size_t line() const { return line_; }

private:
    std::string file_;
    size_t line_;
};

class MissingFileError : public IngestError {
public:
    explicit MissingFileError(const std::string& path)
        : IngestError(ErrorKind::MissingFile, "File not found: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace kbg
