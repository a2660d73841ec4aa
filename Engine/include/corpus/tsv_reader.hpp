#pragma once

#include <corpus/types.hpp>
#include <export.hpp>
#include <cstdint>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <utility>

namespace Rosetta {

/**
 * @brief Where a corpus file comes from: a path on disk or a stream
 * owned by the caller.
 */
class ROSETTA_API TsvSource {
public:
    TsvSource(std::string path) : path_(std::move(path)) {}
    TsvSource(const char* path) : path_(path) {}

    /**
     * @brief Borrow an already open stream. @p name is used in messages
     * and repr strings; it defaults to "<stream>".
     */
    TsvSource(std::istream& stream, std::string name = "")
        : stream_(&stream), name_(std::move(name)) {}

    bool is_stream() const { return stream_ != nullptr; }
    const std::string& path() const { return path_; }
    std::istream* stream() const { return stream_; }

    /**
     * @brief The path, or the stream name.
     */
    std::string describe() const;

private:
    std::string path_;
    std::istream* stream_ = nullptr;
    std::string name_;
};

/**
 * @brief Tab-delimited row reader over a TsvSource.
 *
 * Fields are split on every tab, so empty fields are preserved. A trailing
 * carriage return is stripped and blank lines are skipped.
 */
class ROSETTA_API TsvReader {
public:
    /**
     * @throws InvalidFileError if a path source cannot be opened.
     */
    explicit TsvReader(const TsvSource& source);

    TsvReader(const TsvReader&) = delete;
    TsvReader& operator=(const TsvReader&) = delete;

    bool has_next() const { return has_more_data_; }

    /**
     * @brief Return the buffered row and advance to the next one.
     * Must only be called while has_next() is true.
     */
    Row read_next();

    /**
     * @brief 1-based line number of the row last returned by read_next().
     */
    uint64_t line_number() const { return current_line_; }

    const std::string& source_name() const { return source_name_; }

    static Row split(const std::string& line, char delimiter = '\t');

    /**
     * @brief Parse a decimal sentence id. Surrounding spaces are allowed;
     * anything else makes the result nullopt.
     */
    static std::optional<SentenceID> parse_id(const std::string& field);

private:
    void advance_buffer();

    std::ifstream file_;
    std::istream* in_ = nullptr;
    std::string source_name_;
    std::string next_line_;
    uint64_t lines_read_ = 0;
    uint64_t next_line_number_ = 0;
    uint64_t current_line_ = 0;
    bool has_more_data_ = false;
};

} // namespace Rosetta
