#include <corpus/tsv_reader.hpp>
#include <corpus/errors.hpp>
#include <charconv>

namespace Rosetta {

std::string TsvSource::describe() const {
    if (!is_stream()) return path_;
    return name_.empty() ? std::string("<stream>") : name_;
}

TsvReader::TsvReader(const TsvSource& source) : source_name_(source.describe()) {
    if (source.is_stream()) {
        in_ = source.stream();
    } else {
        file_.open(source.path());
        if (!file_.is_open()) {
            throw InvalidFileError("Could not open file: " + source.path());
        }
        in_ = &file_;
    }
    advance_buffer();
}

void TsvReader::advance_buffer() {
    has_more_data_ = false;
    std::string line;
    while (std::getline(*in_, line)) {
        ++lines_read_;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        next_line_ = std::move(line);
        next_line_number_ = lines_read_;
        has_more_data_ = true;
        return;
    }
    next_line_.clear();
}

Row TsvReader::read_next() {
    Row row = split(next_line_);
    current_line_ = next_line_number_;
    advance_buffer();
    return row;
}

Row TsvReader::split(const std::string& line, char delimiter) {
    Row fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::optional<SentenceID> TsvReader::parse_id(const std::string& field) {
    size_t first = field.find_first_not_of(' ');
    if (first == std::string::npos) return std::nullopt;
    size_t last = field.find_last_not_of(' ');

    const char* begin = field.data() + first;
    const char* end = field.data() + last + 1;
    if (*begin == '+') {
        ++begin;
        if (begin == end || *begin == '-') return std::nullopt;
    }

    SentenceID value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

} // namespace Rosetta
