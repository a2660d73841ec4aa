#include <annotation/word_grammar.hpp>
#include <corpus/errors.hpp>
#include <charconv>
#include <limits>
#include <utility>

namespace Rosetta {

namespace {

constexpr std::string_view kHeadwordStops = "([{|~";

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

// Match `open body close` at pos, where body is one or more characters
// other than close. On success pos moves past the closing character.
std::optional<std::string_view> match_bracketed(std::string_view word, size_t& pos,
                                                char open, char close) {
    if (pos >= word.size() || word[pos] != open) return std::nullopt;

    size_t end = word.find(close, pos + 1);
    if (end == std::string_view::npos || end == pos + 1) return std::nullopt;

    std::string_view body = word.substr(pos + 1, end - pos - 1);
    pos = end + 1;
    return body;
}

} // namespace

WordGrammarParser::WordGrammarParser(SentenceSplitter splitter)
    : splitter_(std::move(splitter)) {
    if (!splitter_) splitter_ = split_on_space;
}

std::vector<std::string> WordGrammarParser::split_on_space(const std::string& text) {
    std::vector<std::string> words;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(' ', start);
        if (pos == std::string::npos) {
            words.push_back(text.substr(start));
            break;
        }
        words.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return words;
}

std::optional<WordToken> WordGrammarParser::parse_word(std::string_view word) {
    size_t pos = word.find_first_of(kHeadwordStops);
    if (pos == std::string_view::npos) pos = word.size();
    if (pos == 0) return std::nullopt;

    WordToken token;
    token.headword = std::string(word.substr(0, pos));

    if (auto reading = match_bracketed(word, pos, '(', ')')) {
        token.reading = std::string(*reading);
    }

    size_t sense_pos = pos;
    if (auto sense = match_bracketed(word, sense_pos, '[', ']')) {
        bool digits = true;
        for (char c : *sense) {
            if (!is_ascii_digit(c)) { digits = false; break; }
        }

        int value = 0;
        if (digits) {
            auto [ptr, ec] = std::from_chars(sense->data(), sense->data() + sense->size(), value);
            // Overlong digit runs saturate and stay out of range for any entry
            if (ec == std::errc::result_out_of_range) value = std::numeric_limits<int>::max();
            token.sense = value;
            pos = sense_pos;
        }
    }

    if (auto display = match_bracketed(word, pos, '{', '}')) {
        token.display = std::string(*display);
    }

    if (pos < word.size() && word[pos] == '~') {
        token.example = true;
        ++pos;
    }

    // Trailing digits and anything after them carry no information.
    return token;
}

WordSequence WordGrammarParser::parse_sentence(const std::string& text) const {
    WordSequence sentence;
    for (const auto& word : splitter_(text)) {
        if (word.empty()) continue;

        auto token = parse_word(word);
        if (!token) {
            throw EntryGrammarError(word, text);
        }
        sentence.push_back(std::move(*token));
    }
    return sentence;
}

} // namespace Rosetta
