#pragma once

#include <annotation/word_token.hpp>
#include <export.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Rosetta {

using SentenceSplitter = std::function<std::vector<std::string>(const std::string&)>;

/**
 * @brief Decoder for the Tanaka corpus word annotation grammar.
 *
 * Each word is written as
 *
 *     headword(reading)[sense]{display}~
 *
 * where everything after the headword is optional but must appear in that
 * order. Matching is anchored at the start of the word; an optional part
 * that is opened but not closed is treated as absent, and anything after
 * the last recognised part (such as the `|1` form index) is ignored.
 */
class ROSETTA_API WordGrammarParser {
public:
    explicit WordGrammarParser(SentenceSplitter splitter = split_on_space);

    /**
     * @brief Split @p text into words and decode each one.
     *
     * Empty words produced by the splitter are skipped.
     *
     * @throws EntryGrammarError on the first word without a headword.
     */
    WordSequence parse_sentence(const std::string& text) const;

    /**
     * @brief Decode a single word. Returns nullopt if it has no headword
     * or its sense number does not fit in an int.
     */
    static std::optional<WordToken> parse_word(std::string_view word);

    /**
     * @brief Default splitter: every single space is a separator.
     */
    static std::vector<std::string> split_on_space(const std::string& text);

private:
    SentenceSplitter splitter_;
};

} // namespace Rosetta
