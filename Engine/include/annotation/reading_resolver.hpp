#pragma once

#include <annotation/dictionary.hpp>
#include <annotation/word_token.hpp>
#include <export.hpp>
#include <memory>
#include <optional>

namespace Rosetta {

/**
 * @brief Fills in readings that the annotation leaves implicit.
 *
 * For a word without a reading the dictionary entry of its headword is
 * consulted: an in-range sense selects that sense's reading, otherwise a
 * reading is only taken when every sense shares it. A reading identical
 * to the headword (kana-only words) is never stored.
 */
class ROSETTA_API ReadingResolver {
public:
    /**
     * @param dictionary May be null, in which case words pass through
     *                   unchanged.
     */
    explicit ReadingResolver(std::shared_ptr<const Dictionary> dictionary = nullptr);

    bool has_dictionary() const { return dictionary_ != nullptr; }

    /**
     * @brief Resolve readings of every word in place.
     */
    void resolve(WordSequence& sentence) const;

    /**
     * @brief Reading the dictionary implies for @p word, if any. Does not
     * look at word.reading.
     */
    std::optional<std::string> candidate_reading(const WordToken& word) const;

private:
    std::shared_ptr<const Dictionary> dictionary_;
};

} // namespace Rosetta
