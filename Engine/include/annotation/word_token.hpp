#pragma once

#include <export.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Rosetta {

/**
 * @brief One word of a Tanaka-annotated sentence.
 *
 * Only the headword is mandatory. An absent display form means the word
 * appears in the sentence exactly as its headword.
 */
struct ROSETTA_API WordToken {
    std::string headword;
    std::optional<std::string> reading;
    std::optional<int> sense;           // 1-based dictionary sense
    std::optional<std::string> display;
    bool example = false;               // checked, good example of the word

    /**
     * @brief Display form, falling back to the headword.
     */
    const std::string& resolve_display() const {
        return display ? *display : headword;
    }

    /**
     * @brief Annotation text, e.g. `為る(する){し}` or `立て(たて)[2]{たて}~`.
     * A zero sense is left out.
     */
    std::string render() const;

    /**
     * @brief Field-wise equality, comparing resolved display forms.
     */
    bool operator==(const WordToken& other) const {
        return headword == other.headword &&
               sense == other.sense &&
               example == other.example &&
               reading == other.reading &&
               resolve_display() == other.resolve_display();
    }

    bool operator!=(const WordToken& other) const { return !(*this == other); }
};

using WordSequence = std::vector<WordToken>;

inline std::ostream& operator<<(std::ostream& os, const WordToken& word) {
    return os << word.render();
}

} // namespace Rosetta
