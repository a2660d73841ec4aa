#include <annotation/reading_resolver.hpp>
#include <algorithm>
#include <utility>

namespace Rosetta {

ReadingResolver::ReadingResolver(std::shared_ptr<const Dictionary> dictionary)
    : dictionary_(std::move(dictionary)) {}

std::optional<std::string> ReadingResolver::candidate_reading(const WordToken& word) const {
    if (!dictionary_) return std::nullopt;

    auto entry = dictionary_->lookup(word.headword);
    if (!entry || entry->readings.empty()) return std::nullopt;

    const auto& readings = entry->readings;
    if (word.sense && *word.sense >= 1 &&
        static_cast<size_t>(*word.sense) <= readings.size()) {
        return readings[*word.sense - 1];
    }

    bool uniform = std::all_of(readings.begin(), readings.end(),
                               [&](const std::string& r) { return r == readings.front(); });
    if (uniform) return readings.front();

    return std::nullopt;
}

void ReadingResolver::resolve(WordSequence& sentence) const {
    if (!dictionary_) return;

    for (auto& word : sentence) {
        if (word.reading) continue;

        auto reading = candidate_reading(word);
        if (reading && *reading != word.headword) {
            word.reading = std::move(*reading);
        }
    }
}

} // namespace Rosetta
