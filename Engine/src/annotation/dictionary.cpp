#include <annotation/dictionary.hpp>
#include <iterator>

namespace Rosetta {

MemoryDictionary::MemoryDictionary(
    std::initializer_list<std::pair<const std::string, std::vector<std::string>>> entries) {
    for (const auto& [headword, readings] : entries) {
        add(headword, readings);
    }
}

void MemoryDictionary::add(const std::string& headword, std::vector<std::string> readings) {
    auto& entry = entries_[headword];
    entry.readings.insert(entry.readings.end(),
                          std::make_move_iterator(readings.begin()),
                          std::make_move_iterator(readings.end()));
}

std::optional<DictionaryEntry> MemoryDictionary::lookup(const std::string& headword) const {
    auto it = entries_.find(headword);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

} // namespace Rosetta
