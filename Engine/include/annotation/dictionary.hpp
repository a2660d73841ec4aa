#pragma once

#include <export.hpp>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Rosetta {

/**
 * @brief Dictionary data for one headword. readings[0] belongs to sense 1.
 */
struct DictionaryEntry {
    std::vector<std::string> readings;
};

/**
 * @brief Headword lookup used to fill in missing readings.
 *
 * Loading a dictionary file (EDICT, JMdict, ...) is left to the embedding
 * application, which adapts its own structure to this interface.
 */
class ROSETTA_API Dictionary {
public:
    virtual ~Dictionary() = default;

    virtual std::optional<DictionaryEntry> lookup(const std::string& headword) const = 0;
};

/**
 * @brief Dictionary held entirely in memory.
 */
class ROSETTA_API MemoryDictionary : public Dictionary {
public:
    MemoryDictionary() = default;
    MemoryDictionary(std::initializer_list<std::pair<const std::string, std::vector<std::string>>> entries);

    /**
     * @brief Append readings to @p headword, creating the entry if needed.
     */
    void add(const std::string& headword, std::vector<std::string> readings);

    std::optional<DictionaryEntry> lookup(const std::string& headword) const override;

    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, DictionaryEntry> entries_;
};

} // namespace Rosetta
