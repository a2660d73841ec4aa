#pragma once

#include <cstddef>
#include <vector>

namespace Rosetta {

/**
 * @brief Read-only keyed lookup capability shared by the corpus readers.
 *
 * Implementations are fully built by their constructors and never change
 * afterwards, so every method is const and safe for concurrent readers.
 */
template <typename Key, typename Value>
class KeyedIndex {
public:
    using key_type = Key;
    using mapped_type = Value;

    virtual ~KeyedIndex() = default;

    /**
     * @brief Value for @p key.
     * @throws InvalidIDError if the key is not present.
     */
    virtual const Value& at(const Key& key) const = 0;

    virtual bool contains(const Key& key) const = 0;

    /**
     * @brief All keys, in ascending order.
     */
    virtual std::vector<Key> keys() const = 0;

    virtual size_t size() const = 0;

    bool empty() const { return size() == 0; }

protected:
    KeyedIndex() = default;
    KeyedIndex(const KeyedIndex&) = default;
    KeyedIndex& operator=(const KeyedIndex&) = default;
};

} // namespace Rosetta
