#pragma once

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace Rosetta {

using SentenceID = int64_t;

/**
 * @brief Sentences that are all translations of one another.
 */
using TranslationGroup = std::set<SentenceID>;

/**
 * @brief One tab-split line of a corpus file.
 */
using Row = std::vector<std::string>;

/**
 * @brief Row hook applied before any other processing; returning true
 * drops the row.
 */
using RowFilter = std::function<bool(const Row&)>;

} // namespace Rosetta
