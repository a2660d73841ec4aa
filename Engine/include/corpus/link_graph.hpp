#pragma once

#include <corpus/types.hpp>
#include <export.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Rosetta {

using GroupID = uint32_t;

/**
 * @brief Which endpoints of a link must be on the allow-list.
 */
enum class LinkFilterMode {
    SentenceId,
    TranslationId,
    Both
};

/**
 * @brief Parse "sentence_id", "translation_id" or "both" (case-insensitive;
 * "sent_id" and "trans_id" are accepted as well).
 * @throws InvalidArgumentError for any other value.
 */
ROSETTA_API LinkFilterMode parse_link_filter_mode(const std::string& value);
ROSETTA_API std::string to_string(LinkFilterMode mode);

/**
 * @brief How edges are folded into groups.
 *
 * Greedy attaches each edge to the group its first already-seen endpoint
 * belongs to and never merges groups. This reproduces the grouping of the
 * Tatoeba links file, where every sentence's links are contiguous.
 * UnionFind computes true connected components.
 */
enum class GroupingStrategy {
    Greedy,
    UnionFind
};

/**
 * @throws InvalidArgumentError unless @p value is "greedy" or "union_find".
 */
ROSETTA_API GroupingStrategy parse_grouping_strategy(const std::string& value);
ROSETTA_API std::string to_string(GroupingStrategy strategy);

/**
 * @brief Inclusion test applied to every edge before grouping.
 *
 * Without an allow-list every edge passes, whatever the mode.
 */
class ROSETTA_API LinkFilter {
public:
    using IdSet = std::unordered_set<SentenceID>;

    LinkFilter() = default;
    LinkFilter(LinkFilterMode mode, std::optional<IdSet> allowed);

    bool accepts(SentenceID sentence_id, SentenceID translation_id) const;

    LinkFilterMode mode() const { return mode_; }
    bool restricts() const { return allowed_.has_value(); }

private:
    LinkFilterMode mode_ = LinkFilterMode::Both;
    std::optional<IdSet> allowed_;
    bool check_sentence_ = false;
    bool check_translation_ = false;
};

/**
 * @brief Finalised translation groups.
 */
struct ROSETTA_API LinkGraph {
    std::unordered_map<SentenceID, GroupID> assignment;
    std::map<GroupID, TranslationGroup> groups;

    /**
     * @brief Group of @p id, or nullptr if the id was never linked.
     * Every member of a group gets the same object.
     */
    const TranslationGroup* find(SentenceID id) const;

    bool operator==(const LinkGraph&) const = default;
};

/**
 * @brief Builds translation groups from a stream of sentence links.
 */
class ROSETTA_API LinkGraphBuilder {
public:
    explicit LinkGraphBuilder(LinkFilter filter = LinkFilter(),
                              GroupingStrategy strategy = GroupingStrategy::Greedy);

    /**
     * @brief Fold one link into the groups.
     * @return false if the filter rejected the link.
     */
    bool add_edge(SentenceID sentence_id, SentenceID translation_id);

    size_t edges_seen() const { return edges_seen_; }
    size_t edges_kept() const { return edges_kept_; }

    /**
     * @brief Freeze the groups. The builder is left empty.
     */
    LinkGraph finalize();

private:
    void add_greedy(SentenceID a, SentenceID b);
    void add_union(SentenceID a, SentenceID b);
    SentenceID find_root(SentenceID id);
    void touch(SentenceID id);

    LinkFilter filter_;
    GroupingStrategy strategy_;

    // Greedy state
    std::unordered_map<SentenceID, GroupID> assignment_;
    std::map<GroupID, TranslationGroup> groups_;
    GroupID next_group_id_ = 0;

    // Union-find state; order_ keeps first-seen order for stable group ids
    std::unordered_map<SentenceID, SentenceID> parent_;
    std::unordered_map<SentenceID, uint32_t> rank_;
    std::vector<SentenceID> order_;

    size_t edges_seen_ = 0;
    size_t edges_kept_ = 0;
};

} // namespace Rosetta
