#pragma once

#include <corpus/keyed_index.hpp>
#include <corpus/link_graph.hpp>
#include <corpus/tsv_reader.hpp>
#include <corpus/types.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace Rosetta {

struct LinksReaderConfig {
    // Restrict links to these sentences; nullopt keeps every link
    std::optional<std::unordered_set<SentenceID>> sentence_ids;

    // Which endpoints are checked against sentence_ids
    LinkFilterMode filter = LinkFilterMode::Both;

    GroupingStrategy strategy = GroupingStrategy::Greedy;

    // Return true to drop the row
    RowFilter row_filter;
};

/**
 * @brief Reader for Tatoeba `links.csv`. Maps every linked sentence id
 * to its translation group.
 */
class ROSETTA_API LinksReader : public KeyedIndex<SentenceID, TranslationGroup> {
public:
    /**
     * @throws InvalidFileError if a row is not exactly two integers.
     */
    explicit LinksReader(const TsvSource& source, LinksReaderConfig config = {});

    const TranslationGroup& at(const SentenceID& id) const override;
    bool contains(const SentenceID& id) const override;
    std::vector<SentenceID> keys() const override;
    size_t size() const override { return graph_.assignment.size(); }

    /**
     * @brief Translation group a sentence belongs to. All members of a
     * group share the returned object.
     * @throws InvalidIDError if the sentence is in no group.
     */
    const TranslationGroup& group(SentenceID id) const { return at(id); }

    /**
     * @brief Every translation group, in creation order.
     */
    std::vector<TranslationGroup> groups() const;

    const LinkGraph& graph() const { return graph_; }

    LinkFilterMode filter_mode() const { return filter_mode_; }

    /**
     * @brief Allow-list the links were screened against; nullopt if none.
     */
    const std::optional<std::unordered_set<SentenceID>>& sentence_id_subset() const {
        return sentence_id_subset_;
    }

    GroupingStrategy strategy() const { return strategy_; }

    const std::string& source() const { return source_; }
    std::string repr() const;

private:
    std::string source_;
    LinkFilterMode filter_mode_;
    std::optional<std::unordered_set<SentenceID>> sentence_id_subset_;
    GroupingStrategy strategy_;
    LinkGraph graph_;
};

} // namespace Rosetta
