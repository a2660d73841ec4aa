#include <corpus/link_graph.hpp>
#include <corpus/errors.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

namespace Rosetta {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

LinkFilterMode parse_link_filter_mode(const std::string& value) {
    std::string v = lowercase(value);
    if (v == "sentence_id" || v == "sent_id") return LinkFilterMode::SentenceId;
    if (v == "translation_id" || v == "trans_id") return LinkFilterMode::TranslationId;
    if (v == "both") return LinkFilterMode::Both;
    throw InvalidArgumentError("Invalid sentence id filter: " + value);
}

std::string to_string(LinkFilterMode mode) {
    switch (mode) {
        case LinkFilterMode::SentenceId:    return "sentence_id";
        case LinkFilterMode::TranslationId: return "translation_id";
        case LinkFilterMode::Both:          return "both";
    }
    return "both";
}

GroupingStrategy parse_grouping_strategy(const std::string& value) {
    std::string v = lowercase(value);
    if (v == "greedy") return GroupingStrategy::Greedy;
    if (v == "union_find") return GroupingStrategy::UnionFind;
    throw InvalidArgumentError("Invalid grouping strategy: " + value);
}

std::string to_string(GroupingStrategy strategy) {
    return strategy == GroupingStrategy::UnionFind ? "union_find" : "greedy";
}

// -----------------------------------------------------------------------------
// LinkFilter
// -----------------------------------------------------------------------------

LinkFilter::LinkFilter(LinkFilterMode mode, std::optional<IdSet> allowed)
    : mode_(mode), allowed_(std::move(allowed)) {
    if (allowed_) {
        check_sentence_ = (mode_ != LinkFilterMode::TranslationId);
        check_translation_ = (mode_ != LinkFilterMode::SentenceId);
    }
}

bool LinkFilter::accepts(SentenceID sentence_id, SentenceID translation_id) const {
    if (check_sentence_ && allowed_->count(sentence_id) == 0) return false;
    if (check_translation_ && allowed_->count(translation_id) == 0) return false;
    return true;
}

// -----------------------------------------------------------------------------
// LinkGraph
// -----------------------------------------------------------------------------

const TranslationGroup* LinkGraph::find(SentenceID id) const {
    auto it = assignment.find(id);
    if (it == assignment.end()) return nullptr;
    return &groups.at(it->second);
}

// -----------------------------------------------------------------------------
// LinkGraphBuilder
// -----------------------------------------------------------------------------

LinkGraphBuilder::LinkGraphBuilder(LinkFilter filter, GroupingStrategy strategy)
    : filter_(std::move(filter)), strategy_(strategy) {}

bool LinkGraphBuilder::add_edge(SentenceID sentence_id, SentenceID translation_id) {
    ++edges_seen_;
    if (!filter_.accepts(sentence_id, translation_id)) return false;
    ++edges_kept_;

    if (strategy_ == GroupingStrategy::Greedy) {
        add_greedy(sentence_id, translation_id);
    } else {
        add_union(sentence_id, translation_id);
    }
    return true;
}

void LinkGraphBuilder::add_greedy(SentenceID a, SentenceID b) {
    // When a and b already sit in different groups, a's group wins and
    // b's old group keeps its membership list.
    auto it = assignment_.find(a);
    if (it != assignment_.end()) {
        GroupID g = it->second;
        groups_[g].insert(b);
        assignment_[b] = g;
        return;
    }

    it = assignment_.find(b);
    if (it != assignment_.end()) {
        GroupID g = it->second;
        groups_[g].insert(a);
        assignment_[a] = g;
        return;
    }

    GroupID g = next_group_id_++;
    groups_[g] = {a, b};
    assignment_[a] = g;
    assignment_[b] = g;
}

void LinkGraphBuilder::touch(SentenceID id) {
    if (parent_.emplace(id, id).second) {
        rank_[id] = 0;
        order_.push_back(id);
    }
}

SentenceID LinkGraphBuilder::find_root(SentenceID id) {
    SentenceID root = id;
    while (parent_[root] != root) root = parent_[root];

    // Path compression
    while (parent_[id] != root) {
        SentenceID next = parent_[id];
        parent_[id] = root;
        id = next;
    }
    return root;
}

void LinkGraphBuilder::add_union(SentenceID a, SentenceID b) {
    touch(a);
    touch(b);

    SentenceID ra = find_root(a);
    SentenceID rb = find_root(b);
    if (ra == rb) return;

    if (rank_[ra] < rank_[rb]) std::swap(ra, rb);
    parent_[rb] = ra;
    if (rank_[ra] == rank_[rb]) ++rank_[ra];
}

LinkGraph LinkGraphBuilder::finalize() {
    LinkGraph graph;

    if (strategy_ == GroupingStrategy::Greedy) {
        graph.assignment = std::move(assignment_);
        graph.groups = std::move(groups_);
    } else {
        std::unordered_map<SentenceID, GroupID> root_group;
        GroupID next = 0;
        for (SentenceID id : order_) {
            SentenceID root = find_root(id);
            auto [it, inserted] = root_group.emplace(root, next);
            if (inserted) ++next;
            graph.assignment[id] = it->second;
            graph.groups[it->second].insert(id);
        }
    }

    assignment_.clear();
    groups_.clear();
    parent_.clear();
    rank_.clear();
    order_.clear();
    next_group_id_ = 0;
    return graph;
}

} // namespace Rosetta
