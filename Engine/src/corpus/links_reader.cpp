#include <corpus/links_reader.hpp>
#include <corpus/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <sstream>

namespace Rosetta {

LinksReader::LinksReader(const TsvSource& source, LinksReaderConfig config)
    : source_(source.describe()),
      filter_mode_(config.filter),
      sentence_id_subset_(config.sentence_ids),
      strategy_(config.strategy) {
    Timer timer;
    Logger::step("Loading links from " + source_ + " (" + to_string(strategy_) + " grouping)");

    LinkGraphBuilder builder(LinkFilter(config.filter, std::move(config.sentence_ids)), strategy_);
    TsvReader reader(source);
    size_t rows = 0;

    while (reader.has_next()) {
        Row row = reader.read_next();
        ++rows;

        std::optional<SentenceID> sentence_id;
        std::optional<SentenceID> translation_id;
        if (row.size() == 2) {
            sentence_id = TsvReader::parse_id(row[0]);
            translation_id = TsvReader::parse_id(row[1]);
        }
        if (!sentence_id || !translation_id) {
            throw InvalidFileError("Invalid links file - files must have 2 integer columns (" +
                                   reader.source_name() + ":" +
                                   std::to_string(reader.line_number()) + ")");
        }

        if (config.row_filter && config.row_filter(row)) continue;

        builder.add_edge(*sentence_id, *translation_id);
    }

    size_t kept = builder.edges_kept();
    graph_ = builder.finalize();

    std::ostringstream msg;
    msg << "Grouped " << graph_.assignment.size() << " sentences into " << graph_.groups.size()
        << " translation groups from " << kept << "/" << rows << " links ("
        << timer.elapsed_ms() << "ms)";
    Logger::success(msg.str());
}

const TranslationGroup& LinksReader::at(const SentenceID& id) const {
    const TranslationGroup* group = graph_.find(id);
    if (!group) {
        throw InvalidIDError("Could not find sentence ID " + std::to_string(id) + " in any groups");
    }
    return *group;
}

bool LinksReader::contains(const SentenceID& id) const {
    return graph_.assignment.count(id) > 0;
}

std::vector<SentenceID> LinksReader::keys() const {
    std::vector<SentenceID> ids;
    ids.reserve(graph_.assignment.size());
    for (const auto& [id, group] : graph_.assignment) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<TranslationGroup> LinksReader::groups() const {
    std::vector<TranslationGroup> out;
    out.reserve(graph_.groups.size());
    for (const auto& [gid, group] : graph_.groups) out.push_back(group);
    return out;
}

std::string LinksReader::repr() const {
    return "LinksReader(links='" + source_ + "')";
}

} // namespace Rosetta
