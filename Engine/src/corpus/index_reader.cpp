#include <corpus/index_reader.hpp>
#include <corpus/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <sstream>

namespace Rosetta {

IndexReader::IndexReader(const TsvSource& source, IndexReaderConfig config)
    : source_(source.describe()),
      has_dictionary_(config.dictionary != nullptr),
      sentence_id_subset_(config.sentence_ids) {
    Timer timer;
    Logger::step("Loading annotated sentences from " + source_ +
                 (has_dictionary_ ? " (resolving readings)" : ""));

    WordGrammarParser parser(std::move(config.splitter));
    ReadingResolver resolver(std::move(config.dictionary));
    TsvReader reader(source);
    size_t words = 0;

    while (reader.has_next()) {
        Row row = reader.read_next();

        if (row.size() != 3) {
            throw InvalidFileError("Invalid jpn_indices file - expected 3 columns, found " +
                                   std::to_string(row.size()) + " at " + reader.source_name() +
                                   ":" + std::to_string(reader.line_number()));
        }

        auto sentence_id = TsvReader::parse_id(row[0]);
        auto meaning_id = TsvReader::parse_id(row[1]);
        if (!sentence_id || !meaning_id) {
            throw InvalidFileError("Invalid sentence id in jpn_indices file at " +
                                   reader.source_name() + ":" +
                                   std::to_string(reader.line_number()));
        }

        if (config.row_filter && config.row_filter(row)) continue;
        if (config.sentence_ids && config.sentence_ids->count(*sentence_id) == 0) continue;

        WordSequence sentence = parser.parse_sentence(row[2]);
        resolver.resolve(sentence);
        words += sentence.size();

        links_[*sentence_id] = *meaning_id;
        sentences_[*sentence_id] = std::move(sentence);
    }

    std::ostringstream msg;
    msg << "Parsed " << sentences_.size() << " annotated sentences (" << words << " words, "
        << timer.elapsed_ms() << "ms)";
    Logger::success(msg.str());
}

const WordSequence& IndexReader::at(const SentenceID& id) const {
    auto it = sentences_.find(id);
    if (it == sentences_.end()) {
        throw InvalidIDError("Sentence ID " + std::to_string(id) + " not found");
    }
    return it->second;
}

bool IndexReader::contains(const SentenceID& id) const {
    return sentences_.count(id) > 0;
}

std::vector<SentenceID> IndexReader::keys() const {
    std::vector<SentenceID> ids;
    ids.reserve(sentences_.size());
    for (const auto& [id, sentence] : sentences_) ids.push_back(id);
    return ids;
}

SentenceID IndexReader::link(SentenceID id) const {
    auto it = links_.find(id);
    if (it == links_.end()) {
        throw InvalidIDError("Sentence ID " + std::to_string(id) + " not found");
    }
    return it->second;
}

std::string IndexReader::repr() const {
    return "IndexReader(jpn_indices='" + source_ + "')";
}

} // namespace Rosetta
