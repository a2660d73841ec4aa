#include <corpus/corpus_index.hpp>
#include <corpus/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Rosetta {

CorpusIndex::CorpusIndex(const CorpusConfig& config) {
    Timer timer;
    Logger::info("Building corpus index");

    if (config.sentences) {
        sentences_ = std::make_unique<SentenceReader>(*config.sentences, config.sentence_config);
    }
    if (config.links) {
        links_ = std::make_unique<LinksReader>(*config.links, config.links_config);
    }
    if (config.jpn_indices) {
        annotations_ = std::make_unique<IndexReader>(*config.jpn_indices, config.index_config);
    }

    Logger::info("Corpus index ready in " + std::to_string(timer.elapsed_sec()) + "s");
}

const SentenceReader& CorpusIndex::sentences() const {
    if (!sentences_) throw MissingDataError("No sentences source was loaded.");
    return *sentences_;
}

const LinksReader& CorpusIndex::links() const {
    if (!links_) throw MissingDataError("No links source was loaded.");
    return *links_;
}

const IndexReader& CorpusIndex::annotations() const {
    if (!annotations_) throw MissingDataError("No jpn_indices source was loaded.");
    return *annotations_;
}

const std::string& CorpusIndex::sentence_text(SentenceID id) const {
    return sentences().sentence(id);
}

const std::string& CorpusIndex::language(SentenceID id) const {
    return sentences().language(id);
}

const SentenceDetails& CorpusIndex::details(SentenceID id) const {
    if (!sentences_) throw MissingDataError("Detailed information not loaded.");
    return sentences_->details(id);
}

bool CorpusIndex::has_details() const {
    return sentences_ && sentences_->has_details();
}

const TranslationGroup& CorpusIndex::group(SentenceID id) const {
    return links().group(id);
}

std::vector<TranslationGroup> CorpusIndex::groups() const {
    return links().groups();
}

const WordSequence& CorpusIndex::annotated_words(SentenceID id) const {
    return annotations().words(id);
}

SentenceID CorpusIndex::linked_meaning(SentenceID id) const {
    return annotations().link(id);
}

std::vector<SentenceID> CorpusIndex::sentence_ids() const {
    return sentences().sentence_ids();
}

std::vector<std::string> CorpusIndex::languages() const {
    return sentences().languages();
}

} // namespace Rosetta
