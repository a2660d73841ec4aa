#pragma once

#include <corpus/index_reader.hpp>
#include <corpus/links_reader.hpp>
#include <corpus/sentence_reader.hpp>
#include <corpus/tsv_reader.hpp>
#include <corpus/types.hpp>
#include <export.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Rosetta {

/**
 * @brief Sources and reader settings for a CorpusIndex. Any source may be
 * left out; lookups that need it then raise MissingDataError.
 */
struct CorpusConfig {
    std::optional<TsvSource> sentences;
    std::optional<TsvSource> links;
    std::optional<TsvSource> jpn_indices;

    SentenceReaderConfig sentence_config;
    LinksReaderConfig links_config;
    IndexReaderConfig index_config;
};

/**
 * @brief Read-only view over a loaded Tatoeba corpus.
 *
 * Everything is read and validated by the constructor; if any source fails
 * to load the constructor throws and no index exists. Afterwards the index
 * never changes and may be shared between threads.
 */
class ROSETTA_API CorpusIndex {
public:
    explicit CorpusIndex(const CorpusConfig& config);

    /**
     * @throws InvalidIDError, or MissingDataError without a sentences source.
     */
    const std::string& sentence_text(SentenceID id) const;

    /**
     * @throws InvalidIDError, or MissingDataError without a sentences source.
     */
    const std::string& language(SentenceID id) const;

    /**
     * @throws MissingDataError if the sentences source had no detail
     *         columns, otherwise InvalidIDError for an unknown id.
     */
    const SentenceDetails& details(SentenceID id) const;

    /**
     * @throws InvalidIDError, or MissingDataError without a links source.
     */
    const TranslationGroup& group(SentenceID id) const;

    std::vector<TranslationGroup> groups() const;

    /**
     * @throws InvalidIDError, or MissingDataError without a jpn_indices source.
     */
    const WordSequence& annotated_words(SentenceID id) const;

    /**
     * @brief Translation id the annotation source pairs with @p id.
     * @throws InvalidIDError, or MissingDataError without a jpn_indices source.
     */
    SentenceID linked_meaning(SentenceID id) const;

    std::vector<SentenceID> sentence_ids() const;
    std::vector<std::string> languages() const;
    bool has_details() const;

    bool has_sentences() const { return sentences_ != nullptr; }
    bool has_links() const { return links_ != nullptr; }
    bool has_annotations() const { return annotations_ != nullptr; }

    const SentenceReader& sentences() const;
    const LinksReader& links() const;
    const IndexReader& annotations() const;

private:
    std::unique_ptr<SentenceReader> sentences_;
    std::unique_ptr<LinksReader> links_;
    std::unique_ptr<IndexReader> annotations_;
};

} // namespace Rosetta
