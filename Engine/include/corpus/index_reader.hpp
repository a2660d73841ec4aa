#pragma once

#include <annotation/dictionary.hpp>
#include <annotation/reading_resolver.hpp>
#include <annotation/word_grammar.hpp>
#include <annotation/word_token.hpp>
#include <corpus/keyed_index.hpp>
#include <corpus/tsv_reader.hpp>
#include <corpus/types.hpp>
#include <export.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace Rosetta {

struct IndexReaderConfig {
    // Sentences to load; nullopt loads every row
    std::optional<std::unordered_set<SentenceID>> sentence_ids;

    // Used to fill in readings the annotation leaves out
    std::shared_ptr<const Dictionary> dictionary;

    // Empty means split on single spaces
    SentenceSplitter splitter;

    // Return true to drop the row
    RowFilter row_filter;
};

/**
 * @brief Reader for the `jpn_indices.csv` sentence-dictionary linking file.
 *
 * Rows are `sentence id, meaning id, annotated text`. Every sentence is
 * parsed and resolved while loading, so grammar errors surface here.
 */
class ROSETTA_API IndexReader : public KeyedIndex<SentenceID, WordSequence> {
public:
    /**
     * @throws InvalidFileError on a malformed row.
     * @throws EntryGrammarError on an annotated word without a headword.
     */
    explicit IndexReader(const TsvSource& source, IndexReaderConfig config = {});

    const WordSequence& at(const SentenceID& id) const override;
    bool contains(const SentenceID& id) const override;
    std::vector<SentenceID> keys() const override;
    size_t size() const override { return sentences_.size(); }

    /**
     * @brief Annotated words of a sentence.
     * @throws InvalidIDError
     */
    const WordSequence& words(SentenceID id) const { return at(id); }

    /**
     * @brief Id of the translation this annotation was made against.
     * @throws InvalidIDError
     */
    SentenceID link(SentenceID id) const;

    bool resolves_readings() const { return has_dictionary_; }

    // Allow-list the rows were screened against; nullopt if none
    const std::optional<std::unordered_set<SentenceID>>& sentence_id_subset() const {
        return sentence_id_subset_;
    }

    const std::string& source() const { return source_; }
    std::string repr() const;

private:
    std::string source_;
    bool has_dictionary_ = false;
    std::optional<std::unordered_set<SentenceID>> sentence_id_subset_;
    std::map<SentenceID, WordSequence> sentences_;
    std::map<SentenceID, SentenceID> links_;
};

} // namespace Rosetta
