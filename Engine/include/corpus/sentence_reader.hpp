#pragma once

#include <corpus/keyed_index.hpp>
#include <corpus/tsv_reader.hpp>
#include <corpus/types.hpp>
#include <utils/time.hpp>
#include <export.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Rosetta {

/**
 * @brief Extra columns of `sentences_detailed.csv`. `\N` becomes nullopt.
 */
struct SentenceDetails {
    std::optional<std::string> username;
    std::optional<DateTime> date_added;
    std::optional<DateTime> date_modified;

    bool operator==(const SentenceDetails&) const = default;
};

struct SentenceReaderConfig {
    // Languages to keep; nullopt keeps every language
    std::optional<std::set<std::string>> languages = std::set<std::string>{"jpn", "eng"};

    // Called before the language filter; return true to drop the row
    RowFilter row_filter;
};

/**
 * @brief Reader for Tatoeba `sentences.csv` / `sentences_detailed.csv`.
 *
 * The column count of the first row (3 or 6) decides the format and every
 * other row must match it. Maps sentence id to sentence text.
 */
class ROSETTA_API SentenceReader : public KeyedIndex<SentenceID, std::string> {
public:
    /**
     * @throws InvalidFileError on an unopenable source, a bad column count,
     *         a non-integer id or a malformed timestamp.
     */
    explicit SentenceReader(const TsvSource& source, SentenceReaderConfig config = {});

    const std::string& at(const SentenceID& id) const override;
    bool contains(const SentenceID& id) const override;
    std::vector<SentenceID> keys() const override;
    size_t size() const override { return sentences_.size(); }

    /**
     * @brief Text of a sentence.
     * @throws InvalidIDError
     */
    const std::string& sentence(SentenceID id) const { return at(id); }

    /**
     * @brief Three-letter language code of a sentence.
     * @throws InvalidIDError
     */
    const std::string& language(SentenceID id) const;

    /**
     * @brief Username and dates of a sentence.
     * @throws MissingDataError if the source had only three columns.
     * @throws InvalidIDError
     */
    const SentenceDetails& details(SentenceID id) const;

    bool has_details() const { return details_.has_value(); }

    std::vector<SentenceID> sentence_ids() const { return keys(); }

    /**
     * @brief Languages present after filtering, sorted.
     */
    std::vector<std::string> languages() const;

    const std::string& source() const { return source_; }
    std::string repr() const;

private:
    std::string source_;
    std::map<SentenceID, std::string> sentences_;
    std::map<std::string, std::unordered_set<SentenceID>> language_ids_;
    std::optional<std::unordered_map<SentenceID, SentenceDetails>> details_;
};

} // namespace Rosetta
