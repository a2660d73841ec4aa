#pragma once

#include <stdexcept>
#include <string>

namespace Rosetta {

/**
 * @brief Base class for every error raised by the corpus readers.
 */
class CorpusError : public std::runtime_error {
public:
    explicit CorpusError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A source could not be opened or a row has the wrong shape.
 *
 * Raised during construction; no reader object is produced.
 */
class InvalidFileError : public CorpusError {
public:
    explicit InvalidFileError(const std::string& msg) : CorpusError(msg) {}
};

/**
 * @brief A lookup key is well-formed but not present in the index.
 */
class InvalidIDError : public CorpusError {
public:
    explicit InvalidIDError(const std::string& msg) : CorpusError(msg) {}
};

/**
 * @brief The requested data was never loaded (e.g. sentence details from
 * a three-column file).
 */
class MissingDataError : public CorpusError {
public:
    explicit MissingDataError(const std::string& msg) : CorpusError(msg) {}
};

/**
 * @brief An annotated word does not match the Tanaka word grammar.
 */
class EntryGrammarError : public CorpusError {
public:
    EntryGrammarError(const std::string& token, const std::string& sentence)
        : CorpusError("Could not interpret word " + token + " in sentence:\n" + sentence),
          token_(token), sentence_(sentence) {}

    const std::string& token() const { return token_; }
    const std::string& sentence() const { return sentence_; }

private:
    std::string token_;
    std::string sentence_;
};

/**
 * @brief A configuration value is outside its recognised set.
 */
class InvalidArgumentError : public CorpusError {
public:
    explicit InvalidArgumentError(const std::string& msg) : CorpusError(msg) {}
};

} // namespace Rosetta
