#pragma once

#include <corpus/corpus_index.hpp>
#include <export.hpp>
#include <filesystem>
#include <string>

namespace Rosetta {

/**
 * @brief Build a CorpusConfig from a JSON document.
 *
 * Recognised keys (all optional):
 *
 *     sentences, links, jpn_indices   source paths
 *     languages                       array of codes, or null for all
 *     links_filter                    { "mode": ..., "sentence_ids": [...] }
 *     grouping                        "greedy" | "union_find"
 *     index_sentence_ids              array of ids
 *
 * Relative paths are resolved against @p base_dir.
 *
 * @throws InvalidFileError on malformed JSON or a wrongly typed value.
 * @throws InvalidArgumentError on an unknown filter mode or grouping.
 */
ROSETTA_API CorpusConfig parse_corpus_config(const std::string& json_text,
                                             const std::filesystem::path& base_dir = {});

/**
 * @brief Read and parse a JSON configuration file.
 * @throws InvalidFileError if the file cannot be opened.
 */
ROSETTA_API CorpusConfig load_corpus_config(const std::filesystem::path& path);

} // namespace Rosetta
