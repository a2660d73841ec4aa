#include <config/config_loader.hpp>
#include <corpus/errors.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace Rosetta {

namespace fs = std::filesystem;

namespace {

using json = nlohmann::json;

std::optional<TsvSource> source_path(const json& doc, const char* key, const fs::path& base_dir) {
    if (!doc.contains(key) || doc[key].is_null()) return std::nullopt;

    fs::path path = doc[key].get<std::string>();
    if (path.is_relative() && !base_dir.empty()) path = base_dir / path;
    return TsvSource(path.string());
}

const json& expect_array(const json& value, const char* key) {
    if (!value.is_array()) {
        throw InvalidFileError(std::string("Corpus configuration: '") + key + "' must be an array");
    }
    return value;
}

std::unordered_set<SentenceID> id_set(const json& value, const char* key) {
    std::unordered_set<SentenceID> ids;
    for (const auto& id : expect_array(value, key)) {
        if (!id.is_number_integer()) {
            throw InvalidFileError(std::string("Corpus configuration: '") + key +
                                   "' must contain integer sentence ids, found " + id.dump());
        }
        ids.insert(id.get<SentenceID>());
    }
    return ids;
}

} // namespace

CorpusConfig parse_corpus_config(const std::string& json_text, const fs::path& base_dir) {
    CorpusConfig config;

    try {
        auto doc = json::parse(json_text);
        if (!doc.is_object()) {
            throw InvalidFileError("Corpus configuration must be a JSON object");
        }

        config.sentences = source_path(doc, "sentences", base_dir);
        config.links = source_path(doc, "links", base_dir);
        config.jpn_indices = source_path(doc, "jpn_indices", base_dir);

        if (doc.contains("languages")) {
            const auto& langs = doc["languages"];
            if (langs.is_null()) {
                config.sentence_config.languages = std::nullopt;
            } else {
                std::set<std::string> allowed;
                for (const auto& lang : expect_array(langs, "languages")) {
                    allowed.insert(lang.get<std::string>());
                }
                config.sentence_config.languages = std::move(allowed);
            }
        }

        if (doc.contains("links_filter")) {
            const auto& filter = doc["links_filter"];
            if (filter.contains("mode")) {
                config.links_config.filter = parse_link_filter_mode(filter["mode"].get<std::string>());
            }
            if (filter.contains("sentence_ids") && !filter["sentence_ids"].is_null()) {
                config.links_config.sentence_ids =
                    id_set(filter["sentence_ids"], "links_filter.sentence_ids");
            }
        }

        if (doc.contains("grouping")) {
            config.links_config.strategy = parse_grouping_strategy(doc["grouping"].get<std::string>());
        }

        if (doc.contains("index_sentence_ids") && !doc["index_sentence_ids"].is_null()) {
            config.index_config.sentence_ids = id_set(doc["index_sentence_ids"], "index_sentence_ids");
        }
    } catch (const json::exception& e) {
        throw InvalidFileError(std::string("Invalid corpus configuration: ") + e.what());
    }

    return config;
}

CorpusConfig load_corpus_config(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw InvalidFileError("Could not open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Logger::debug("Read corpus configuration " + path.string());
    return parse_corpus_config(buffer.str(), path.parent_path());
}

} // namespace Rosetta
