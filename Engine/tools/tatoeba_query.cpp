// tatoeba_query.cpp
// Load a Tatoeba corpus described by a JSON config and print what the index
// knows about the given sentence ids.
//   - language and text from sentences.csv
//   - translation group from links.csv
//   - annotated words and linked meaning from jpn_indices.csv

#include <config/config_loader.hpp>
#include <corpus/corpus_index.hpp>
#include <corpus/errors.hpp>
#include <corpus/tsv_reader.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace Rosetta {

void print_sentence(const CorpusIndex& index, SentenceID id) {
    std::cout << "[" << id << "]" << std::endl;

    if (index.has_sentences()) {
        try {
            std::cout << "  " << index.language(id) << ": " << index.sentence_text(id) << std::endl;
            if (index.has_details()) {
                const auto& d = index.details(id);
                std::cout << "  by " << d.username.value_or("-")
                          << ", added " << (d.date_added ? d.date_added->to_string() : "-")
                          << ", modified " << (d.date_modified ? d.date_modified->to_string() : "-")
                          << std::endl;
            }
        } catch (const InvalidIDError& e) {
            std::cout << "  " << e.what() << std::endl;
        }
    }

    if (index.has_links()) {
        try {
            std::cout << "  group:";
            for (SentenceID member : index.group(id)) std::cout << " " << member;
            std::cout << std::endl;
        } catch (const InvalidIDError& e) {
            std::cout << " " << e.what() << std::endl;
        }
    }

    if (index.has_annotations()) {
        try {
            std::cout << "  words:";
            for (const auto& word : index.annotated_words(id)) std::cout << " " << word;
            std::cout << std::endl;
            std::cout << "  meaning: " << index.linked_meaning(id) << std::endl;
        } catch (const InvalidIDError& e) {
            std::cout << " " << e.what() << std::endl;
        }
    }
}

} // namespace Rosetta

int main(int argc, char** argv) {
    if (argc < 3) { std::cerr << "Usage: " << argv[0] << " <config.json> <sentence-id>..." << std::endl; return 1; }
    using namespace Rosetta;
    Timer total_timer;

    try {
        std::vector<SentenceID> ids;
        for (int i = 2; i < argc; ++i) {
            auto id = TsvReader::parse_id(argv[i]);
            if (!id) throw InvalidArgumentError(std::string("Not a sentence id: ") + argv[i]);
            ids.push_back(*id);
        }

        CorpusIndex index(load_corpus_config(argv[1]));
        for (SentenceID id : ids) print_sentence(index, id);

        Logger::success("Done in " + std::to_string(total_timer.elapsed_sec()) + "s");
    } catch (const std::exception& ex) { std::cerr << "[FATAL] " << ex.what() << std::endl; return 1; }
    return 0;
}
