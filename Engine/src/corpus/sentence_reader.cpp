#include <corpus/sentence_reader.hpp>
#include <corpus/errors.hpp>
#include <utils/logger.hpp>
#include <sstream>

namespace Rosetta {

namespace {

constexpr size_t kPlainColumns = 3;
constexpr size_t kDetailedColumns = 6;
const std::string kNull = "\\N";

std::string location(const TsvReader& reader) {
    return reader.source_name() + ":" + std::to_string(reader.line_number());
}

std::optional<DateTime> parse_date_field(const std::string& field, const TsvReader& reader) {
    if (field == kNull) return std::nullopt;

    auto dt = DateTime::parse(field);
    if (!dt) {
        throw InvalidFileError("Invalid timestamp '" + field + "' at " + location(reader));
    }
    return dt;
}

} // namespace

SentenceReader::SentenceReader(const TsvSource& source, SentenceReaderConfig config)
    : source_(source.describe()) {
    Timer timer;
    Logger::step("Loading sentences from " + source_);

    TsvReader reader(source);
    size_t columns = 0;
    size_t skipped = 0;

    while (reader.has_next()) {
        Row row = reader.read_next();

        // The first row decides between the plain and detailed formats
        if (columns == 0) {
            if (row.size() != kPlainColumns && row.size() != kDetailedColumns) {
                throw InvalidFileError("Invalid sentences file " + source_ +
                                       ": files must have either 3 or 6 columns, found " +
                                       std::to_string(row.size()));
            }
            columns = row.size();
            if (columns == kDetailedColumns) details_.emplace();
        } else if (row.size() != columns) {
            throw InvalidFileError("Invalid sentences file: expected " + std::to_string(columns) +
                                   " columns, found " + std::to_string(row.size()) +
                                   " at " + location(reader));
        }

        auto id = TsvReader::parse_id(row[0]);
        if (!id) {
            throw InvalidFileError("Invalid sentence id '" + row[0] + "' at " + location(reader));
        }

        if (config.row_filter && config.row_filter(row)) {
            ++skipped;
            continue;
        }

        const std::string& lang = row[1];
        if (config.languages && config.languages->count(lang) == 0) {
            ++skipped;
            continue;
        }

        language_ids_[lang].insert(*id);
        sentences_[*id] = std::move(row[2]);

        if (details_) {
            SentenceDetails detail;
            if (row[3] != kNull) detail.username = row[3];
            detail.date_added = parse_date_field(row[4], reader);
            detail.date_modified = parse_date_field(row[5], reader);
            (*details_)[*id] = std::move(detail);
        }
    }

    std::ostringstream msg;
    msg << "Loaded " << sentences_.size() << " sentences in " << language_ids_.size()
        << " languages (" << skipped << " skipped, " << timer.elapsed_ms() << "ms)";
    Logger::success(msg.str());
}

const std::string& SentenceReader::at(const SentenceID& id) const {
    auto it = sentences_.find(id);
    if (it == sentences_.end()) {
        throw InvalidIDError("Could not find sentence with ID " + std::to_string(id));
    }
    return it->second;
}

bool SentenceReader::contains(const SentenceID& id) const {
    return sentences_.count(id) > 0;
}

std::vector<SentenceID> SentenceReader::keys() const {
    std::vector<SentenceID> ids;
    ids.reserve(sentences_.size());
    for (const auto& [id, text] : sentences_) ids.push_back(id);
    return ids;
}

const std::string& SentenceReader::language(SentenceID id) const {
    // One bucket per language, so the scan is short
    for (const auto& [lang, ids] : language_ids_) {
        if (ids.count(id)) return lang;
    }
    throw InvalidIDError("No language found for sentence id " + std::to_string(id));
}

const SentenceDetails& SentenceReader::details(SentenceID id) const {
    if (!details_) {
        throw MissingDataError("Detailed information not loaded.");
    }

    auto it = details_->find(id);
    if (it == details_->end()) {
        throw InvalidIDError("Detailed information not found for sentence ID " + std::to_string(id));
    }
    return it->second;
}

std::vector<std::string> SentenceReader::languages() const {
    std::vector<std::string> langs;
    langs.reserve(language_ids_.size());
    for (const auto& [lang, ids] : language_ids_) langs.push_back(lang);
    return langs;
}

std::string SentenceReader::repr() const {
    return "SentenceReader(sentences='" + source_ + "')";
}

} // namespace Rosetta
