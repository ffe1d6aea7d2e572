#include "leaderboard.hpp"
#include "leaderboard_record.hpp"
#include "../common/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstring>

#define TAG "leaderboard"

const std::vector<Difficulty> RANKED_DIFFICULTIES = {Easy, Normal, Hard};

uint32_t compute_leaderboard_checksum(const StoredLeaderboard *record)
{
        const unsigned char *bytes =
            reinterpret_cast<const unsigned char *>(record);
        uint32_t hash = 2166136261u;
        for (size_t i = 0; i < offsetof(StoredLeaderboard, checksum); i++) {
                hash ^= bytes[i];
                hash *= 16777619u;
        }
        return hash;
}

bool is_valid_name_character(char c)
{
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
               c == '_';
}

std::string sanitize_name(const std::string &name)
{
        std::string result;
        for (char c : name) {
                if ((int)result.size() == MAX_NAME_LENGTH) {
                        break;
                }
                if (is_valid_name_character(c)) {
                        result.push_back(c);
                }
        }
        return result;
}

Leaderboard::Leaderboard(int max_items)
    : max_items(max_items), easy(), normal(), hard()
{
        if (max_items < 1 || max_items > LEADERBOARD_MAX_ITEMS) {
                LOG_WARN(TAG, "Leaderboard size %d out of range, using %d",
                         max_items, LEADERBOARD_MAX_ITEMS);
                this->max_items = LEADERBOARD_MAX_ITEMS;
        }
}

std::vector<LeaderboardEntry> *Leaderboard::entries_for(Difficulty difficulty)
{
        switch (difficulty) {
        case Easy:
                return &easy;
        case Normal:
                return &normal;
        case Hard:
                return &hard;
        default:
                return nullptr;
        }
}

const std::vector<LeaderboardEntry> &
Leaderboard::get_entries(Difficulty difficulty) const
{
        static const std::vector<LeaderboardEntry> unranked;
        switch (difficulty) {
        case Easy:
                return easy;
        case Normal:
                return normal;
        case Hard:
                return hard;
        default:
                return unranked;
        }
}

bool Leaderboard::needs_update(Difficulty difficulty, int time) const
{
        if (!is_ranked_difficulty(difficulty)) {
                return false;
        }
        const std::vector<LeaderboardEntry> &entries = get_entries(difficulty);
        if ((int)entries.size() < max_items) {
                return true;
        }
        return entries.back().time > time;
}

std::optional<int> Leaderboard::record(Difficulty difficulty,
                                       const LeaderboardEntry &entry)
{
        if (entry.time < 0) {
                LOG_WARN(TAG, "Refusing to record a negative time %d",
                         entry.time);
                return std::nullopt;
        }
        if (!needs_update(difficulty, entry.time)) {
                LOG_DEBUG(TAG, "Time %d does not qualify for %s", entry.time,
                          difficulty_to_string(difficulty));
                return std::nullopt;
        }
        LeaderboardEntry stored = entry;
        stored.name = sanitize_name(entry.name);
        if (stored.name.empty()) {
                LOG_WARN(TAG, "Refusing to record an entry without a name.");
                return std::nullopt;
        }
        std::vector<LeaderboardEntry> *entries = entries_for(difficulty);

        size_t position = 0;
        while (position < entries->size() &&
               entry.time >= (*entries)[position].time) {
                position++;
        }

        entries->insert(entries->begin() + position, stored);
        if ((int)entries->size() > max_items) {
                entries->pop_back();
        }

        LOG_INFO(TAG, "Recorded %s with %d s at rank %d on %s",
                 stored.name.c_str(), stored.time, (int)position + 1,
                 difficulty_to_string(difficulty));
        return (int)position;
}

std::vector<LeaderboardLine> Leaderboard::render() const
{
        std::vector<LeaderboardLine> lines;
        for (Difficulty difficulty : RANKED_DIFFICULTIES) {
                const std::vector<LeaderboardEntry> &entries =
                    get_entries(difficulty);
                for (size_t i = 0; i < entries.size(); i++) {
                        lines.push_back({.difficulty = difficulty,
                                         .rank = (int)i,
                                         .name = entries[i].name,
                                         .time = entries[i].time});
                }
        }
        return lines;
}

void Leaderboard::clear()
{
        easy.clear();
        normal.clear();
        hard.clear();
}

bool Leaderboard::save(PersistentStorage *storage) const
{
        StoredLeaderboard record;
        std::memset(&record, 0, sizeof(record));
        std::memcpy(record.magic, LEADERBOARD_MAGIC, sizeof(record.magic));
        record.version = LEADERBOARD_FORMAT_VERSION;
        record.section_count = STORED_SECTIONS;

        for (int s = 0; s < STORED_SECTIONS; s++) {
                const std::vector<LeaderboardEntry> &entries =
                    get_entries(RANKED_DIFFICULTIES[s]);
                StoredSection *section = &record.sections[s];
                section->count = (uint8_t)entries.size();
                for (size_t i = 0; i < entries.size(); i++) {
                        StoredEntry *stored = &section->entries[i];
                        std::strncpy(stored->name, entries[i].name.c_str(),
                                     MAX_NAME_LENGTH);
                        stored->time = entries[i].time;
                        stored->timestamp = entries[i].timestamp;
                }
        }
        record.checksum = compute_leaderboard_checksum(&record);

        int offset = get_storage_offset(LeaderboardSlot);
        if (!storage->put(offset, record)) {
                LOG_WARN(TAG, "Failed to persist the leaderboard.");
                return false;
        }
        LOG_DEBUG(TAG, "Leaderboard saved at offset %d (%zu bytes)", offset,
                  sizeof(record));
        return true;
}

static bool is_empty_record(const StoredLeaderboard *record)
{
        const char zeroes[4] = {0, 0, 0, 0};
        return std::memcmp(record->magic, zeroes, sizeof(zeroes)) == 0;
}

/**
 * Checks the invariants that `save` guarantees. Returns a description of the
 * first violation, or nullptr if the record is consistent.
 */
static const char *find_record_inconsistency(const StoredLeaderboard *record,
                                             int max_items)
{
        if (record->section_count != STORED_SECTIONS) {
                return "unexpected number of sections";
        }
        for (int s = 0; s < STORED_SECTIONS; s++) {
                const StoredSection *section = &record->sections[s];
                if (section->count > max_items) {
                        return "section holds too many entries";
                }
                for (int i = 0; i < section->count; i++) {
                        const StoredEntry *entry = &section->entries[i];
                        size_t name_len =
                            strnlen(entry->name, sizeof(entry->name));
                        if (name_len == 0 || name_len == sizeof(entry->name)) {
                                return "entry name is empty or unterminated";
                        }
                        for (size_t c = 0; c < name_len; c++) {
                                if (!is_valid_name_character(entry->name[c])) {
                                        return "entry name has invalid "
                                               "characters";
                                }
                        }
                        if (entry->time < 0) {
                                return "negative entry time";
                        }
                        if (i > 0 && section->entries[i - 1].time > entry->time) {
                                return "entries are not sorted";
                        }
                }
        }
        return nullptr;
}

bool Leaderboard::load(PersistentStorage *storage)
{
        clear();

        StoredLeaderboard record;
        std::memset(&record, 0, sizeof(record));
        int offset = get_storage_offset(LeaderboardSlot);
        if (!storage->get(offset, record)) {
                LOG_WARN(TAG, "Unable to read the leaderboard slot.");
                return false;
        }

        if (is_empty_record(&record)) {
                LOG_INFO(TAG, "No leaderboard stored, starting empty.");
                return false;
        }
        if (std::memcmp(record.magic, LEADERBOARD_MAGIC, sizeof(record.magic)) !=
            0) {
                LOG_WARN(TAG, "Leaderboard record has a bad magic, ignoring.");
                return false;
        }
        if (record.version != LEADERBOARD_FORMAT_VERSION) {
                LOG_WARN(TAG,
                         "Leaderboard format version %d is not supported "
                         "(expected %d), ignoring.",
                         record.version, LEADERBOARD_FORMAT_VERSION);
                return false;
        }
        if (record.checksum != compute_leaderboard_checksum(&record)) {
                LOG_WARN(TAG, "Leaderboard checksum mismatch, ignoring.");
                return false;
        }
        const char *inconsistency =
            find_record_inconsistency(&record, LEADERBOARD_MAX_ITEMS);
        if (inconsistency != nullptr) {
                LOG_WARN(TAG, "Leaderboard record is corrupt (%s), ignoring.",
                         inconsistency);
                return false;
        }

        for (int s = 0; s < STORED_SECTIONS; s++) {
                const StoredSection *section = &record.sections[s];
                std::vector<LeaderboardEntry> *entries =
                    entries_for(RANKED_DIFFICULTIES[s]);
                int count = std::min((int)section->count, max_items);
                for (int i = 0; i < count; i++) {
                        const StoredEntry *stored = &section->entries[i];
                        entries->push_back({.name = std::string(stored->name),
                                            .time = stored->time,
                                            .timestamp = stored->timestamp});
                }
        }

        LOG_INFO(TAG, "Loaded leaderboard: %zu easy, %zu normal, %zu hard",
                 easy.size(), normal.size(), hard.size());
        return true;
}
