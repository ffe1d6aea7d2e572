#pragma once
#include "../common/configuration.hpp"
#include "../common/constants.hpp"
#include "../common/platform/interface/persistent_storage.hpp"
#include <optional>
#include <string>
#include <vector>

typedef struct LeaderboardEntry {
        std::string name;
        /// Time it took to clear the board, in whole seconds. Lower is better.
        int time;
        /// When the result was achieved, seconds since the Unix epoch.
        long long timestamp;
} LeaderboardEntry;

/**
 * One row of the rendered leaderboard, the view lays them out in a column per
 * difficulty.
 */
typedef struct LeaderboardLine {
        Difficulty difficulty;
        int rank;
        std::string name;
        int time;
} LeaderboardLine;

/**
 * Stores the best results for each ranked difficulty (see
 * `is_ranked_difficulty`), ordered from the fastest to the slowest, each list
 * holding at most `max_items` entries.
 */
class Leaderboard
{
      public:
        explicit Leaderboard(int max_items = LEADERBOARD_MAX_ITEMS);

        /**
         * True if a result with the given time would make it onto the list
         * of the given difficulty.
         */
        bool needs_update(Difficulty difficulty, int time) const;

        /**
         * Inserts the entry after all entries with a time less than or equal
         * to its own, so that earlier results win ties, and drops whatever
         * falls off the end of the list. The name goes through
         * `sanitize_name` first.
         *
         * @return the 0-based rank of the new entry, or `std::nullopt` if it
         * did not qualify. A negative time or an empty sanitized name never
         * qualifies.
         */
        std::optional<int> record(Difficulty difficulty,
                                  const LeaderboardEntry &entry);

        const std::vector<LeaderboardEntry> &
        get_entries(Difficulty difficulty) const;

        std::vector<LeaderboardLine> render() const;

        void clear();
        int get_max_items() const { return max_items; }

        /**
         * Writes the leaderboard as a versioned, checksummed record into the
         * leaderboard slot of the storage.
         */
        bool save(PersistentStorage *storage) const;

        /**
         * Replaces the contents with the record stored in the leaderboard
         * slot. If the slot is empty or the record is corrupt, the leaderboard
         * ends up empty and false is returned.
         */
        bool load(PersistentStorage *storage);

      private:
        int max_items;
        std::vector<LeaderboardEntry> easy;
        std::vector<LeaderboardEntry> normal;
        std::vector<LeaderboardEntry> hard;

        std::vector<LeaderboardEntry> *entries_for(Difficulty difficulty);
};

extern const std::vector<Difficulty> RANKED_DIFFICULTIES;

/**
 * Names are limited to MAX_NAME_LENGTH characters from [A-Za-z0-9_-].
 */
bool is_valid_name_character(char c);

/**
 * Drops the characters that are not allowed in a name and truncates the rest
 * to MAX_NAME_LENGTH.
 */
std::string sanitize_name(const std::string &name);
