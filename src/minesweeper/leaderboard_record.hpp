#pragma once
#include "../common/constants.hpp"
#include <cstdint>

/* On-disk representation of the leaderboard. */

constexpr char LEADERBOARD_MAGIC[4] = {'M', 'F', 'L', 'B'};
// Bump when the layout of `StoredLeaderboard` changes and teach `load` how to
// read (or at least recognize) the previous versions.
constexpr uint16_t LEADERBOARD_FORMAT_VERSION = 1;
constexpr int STORED_SECTIONS = 3;

typedef struct StoredEntry {
        char name[MAX_NAME_LENGTH + 1];
        int32_t time;
        int64_t timestamp;
} StoredEntry;

typedef struct StoredSection {
        uint8_t count;
        StoredEntry entries[LEADERBOARD_MAX_ITEMS];
} StoredSection;

typedef struct StoredLeaderboard {
        char magic[4];
        uint16_t version;
        uint16_t section_count;
        StoredSection sections[STORED_SECTIONS];
        uint32_t checksum;
} StoredLeaderboard;

/**
 * FNV-1a over every byte of the record preceding the checksum field. The
 * record is zeroed before it is filled in, so padding bytes are deterministic.
 */
uint32_t compute_leaderboard_checksum(const StoredLeaderboard *record);
