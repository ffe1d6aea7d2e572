#pragma once

#include "platform/interface/persistent_storage.hpp"
#include <string>

enum class UserAction {
        Exit,
        CloseWindow,
};

/**
 * Board size presets. `Unknown` is deliberately 0 so that a zeroed storage
 * region is recognized as 'no configuration saved'.
 */
typedef enum Difficulty : int {
        Unknown = 0,
        Easy = 1,
        Normal = 2,
        Hard = 3,
        Custom = 4,
} Difficulty;

extern const char *difficulty_to_string(Difficulty difficulty);
extern Difficulty difficulty_from_string(const char *name);
bool is_valid_difficulty(Difficulty difficulty);
/**
 * Only the fixed presets get a leaderboard; custom boards are not comparable.
 */
bool is_ranked_difficulty(Difficulty difficulty);

typedef struct GameConfiguration {
        Difficulty difficulty;
        int rows;
        int cols;
        int mines;
} GameConfiguration;

extern const GameConfiguration DEFAULT_GAME_CONFIGURATION;

/**
 * Switches the configuration to the given difficulty. For the presets this
 * overwrites the board size and mine count, for `Custom` the current values
 * are kept (and clamped into the valid range).
 */
void set_difficulty(GameConfiguration *config, Difficulty difficulty);

typedef enum CustomParameter {
        Rows = 0,
        Cols = 1,
        Mines = 2,
} CustomParameter;

/**
 * Parses the text typed into a custom parameter input. Empty or non-numeric
 * text is treated as 1, the smallest meaningful value.
 */
int parse_custom_value(const std::string &text);

/**
 * Sets one of the custom board parameters, clamping it into its valid range.
 * Rows and columns are limited to [1, MAX_BOARD_DIMENSION], mines to
 * [1, rows * cols - 1]. Changing the board size re-clamps the mine count.
 *
 * @return the value that was actually stored after clamping.
 */
int set_custom_parameter(GameConfiguration *config, CustomParameter parameter,
                         int value);

/**
 * Largest number of mines a board of the given size can hold while keeping
 * at least one safe cell.
 */
int max_mines_for(int rows, int cols);

bool is_valid_configuration(const GameConfiguration *config);

typedef enum StorageSlot {
        ConfigurationSlot = 0,
        LeaderboardSlot = 1,
} StorageSlot;

int get_storage_offset(StorageSlot slot);

/**
 * Loads the configuration saved by a previous run. If the storage does not
 * contain a valid configuration, the default one is returned and written back.
 */
GameConfiguration load_game_configuration(PersistentStorage *storage);
bool save_game_configuration(PersistentStorage *storage,
                             const GameConfiguration *config);
