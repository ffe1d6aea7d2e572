#include <algorithm>
#include <cstdlib>
#include <cstring>

#include "configuration.hpp"
#include "constants.hpp"
#include "logging.hpp"

#define TAG "configuration"

const GameConfiguration DEFAULT_GAME_CONFIGURATION = {
    .difficulty = Easy, .rows = 10, .cols = 10, .mines = 10};

const char *difficulty_to_string(Difficulty difficulty)
{
        switch (difficulty) {
        case Easy:
                return "EASY";
        case Normal:
                return "NORMAL";
        case Hard:
                return "HARD";
        case Custom:
                return "CUSTOM";
        default:
                return "UNKNOWN";
        }
}

Difficulty difficulty_from_string(const char *name)
{
        if (strcmp(name, difficulty_to_string(Easy)) == 0) {
                return Easy;
        } else if (strcmp(name, difficulty_to_string(Normal)) == 0) {
                return Normal;
        } else if (strcmp(name, difficulty_to_string(Hard)) == 0) {
                return Hard;
        } else if (strcmp(name, difficulty_to_string(Custom)) == 0) {
                return Custom;
        }
        return Unknown;
}

bool is_valid_difficulty(Difficulty difficulty)
{
        return difficulty == Easy || difficulty == Normal ||
               difficulty == Hard || difficulty == Custom;
}

bool is_ranked_difficulty(Difficulty difficulty)
{
        return difficulty == Easy || difficulty == Normal || difficulty == Hard;
}

int max_mines_for(int rows, int cols) { return std::max(rows * cols - 1, 0); }

void set_difficulty(GameConfiguration *config, Difficulty difficulty)
{
        config->difficulty = difficulty;
        switch (difficulty) {
        case Easy:
                config->rows = 10;
                config->cols = 10;
                config->mines = 10;
                break;
        case Normal:
                config->rows = 16;
                config->cols = 16;
                config->mines = 40;
                break;
        case Hard:
                config->rows = 16;
                config->cols = 30;
                config->mines = 99;
                break;
        case Custom: {
                config->rows =
                    std::clamp(config->rows, 1, MAX_BOARD_DIMENSION);
                config->cols =
                    std::clamp(config->cols, 1, MAX_BOARD_DIMENSION);
                int max_mines = max_mines_for(config->rows, config->cols);
                config->mines = std::clamp(config->mines,
                                           std::min(1, max_mines), max_mines);
        } break;
        default:
                LOG_WARN(TAG, "Ignoring unknown difficulty %d",
                         (int)difficulty);
                break;
        }
}

int parse_custom_value(const std::string &text)
{
        if (text.empty()) {
                return 1;
        }
        char *end = nullptr;
        long value = strtol(text.c_str(), &end, 10);
        if (end == text.c_str() || *end != '\0') {
                return 1;
        }
        return (int)std::clamp(value, 0L, 100000L);
}

int set_custom_parameter(GameConfiguration *config, CustomParameter parameter,
                         int value)
{
        int stored = value;
        switch (parameter) {
        case Rows:
                stored = std::clamp(value, 1, MAX_BOARD_DIMENSION);
                config->rows = stored;
                break;
        case Cols:
                stored = std::clamp(value, 1, MAX_BOARD_DIMENSION);
                config->cols = stored;
                break;
        case Mines:
                stored = value;
                config->mines = value;
                break;
        }

        // Whatever changed, the mine count has to fit the board.
        int max_mines = max_mines_for(config->rows, config->cols);
        config->mines = std::clamp(config->mines, std::min(1, max_mines),
                                   max_mines);
        if (parameter == Mines) {
                stored = config->mines;
        }

        LOG_DEBUG(TAG, "Custom board set to %d rows, %d cols, %d mines",
                  config->rows, config->cols, config->mines);
        return stored;
}

bool is_valid_configuration(const GameConfiguration *config)
{
        if (!is_valid_difficulty(config->difficulty)) {
                return false;
        }
        if (config->rows < 1 || config->rows > MAX_BOARD_DIMENSION ||
            config->cols < 1 || config->cols > MAX_BOARD_DIMENSION) {
                return false;
        }
        int max_mines = max_mines_for(config->rows, config->cols);
        return config->mines >= std::min(1, max_mines) &&
               config->mines <= max_mines;
}

int get_storage_offset(StorageSlot slot)
{
        switch (slot) {
        case ConfigurationSlot:
                return 0;
        case LeaderboardSlot:
                return 64;
        default:
                return -1;
        }
}

GameConfiguration load_game_configuration(PersistentStorage *storage)
{
        int storage_offset = get_storage_offset(ConfigurationSlot);
        LOG_DEBUG(TAG, "Loading saved configuration from offset %d",
                  storage_offset);

        GameConfiguration config = {
            .difficulty = Unknown, .rows = 0, .cols = 0, .mines = 0};
        storage->get(storage_offset, config);

        if (!is_valid_configuration(&config)) {
                LOG_INFO(TAG, "The storage does not contain a valid "
                              "configuration, using default values.");
                config = DEFAULT_GAME_CONFIGURATION;
                save_game_configuration(storage, &config);
                return config;
        }

        // The presets are authoritative, a stored board size only matters for
        // custom games.
        set_difficulty(&config, config.difficulty);

        LOG_INFO(TAG,
                 "Loaded configuration: difficulty=%s, rows=%d, cols=%d, "
                 "mines=%d",
                 difficulty_to_string(config.difficulty), config.rows,
                 config.cols, config.mines);
        return config;
}

bool save_game_configuration(PersistentStorage *storage,
                             const GameConfiguration *config)
{
        int storage_offset = get_storage_offset(ConfigurationSlot);
        if (!storage->put(storage_offset, *config)) {
                LOG_WARN(TAG, "Failed to persist the game configuration.");
                return false;
        }
        return true;
}
