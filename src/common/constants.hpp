/* Definitions of layout, timing and color constants used across the game. */
#pragma once

#include "platform/interface/color.hpp"
#include <vector>

/* Layout, all values in pixels */
constexpr int TILE_SIZE = 20;
constexpr int GUI_WIDTH = 100;
constexpr int HUD_HEIGHT = 30;
constexpr int MARGIN = 20;
// The board area never shrinks below this many tiles so that the side panel
// and the leaderboard always fit in the window.
constexpr int MIN_BOARD_DIMENSION_DISPLAY = 10;

/* Game limits */
constexpr int MAX_BOARD_DIMENSION = 50;
constexpr int MAX_NAME_LENGTH = 8;
constexpr int MAX_NUMBER_INPUT_LENGTH = 3;
constexpr int LEADERBOARD_MAX_ITEMS = 5;

/* Constants below control time intervals of the game loop */
constexpr int FRAME_DELAY_MS = 33;
constexpr int DELAY_BEFORE_NAME_INPUT_MS = 1000;

/* Colors */
constexpr Color BG_COLOR = LightSlateGray;
constexpr Color GUI_FONT_COLOR = LightYellow;
constexpr Color FIELD_BG_COLOR = FieldBackground;
constexpr Color FIELD_LINES_COLOR = FieldLines;

/**
 * Colors of the digits showing the number of adjacent mines, indexed by the
 * count. Index 0 is never drawn.
 */
extern const std::vector<Color> MINE_COUNT_COLORS;

#define STORAGE_FILE_NAME "minefield.state"
#define WINDOW_TITLE "Minesweeper"
