#pragma once
#include <string>

/**
 * Returns the absolute path of a file in the assets directory configured at
 * build time.
 */
std::string get_asset_path(const std::string &file_name);

/// Monospace font used for every piece of text in the game.
#define GAME_FONT_FILE "JetBrainsMonoNerdFont-Regular.ttf"
