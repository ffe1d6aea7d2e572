#include "minefield_config.h"

#include "src/common/configuration.hpp"
#include "src/common/constants.hpp"
#include "src/common/logging.hpp"
#include "src/common/platform/desktop/desktop_delay.hpp"
#include "src/common/platform/desktop/sfml_display.hpp"
#include "src/common/platform/desktop/sfml_input_controller.hpp"
#include "src/common/platform/interface/persistent_storage.hpp"
#include "src/common/platform/interface/platform.hpp"
#include "src/minesweeper/game.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#define TAG "minefield_entrypoint"

void print_version(char *argv[]);
std::string default_storage_path(const char *executable);

int main(int argc, char *argv[])
{
        print_version(argv);

        std::string storage_path =
            argc > 1 ? std::string(argv[1]) : default_storage_path(argv[0]);
        LOG_INFO(TAG, "Using storage file %s", storage_path.c_str());
        PersistentStorage persistent_storage(storage_path);

        // The game resizes the window to fit the board once the saved
        // configuration is loaded.
        sf::RenderWindow window(sf::VideoMode({640, 480}), WINDOW_TITLE,
                                sf::Style::Titlebar | sf::Style::Close);

        LOG_DEBUG(TAG, "Initializing the display...");
        SfmlDisplay display(&window);
        if (!display.setup()) {
                LOG_ERROR(TAG, "Failed to load the game assets from %s",
                          MINEFIELD_ASSETS_DIR);
                return 1;
        }
        LOG_DEBUG(TAG, "Display initialized!");

        SfmlInputController controller(&window);
        controller.setup();
        std::vector<InputController *> controllers = {&controller};

        DesktopDelay delay;
        DesktopClock clock;

        Platform platform = {.display = &display,
                             .input_controllers = &controllers,
                             .delay_provider = &delay,
                             .time_provider = &clock,
                             .persistent_storage = &persistent_storage};

        Game game(&platform);
        UserAction action = game.game_loop();
        LOG_DEBUG(TAG, "Game loop exited with %s",
                  action == UserAction::CloseWindow ? "close" : "exit");

        window.close();
        return 0;
}

void print_version(char *argv[])
{
        std::cout << argv[0] << " Version: " << MINEFIELD_VERSION_MAJOR << "."
                  << MINEFIELD_VERSION_MINOR << std::endl;
}

/**
 * The storage file lives next to the executable so that every installation
 * keeps its own leaderboard.
 */
std::string default_storage_path(const char *executable)
{
        std::filesystem::path directory =
            std::filesystem::path(executable).parent_path();
        if (directory.empty()) {
                return STORAGE_FILE_NAME;
        }
        return (directory / STORAGE_FILE_NAME).string();
}
