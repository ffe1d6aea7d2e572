#pragma once
#include "board.hpp"
#include "board_view.hpp"
#include "leaderboard.hpp"
#include "leaderboard_view.hpp"
#include "widgets.hpp"
#include "../common/configuration.hpp"
#include "../common/grid.hpp"
#include "../common/platform/interface/platform.hpp"
#include <optional>
#include <random>
#include <string>
#include <vector>

/**
 * What the window currently shows. The board and the side panel are only
 * interactive in `Playing`, the other two modes take over the whole window.
 */
enum class GameMode {
        Playing,
        Leaderboard,
        NameInput,
};

const char *game_mode_to_str(GameMode mode);

enum class Outcome {
        Won,
        Lost,
};

typedef struct GameResult {
        Outcome outcome;
        Difficulty difficulty;
        /// Time on the game timer when the board was finished, in seconds.
        int time;
} GameResult;

/**
 * Owns the board, the leaderboard and every GUI element, and drives them from
 * the frame loop. Elements report what the user asked for as commands which
 * the game then executes in `dispatch`.
 */
class Game
{
      public:
        /**
         * Loads the configuration and the leaderboard from the persistent
         * storage of the platform and resizes the display to fit the board.
         * Without a seed, board seeds are drawn from `std::random_device`.
         */
        Game(Platform *platform,
             std::optional<unsigned int> seed = std::nullopt);

        /**
         * Runs the frame loop until the user closes the window or presses
         * Escape, then saves the configuration and the leaderboard.
         */
        UserAction game_loop();

        /**
         * Routes a single input event to the elements of the current mode and
         * executes the resulting commands.
         */
        void process_event(const InputEvent &event);

        /**
         * Advances everything driven by time: the game timer, the HUD counters
         * and the delayed name input dialogue.
         */
        void update();

        void render();

        /**
         * Executes a command produced by one of the GUI elements.
         */
        void dispatch(const Command &command);

        /**
         * Replaces the board with a fresh one using the current configuration
         * and a new seed.
         */
        void restart();

        bool save_state();

        GameMode get_mode() const { return mode; }
        const Board &get_board() const { return board; }
        const GameConfiguration &get_configuration() const { return config; }
        const Leaderboard &get_leaderboard() const { return leaderboard; }
        const WindowLayout &get_layout() const { return layout; }
        const std::string &get_status_text() const
        {
                return status.get_text();
        }
        int get_elapsed_seconds() const { return elapsed_seconds; }
        std::optional<GameResult> get_last_result() const
        {
                return last_result;
        }
        bool is_running() const { return running; }
        bool is_name_input_pending() const
        {
                return name_input_deadline.has_value();
        }

      private:
        Platform *platform;
        GameConfiguration config;
        WindowLayout layout;
        std::mt19937 seed_source;
        Board board;
        Leaderboard leaderboard;

        GameMode mode;
        bool running;
        UserAction exit_action;
        BoardState last_state;
        bool timer_running;
        long long timer_start_ms;
        int elapsed_seconds;
        std::optional<long long> name_input_deadline;
        std::optional<GameResult> last_result;

        BoardView board_view;
        SelectionGroup difficulty_selector;
        NumberInput width_input;
        NumberInput height_input;
        NumberInput mines_input;
        NumberInput timer_display;
        NumberInput mines_left_display;
        Label status;
        Button restart_button;
        Button leaderboard_button;
        LeaderboardView leaderboard_view;
        Label victory_time;
        NameInputDialogue name_input;

        std::vector<GuiElement *> elements_for_mode();
        void apply_configuration_change();
        void place_gui();
        int place_hud();
        void track_board_state();
        void on_state_change(BoardState state);
        void show_name_input();
        void submit_name(const std::string &name);
};
