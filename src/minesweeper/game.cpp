#include "game.hpp"
#include "../common/constants.hpp"
#include "../common/logging.hpp"
#include <algorithm>

#define TAG "game"

#define GUI_FONT_SIZE Size12

const char *game_mode_to_str(GameMode mode)
{
        switch (mode) {
        case GameMode::Playing:
                return "Playing";
        case GameMode::Leaderboard:
                return "Leaderboard";
        case GameMode::NameInput:
                return "NameInput";
        default:
                return "Unknown";
        }
}

static unsigned int initial_seed(std::optional<unsigned int> seed)
{
        if (seed.has_value()) {
                return seed.value();
        }
        std::random_device device;
        return device();
}

// Wide enough for the largest counter value, keeps the HUD from jumping
// around as the numbers change.
static int hud_counter_width()
{
        return text_width("MINES  -999", GUI_FONT_SIZE);
}

Game::Game(Platform *platform, std::optional<unsigned int> seed)
    : platform(platform),
      config(load_game_configuration(platform->persistent_storage)),
      layout(calculate_window_layout(config.rows, config.cols)),
      seed_source(initial_seed(seed)),
      board(config.cols, config.rows, config.mines, seed_source()),
      leaderboard(LEADERBOARD_MAX_ITEMS), mode(GameMode::Playing),
      running(false), exit_action(UserAction::Exit),
      last_state(BoardState::Uninitialized), timer_running(false),
      timer_start_ms(0), elapsed_seconds(0),
      name_input_deadline(std::nullopt), last_result(std::nullopt),
      board_view(&board, &layout),
      difficulty_selector("DIFFICULTY", {Easy, Normal, Hard, Custom},
                          config.difficulty, GUI_FONT_SIZE, GUI_FONT_COLOR),
      width_input("WIDTH", config.cols, GUI_WIDTH, GUI_FONT_SIZE,
                  GUI_FONT_COLOR, CommandType::SetColumns,
                  config.difficulty == Custom),
      height_input("HEIGHT", config.rows, GUI_WIDTH, GUI_FONT_SIZE,
                   GUI_FONT_COLOR, CommandType::SetRows,
                   config.difficulty == Custom),
      mines_input("MINES", config.mines, GUI_WIDTH, GUI_FONT_SIZE,
                  GUI_FONT_COLOR, CommandType::SetMines,
                  config.difficulty == Custom),
      timer_display("TIME", 0, hud_counter_width(), GUI_FONT_SIZE,
                    GUI_FONT_COLOR),
      mines_left_display("MINES", config.mines, hud_counter_width(),
                         GUI_FONT_SIZE, GUI_FONT_COLOR),
      status("READY TO GO!", GUI_FONT_SIZE, GUI_FONT_COLOR),
      restart_button("RESTART", GUI_FONT_SIZE, GUI_FONT_COLOR,
                     make_command(CommandType::Restart)),
      leaderboard_button("LEADER BOARD", GUI_FONT_SIZE, GUI_FONT_COLOR,
                         make_command(CommandType::ShowLeaderboard)),
      leaderboard_view(&leaderboard,
                       GUI_WIDTH + 2 * MARGIN +
                           MIN_BOARD_DIMENSION_DISPLAY * TILE_SIZE,
                       GUI_FONT_SIZE, GUI_FONT_COLOR),
      victory_time("", GUI_FONT_SIZE, GUI_FONT_COLOR),
      name_input("ENTER YOUR NAME", MAX_NAME_LENGTH, GUI_FONT_SIZE,
                 GUI_FONT_COLOR)
{
        leaderboard.load(platform->persistent_storage);
        platform->display->resize(layout.window_width, layout.window_height);
        place_gui();
        LOG_INFO(TAG, "Game ready: %s, %dx%d with %d mines",
                 difficulty_to_string(config.difficulty), config.cols,
                 config.rows, config.mines);
}

UserAction Game::game_loop()
{
        LOG_DEBUG(TAG, "Entering the game loop");
        running = true;
        while (running) {
                InputEvent event;
                while (running &&
                       poll_input(platform->input_controllers, &event)) {
                        process_event(event);
                }
                if (!running) {
                        break;
                }
                update();
                render();
                platform->delay_provider->delay_ms(FRAME_DELAY_MS);
        }
        LOG_DEBUG(TAG, "Game loop finished, saving state");
        save_state();
        return exit_action;
}

std::vector<GuiElement *> Game::elements_for_mode()
{
        switch (mode) {
        case GameMode::Leaderboard:
                return {&leaderboard_view};
        case GameMode::NameInput:
                return {&name_input};
        case GameMode::Playing:
        default:
                return {&board_view,     &difficulty_selector,
                        &width_input,    &height_input,
                        &mines_input,    &restart_button,
                        &leaderboard_button};
        }
}

void Game::process_event(const InputEvent &event)
{
        if (event.type == CloseWindow) {
                LOG_DEBUG(TAG, "Window close requested");
                running = false;
                exit_action = UserAction::CloseWindow;
                return;
        }

        if (mode == GameMode::Playing && event.type == KeyDown) {
                if (event.key == Escape) {
                        LOG_DEBUG(TAG, "Escape pressed, exiting");
                        running = false;
                        exit_action = UserAction::Exit;
                        return;
                }
                if (event.key == F2) {
                        restart();
                        return;
                }
        }

        // Every element sees the event before any command runs, commands
        // like a difficulty change rebuild the layout the elements rely on.
        std::vector<Command> commands;
        for (GuiElement *element : elements_for_mode()) {
                std::optional<Command> command = element->handle_event(event);
                if (command.has_value()) {
                        commands.push_back(command.value());
                }
        }
        for (const Command &command : commands) {
                dispatch(command);
        }
}

void Game::dispatch(const Command &command)
{
        LOG_DEBUG(TAG, "Dispatching %s in mode %s",
                  command_type_to_str(command.type), game_mode_to_str(mode));

        switch (command.type) {
        case CommandType::Reveal:
                board.reveal(command.cell.x, command.cell.y);
                track_board_state();
                break;
        case CommandType::ToggleFlag:
                board.toggle_flag(command.cell.x, command.cell.y);
                break;
        case CommandType::Chord:
                board.chord(command.cell.x, command.cell.y);
                track_board_state();
                break;
        case CommandType::Restart:
                restart();
                break;
        case CommandType::ShowLeaderboard:
                mode = GameMode::Leaderboard;
                break;
        case CommandType::SelectDifficulty: {
                set_difficulty(&config, command.difficulty);
                bool custom = config.difficulty == Custom;
                difficulty_selector.set_selected(config.difficulty);
                width_input.set_active_input(custom);
                height_input.set_active_input(custom);
                mines_input.set_active_input(custom);
                apply_configuration_change();
        } break;
        case CommandType::SetColumns:
                set_custom_parameter(&config, Cols,
                                     parse_custom_value(command.text));
                apply_configuration_change();
                break;
        case CommandType::SetRows:
                set_custom_parameter(&config, Rows,
                                     parse_custom_value(command.text));
                apply_configuration_change();
                break;
        case CommandType::SetMines:
                set_custom_parameter(&config, Mines,
                                     parse_custom_value(command.text));
                apply_configuration_change();
                break;
        case CommandType::SubmitName:
                submit_name(command.text);
                break;
        case CommandType::Dismiss:
                mode = GameMode::Playing;
                break;
        }
}

void Game::submit_name(const std::string &name)
{
        if (name.empty()) {
                LOG_DEBUG(TAG, "Ignoring an empty name");
                return;
        }
        if (!last_result.has_value() ||
            last_result->outcome != Outcome::Won) {
                LOG_WARN(TAG, "Name submitted without a finished game");
                mode = GameMode::Playing;
                return;
        }

        LeaderboardEntry entry = {
            .name = name,
            .time = last_result->time,
            .timestamp = platform->time_provider->epoch_seconds()};
        if (leaderboard.record(last_result->difficulty, entry).has_value()) {
                leaderboard.save(platform->persistent_storage);
        }
        mode = GameMode::Leaderboard;
}

void Game::apply_configuration_change()
{
        // Inputs show the clamped values, whatever the user typed.
        width_input.set_value(config.cols);
        height_input.set_value(config.rows);
        mines_input.set_value(config.mines);

        layout = calculate_window_layout(config.rows, config.cols);
        platform->display->resize(layout.window_width, layout.window_height);
        board_view.set_layout(&layout);
        place_gui();
        restart();
        save_game_configuration(platform->persistent_storage, &config);
}

void Game::restart()
{
        board = Board(config.cols, config.rows, config.mines, seed_source());
        board_view.set_board(&board);
        last_state = BoardState::Uninitialized;
        timer_running = false;
        elapsed_seconds = 0;
        name_input_deadline = std::nullopt;
        last_result = std::nullopt;
        status.set_text("READY TO GO!");
        LOG_DEBUG(TAG, "Board restarted: %dx%d with %d mines", config.cols,
                  config.rows, config.mines);
}

void Game::track_board_state()
{
        BoardState state = board.get_state();
        if (state == last_state) {
                return;
        }
        if (last_state == BoardState::Uninitialized) {
                timer_running = true;
                timer_start_ms = platform->time_provider->millis();
                elapsed_seconds = 0;
        }
        last_state = state;
        on_state_change(state);
}

void Game::on_state_change(BoardState state)
{
        LOG_DEBUG(TAG, "Board state changed to %s", board_state_to_str(state));
        switch (state) {
        case BoardState::Uninitialized:
                status.set_text("READY TO GO!");
                break;
        case BoardState::Playing:
                status.set_text("GOOD LUCK!");
                break;
        case BoardState::Won:
        case BoardState::Lost: {
                long long now = platform->time_provider->millis();
                elapsed_seconds = (int)((now - timer_start_ms) / 1000);
                timer_running = false;

                bool won = state == BoardState::Won;
                status.set_text(won ? "VICTORY!" : "GAME OVER!");
                last_result = GameResult{
                    .outcome = won ? Outcome::Won : Outcome::Lost,
                    .difficulty = config.difficulty,
                    .time = elapsed_seconds};

                if (won && leaderboard.needs_update(config.difficulty,
                                                    elapsed_seconds)) {
                        name_input_deadline = now + DELAY_BEFORE_NAME_INPUT_MS;
                }
        } break;
        }
}

void Game::show_name_input()
{
        LOG_DEBUG(TAG, "Asking for the name of the player");
        mode = GameMode::NameInput;
        victory_time.set_text("YOUR TIME IS " +
                              std::to_string(last_result->time) +
                              " SECONDS!");
        name_input.set_value("");
        place_gui();
}

void Game::update()
{
        long long now = platform->time_provider->millis();

        if (name_input_deadline.has_value() &&
            now >= name_input_deadline.value()) {
                name_input_deadline = std::nullopt;
                show_name_input();
        }

        if (timer_running) {
                elapsed_seconds = (int)((now - timer_start_ms) / 1000);
        }
        timer_display.set_value(elapsed_seconds);
        mines_left_display.set_value(board.mines_left());
        place_hud();
}

void Game::render()
{
        Display *display = platform->display;
        display->clear(BG_COLOR);

        switch (mode) {
        case GameMode::Leaderboard:
                leaderboard_view.render(display);
                break;
        case GameMode::NameInput:
                victory_time.render(display);
                name_input.render(display);
                break;
        case GameMode::Playing:
                for (GuiElement *element : elements_for_mode()) {
                        element->render(display);
                }
                timer_display.render(display);
                mines_left_display.render(display);
                status.render(display);
                break;
        }

        display->refresh();
}

bool Game::save_state()
{
        bool config_saved =
            save_game_configuration(platform->persistent_storage, &config);
        bool leaderboard_saved = leaderboard.save(platform->persistent_storage);
        if (!config_saved || !leaderboard_saved) {
                LOG_WARN(TAG, "Game state was not fully saved");
                return false;
        }
        return true;
}

/**
 * Places the timer and the mines counter in the top right corner of the HUD
 * and returns the width of that block.
 */
int Game::place_hud()
{
        const Rect &hud = layout.hud;
        int hud_width = std::max(timer_display.get_rect().width,
                                 mines_left_display.get_rect().width);
        timer_display.set_position(
            {.x = rect_right(&hud) - hud_width, .y = hud.y});

        const Rect &timer = timer_display.get_rect();
        mines_left_display.set_position(
            {.x = timer.x, .y = rect_bottom(&timer) + 2 * timer.height / 5});
        return hud_width;
}

void Game::place_gui()
{
        const Rect &gui = layout.gui;
        const Rect &hud = layout.hud;

        difficulty_selector.set_position({.x = 0, .y = MARGIN});
        difficulty_selector.set_center_x(rect_center(&gui).x);

        const Rect &selector = difficulty_selector.get_rect();
        width_input.set_position(
            {.x = gui.x,
             .y = rect_bottom(&selector) + selector.height / 5});
        const Rect &width = width_input.get_rect();
        height_input.set_position(
            {.x = gui.x, .y = rect_bottom(&width) + 2 * width.height / 5});
        const Rect &height = height_input.get_rect();
        mines_input.set_position(
            {.x = gui.x, .y = rect_bottom(&height) + 2 * height.height / 5});

        int hud_width = place_hud();

        int hud_left_center = (hud.x + rect_right(&hud) - hud_width) / 2;
        restart_button.set_position({.x = 0, .y = timer_display.get_rect().y});
        restart_button.set_center_x(hud_left_center);

        leaderboard_button.set_position(
            {.x = 0,
             .y = layout.window_height - MARGIN -
                  leaderboard_button.get_rect().height});
        leaderboard_button.set_center_x(MARGIN + GUI_WIDTH / 2);

        status.set_position({.x = 0, .y = mines_left_display.get_rect().y});
        status.set_center_x(hud_left_center);

        int window_center = layout.window_width / 2;
        leaderboard_view.set_position({.x = 0, .y = MARGIN});
        leaderboard_view.set_center_x(window_center);

        victory_time.set_position({.x = 0, .y = MARGIN});
        victory_time.set_center_x(window_center);

        const Rect &victory = victory_time.get_rect();
        name_input.set_position(
            {.x = 0, .y = rect_bottom(&victory) + victory.height});
        name_input.set_center_x(window_center);
}
