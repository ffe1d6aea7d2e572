#include "leaderboard_view.hpp"
#include "widgets.hpp"
#include "../common/logging.hpp"

#define TAG "leaderboard_view"

LeaderboardView::LeaderboardView(const Leaderboard *leaderboard, int width,
                                 FontSize font_size, Color color)
    : leaderboard(leaderboard), font_size(font_size), color(color),
      section_width(width / 3), text_height(line_height(font_size)),
      vertical_margin(line_height(font_size) / 2),
      horizontal_margin(2 * font_width(font_size))
{
        int max_items = leaderboard->get_max_items();
        rect.width = 3 * section_width;
        rect.height = (4 + max_items) * vertical_margin +
                      (2 + max_items) * text_height;
}

void LeaderboardView::draw_centered(Display *display, const std::string &text,
                                    int center_x, int y)
{
        int x = center_x - text_width(text, font_size) / 2;
        display->draw_string({.x = x, .y = y}, text.c_str(), font_size, color);
}

void LeaderboardView::draw_frame(Display *display)
{
        int frame_y = rect.y + vertical_margin + text_height + vertical_margin;
        int bottom = rect_bottom(&rect) - 1;
        int right = rect_right(&rect) - 1;

        display->draw_line({.x = rect.x, .y = frame_y}, {.x = right, .y = frame_y},
                           color);
        display->draw_line({.x = rect.x, .y = frame_y}, {.x = rect.x, .y = bottom},
                           color);
        display->draw_line({.x = right, .y = frame_y}, {.x = right, .y = bottom},
                           color);
        display->draw_line({.x = rect.x, .y = bottom}, {.x = right, .y = bottom},
                           color);

        // Separators between the sections start below the headings.
        int separator_top = rect.y + vertical_margin + 3 * text_height;
        for (int i = 1; i < 3; i++) {
                int x = rect.x + i * section_width;
                display->draw_line({.x = x, .y = separator_top},
                                   {.x = x, .y = bottom - vertical_margin},
                                   color);
        }
}

void LeaderboardView::render(Display *display)
{
        int title_top = rect.y + vertical_margin;
        int section_titles_top = title_top + 2 * text_height;
        int list_start_y = section_titles_top + text_height + vertical_margin;

        draw_frame(display);
        draw_centered(display, "LEADER BOARD", rect.x + rect.width / 2,
                      title_top);

        for (size_t i = 0; i < RANKED_DIFFICULTIES.size(); i++) {
                int section_x = rect.x + (int)i * section_width;
                draw_centered(display,
                              difficulty_to_string(RANKED_DIFFICULTIES[i]),
                              section_x + section_width / 2,
                              section_titles_top);
        }

        for (const LeaderboardLine &line : leaderboard->render()) {
                int section = 0;
                for (size_t i = 0; i < RANKED_DIFFICULTIES.size(); i++) {
                        if (RANKED_DIFFICULTIES[i] == line.difficulty) {
                                section = (int)i;
                        }
                }
                int section_x = rect.x + section * section_width;
                int y = list_start_y +
                        line.rank * (text_height + vertical_margin);

                display->draw_string({.x = section_x + horizontal_margin,
                                      .y = y},
                                     line.name.c_str(), font_size, color);

                std::string time = std::to_string(line.time);
                int time_x = section_x + section_width - horizontal_margin -
                             text_width(time, font_size);
                display->draw_string({.x = time_x, .y = y}, time.c_str(),
                                     font_size, color);
        }
}

std::optional<Command> LeaderboardView::handle_event(const InputEvent &event)
{
        bool clicked = event.type == PointerUp && event.button == LeftButton;
        bool escaped = event.type == KeyDown && event.key == Escape;
        if (clicked || escaped) {
                LOG_DEBUG(TAG, "Leaderboard dismissed");
                return make_command(CommandType::Dismiss);
        }
        return std::nullopt;
}
