#pragma once
#include "gui_element.hpp"
#include "leaderboard.hpp"
#include "../common/font_size.hpp"

/**
 * Full-window view of the leaderboard: a title and a framed table with one
 * section per ranked difficulty. Clicking anywhere or pressing Escape closes
 * it.
 */
class LeaderboardView : public GuiElement
{
      public:
        LeaderboardView(const Leaderboard *leaderboard, int width,
                        FontSize font_size, Color color);

        void render(Display *display) override;
        std::optional<Command> handle_event(const InputEvent &event) override;

        int get_section_width() const { return section_width; }

      private:
        const Leaderboard *leaderboard;
        FontSize font_size;
        Color color;
        int section_width;
        int text_height;
        int vertical_margin;
        int horizontal_margin;

        void draw_frame(Display *display);
        void draw_centered(Display *display, const std::string &text,
                           int center_x, int y);
};
