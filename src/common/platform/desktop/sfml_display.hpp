#pragma once
#include "../interface/display.hpp"
#include <SFML/Graphics.hpp>
#include <map>

/**
 * Display implementation drawing straight into an SFML window. The game
 * redraws the whole frame every time, so no intermediate texture is needed.
 */
class SfmlDisplay : public Display
{
      public:
        explicit SfmlDisplay(sf::RenderWindow *window) : window(window) {}

        bool setup() override;
        void resize(int width, int height) override;
        void clear(Color color) override;
        void draw_rectangle(Point start, int width, int height, Color color,
                            int border_width, bool filled) override;
        void draw_line(Point start, Point end, Color color) override;
        void draw_string(Point start, const char *text, FontSize font_size,
                         Color fg_color) override;
        void draw_sprite(Point start, Sprite sprite, int size) override;
        int get_height() override;
        int get_width() override;
        void refresh() override;

      private:
        sf::RenderWindow *window;
        sf::Font font;
        std::map<Sprite, sf::Texture> textures;
};

sf::Color map_to_sf_color(Color color);
