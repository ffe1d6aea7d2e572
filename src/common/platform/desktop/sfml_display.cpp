#include "sfml_display.hpp"
#include "asset_provider.hpp"
#include "../../logging.hpp"
#include <cstdint>
#include <string>
#include <utility>

#define TAG "sfml_display"

bool SfmlDisplay::setup()
{
        std::string font_path = get_asset_path(GAME_FONT_FILE);
        if (!font.openFromFile(font_path)) {
                LOG_ERROR(TAG, "Unable to load the font from %s",
                          font_path.c_str());
                return false;
        }

        for (Sprite sprite : {TileSprite, MineSprite, FlagSprite}) {
                std::string path =
                    get_asset_path(std::string(sprite_to_str(sprite)) + ".png");
                sf::Texture texture;
                if (!texture.loadFromFile(path)) {
                        LOG_ERROR(TAG, "Unable to load the %s sprite from %s",
                                  sprite_to_str(sprite), path.c_str());
                        return false;
                }
                texture.setSmooth(true);
                textures.insert_or_assign(sprite, std::move(texture));
        }

        LOG_DEBUG(TAG, "Loaded the font and %d sprites", (int)textures.size());
        return true;
}

void SfmlDisplay::resize(int width, int height)
{
        window->setSize({(unsigned int)width, (unsigned int)height});
        // Keeps one view unit equal to one pixel after the resize.
        window->setView(sf::View(sf::FloatRect(
            {0.f, 0.f}, {(float)width, (float)height})));
        LOG_DEBUG(TAG, "Window resized to %dx%d", width, height);
}

void SfmlDisplay::clear(Color color) { window->clear(map_to_sf_color(color)); }

void SfmlDisplay::draw_rectangle(Point start, int width, int height,
                                 Color color, int border_width, bool filled)
{
        sf::RectangleShape rectangle({(float)width, (float)height});
        rectangle.setPosition({(float)start.x, (float)start.y});
        if (filled) {
                rectangle.setFillColor(map_to_sf_color(color));
        } else {
                rectangle.setFillColor(sf::Color::Transparent);
        }
        rectangle.setOutlineColor(map_to_sf_color(color));
        // Negative thickness keeps the outline inside of the rectangle.
        rectangle.setOutlineThickness(-(float)border_width);
        window->draw(rectangle);
}

void SfmlDisplay::draw_line(Point start, Point end, Color color)
{
        sf::Vertex line[] = {
            sf::Vertex(sf::Vector2f(start.x, start.y), map_to_sf_color(color)),
            sf::Vertex(sf::Vector2f(end.x, end.y), map_to_sf_color(color))};

        window->draw(line, 2, sf::PrimitiveType::Lines);
}

void SfmlDisplay::draw_string(Point start, const char *string_buffer,
                              FontSize font_size, Color fg_color)
{
        sf::Text text(font, string_buffer, font_size);

        text.setFillColor(map_to_sf_color(fg_color));
        text.setPosition({(float)start.x, (float)start.y});
        window->draw(text);
}

void SfmlDisplay::draw_sprite(Point start, Sprite sprite, int size)
{
        auto texture = textures.find(sprite);
        if (texture == textures.end()) {
                LOG_WARN(TAG, "Sprite %s was not loaded", sprite_to_str(sprite));
                return;
        }
        sf::Sprite image(texture->second);
        sf::Vector2u texture_size = texture->second.getSize();
        image.setScale({(float)size / texture_size.x,
                        (float)size / texture_size.y});
        image.setPosition({(float)start.x, (float)start.y});
        window->draw(image);
}

int SfmlDisplay::get_height() { return (int)window->getSize().y; }

int SfmlDisplay::get_width() { return (int)window->getSize().x; }

void SfmlDisplay::refresh() { window->display(); }

/**
 * The game describes colors in the RGB565 encoding, whereas SFML uses RGB888
 * with the additional opacity channel. This function converts from the RGB565
 * color to the RGB888 by scaling each channel and setting opacity to 1.
 */
sf::Color map_to_sf_color(Color color)
{
        uint8_t red, green, blue;

        int bitmask_5 = 0b11111;
        int bitmask_6 = 0b111111;

        int original_blue = color & bitmask_5;
        int original_green = (color >> 5) & bitmask_6;
        int original_red = (color >> 11);

        red = (int)((float)original_red / bitmask_5 * 255);
        green = (int)((float)original_green / bitmask_6 * 255);
        blue = (int)((float)original_blue / bitmask_5 * 255);

        return sf::Color(red, green, blue);
}
