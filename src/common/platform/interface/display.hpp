#pragma once
#include "../../point.hpp"
#include "../../font_size.hpp"
#include "color.hpp"

/**
 * Images that are loaded from the assets directory during `Display::setup`.
 */
typedef enum Sprite { TileSprite = 0, MineSprite = 1, FlagSprite = 2 } Sprite;

const char *sprite_to_str(Sprite sprite);

/*
 * @brief Display interface that needs to be implemented by classes that will be
 * used for drawing the game.
 *
 */
class Display
{
      public:
        virtual ~Display() = default;
        /**
         * Performs the setup of the display: loads the font and the sprite
         * images. Returns false if any of the assets could not be loaded, in
         * which case the display is unusable and the caller should exit.
         * It is intended to be executed only once.
         */
        virtual bool setup() = 0;
        /**
         * Changes the size of the drawable area. The window is resized whenever
         * the board dimensions change.
         */
        virtual void resize(int width, int height) = 0;
        /**
         * Clears the display. This is done by redrawing the entire screen with
         * the specified color.
         */
        virtual void clear(Color color) = 0;
        /**
         * Draws a rectangle with specified color, border width and fill.
         */
        virtual void draw_rectangle(Point start, int width, int height,
                                    Color color, int border_width,
                                    bool filled) = 0;
        /**
         * Draws a line from a start point to the end point with specified
         * color. Note that thickness is not controllable yet.
         */
        virtual void draw_line(Point start, Point end, Color color) = 0;
        /**
         * Prints a string on the display. The text is drawn with a monospace
         * font so its width is `strlen(text) * font_width(font_size)`.
         */
        virtual void draw_string(Point start, const char *text,
                                 FontSize font_size, Color fg_color) = 0;
        /**
         * Draws one of the preloaded sprites scaled to a square of the
         * given size.
         */
        virtual void draw_sprite(Point start, Sprite sprite, int size) = 0;

        /**
         * Returns the height of the display.
         */
        virtual int get_height() = 0;

        /**
         * Returns the width of the display.
         */
        virtual int get_width() = 0;

        /**
         * Presents everything drawn since the last refresh.
         */
        virtual void refresh() = 0;
};
