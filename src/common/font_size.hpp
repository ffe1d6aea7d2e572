#pragma once

/**
 * Font sizes supported by the displays. The underlying value is the character
 * size in pixels, which lets the SFML display pass it straight to `sf::Text`.
 */
typedef enum FontSize : unsigned int {
        Size12 = 12,
        Size16 = 16,
        Size24 = 24,
} FontSize;

/**
 * Width of a single character for the given font size. The game uses a
 * monospace font so the width of a string is its length times this value.
 */
int font_width(FontSize size);

/**
 * Height of a line of text for the given font size, including the spacing
 * between two lines.
 */
int line_height(FontSize size);
