#include "constants.hpp"
#include "font_size.hpp"

const std::vector<Color> MINE_COUNT_COLORS = {
    Black,  Blue,          DarkGreen, Red,    Navy,
    Brown,  LightSeaGreen, Black,     DimGray};

// The widths below match the glyph advance of the bundled monospace font.
int font_width(FontSize size)
{
        switch (size) {
        case Size12:
                return 7;
        case Size16:
                return 10;
        case Size24:
                return 15;
        default:
                return 10;
        }
}

int line_height(FontSize size) { return (int)size + (int)size / 3; }
