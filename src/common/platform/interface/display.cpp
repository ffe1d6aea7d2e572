#include "display.hpp"

const char *sprite_to_str(Sprite sprite)
{
        switch (sprite) {
        case TileSprite:
                return "tile";
        case MineSprite:
                return "mine";
        case FlagSprite:
                return "flag";
        default:
                return "unknown";
        };
}
