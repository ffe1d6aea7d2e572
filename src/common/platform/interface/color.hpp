#pragma once

/**
 * Colors are stored in the RGB565 encoding: 5 bits of red, 6 bits of green and
 * 5 bits of blue. Display implementations are responsible for converting them
 * into whatever their rendering backend expects.
 */
typedef enum Color : unsigned short {
        Black = 0x0000,
        White = 0xFFFF,
        Red = 0xF800,
        Green = 0x07E0,
        Blue = 0x001F,
        DarkGreen = 0x0320,
        Navy = 0x0010,
        Brown = 0xA145,
        LightSeaGreen = 0x2595,
        DimGray = 0x6B4D,
        Gray = 0x8410,
        LightSlateGray = 0x7453,
        LightYellow = 0xFFFC,
        FieldBackground = 0xD6FB,
        FieldLines = 0x7410,
} Color;
