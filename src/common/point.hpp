#pragma once
#include <vector>

typedef struct Point {
        int x;
        int y;

} Point;

bool operator==(const Point &a, const Point &b);
bool operator!=(const Point &a, const Point &b);

/**
 * Axis-aligned rectangle in display pixels. `x` and `y` point at the top left
 * corner; the right and bottom edges are exclusive.
 */
typedef struct Rect {
        int x;
        int y;
        int width;
        int height;
} Rect;

bool is_inside(const Rect *rect, const Point *p);
Point rect_center(const Rect *rect);
int rect_right(const Rect *rect);
int rect_bottom(const Rect *rect);

/**
 * Returns all up-to-8 neighbours of the point that lie inside the grid of the
 * given size. The point itself is not included.
 */
std::vector<Point> get_neighbours_inside_grid(const Point *point, int rows,
                                              int cols);

bool is_adjacent(const Point *p1, const Point *p2);

bool is_inside_grid(const Point *p, int rows, int cols);
