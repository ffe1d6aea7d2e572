#include "point.hpp"
#include "stdlib.h"

bool operator==(const Point &a, const Point &b)
{
        return a.x == b.x && a.y == b.y;
}

bool operator!=(const Point &a, const Point &b) { return !(a == b); }

bool is_inside(const Rect *rect, const Point *p)
{
        return p->x >= rect->x && p->y >= rect->y &&
               p->x < rect->x + rect->width && p->y < rect->y + rect->height;
}

Point rect_center(const Rect *rect)
{
        return {.x = rect->x + rect->width / 2,
                .y = rect->y + rect->height / 2};
}

int rect_right(const Rect *rect) { return rect->x + rect->width; }

int rect_bottom(const Rect *rect) { return rect->y + rect->height; }

std::vector<Point> get_neighbours_inside_grid(const Point *point, int rows,
                                              int cols)
{
        std::vector<Point> neighbours;
        // Dereference for readability;
        Point p = *point;

        // We add adjacent neighbours if within grid
        if (p.y > 0)
                neighbours.push_back({.x = p.x, .y = p.y - 1});
        if (p.y < rows - 1)
                neighbours.push_back({.x = p.x, .y = p.y + 1});
        if (p.x > 0)
                neighbours.push_back({.x = p.x - 1, .y = p.y});
        if (p.x < cols - 1)
                neighbours.push_back({.x = p.x + 1, .y = p.y});

        // We add diagonal neighbours if within grid
        if (p.y > 0 && p.x > 0)
                neighbours.push_back({.x = p.x - 1, .y = p.y - 1});
        if (p.y < rows - 1 && p.x < cols - 1)
                neighbours.push_back({.x = p.x + 1, .y = p.y + 1});
        if (p.x > 0 && p.y < rows - 1)
                neighbours.push_back({.x = p.x - 1, .y = p.y + 1});
        if (p.x < cols - 1 && p.y > 0)
                neighbours.push_back({.x = p.x + 1, .y = p.y - 1});

        return neighbours;
}

bool is_adjacent(const Point *p1, const Point *p2)
{
        return (abs(p1->x - p2->x) <= 1 && abs(p1->y - p2->y) <= 1);
}

bool is_inside_grid(const Point *p, int rows, int cols)
{
        return p->x >= 0 && p->y >= 0 && p->x < cols && p->y < rows;
}
