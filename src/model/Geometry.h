#pragma once

#include <algorithm>
#include <cstdlib>

namespace ll
{

// Rectangle in layout cells.
struct Rect
{
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    Rect() = default;
    Rect (int x_, int y_, int w_, int h_) : x (x_), y (y_), width (w_), height (h_) {}

    int right() const  { return x + width; }
    int bottom() const { return y + height; }

    // Doubled centre, so odd sizes stay exact in integer maths
    int centreX2() const { return 2 * x + width; }
    int centreY2() const { return 2 * y + height; }

    bool isEmpty() const { return width <= 0 || height <= 0; }

    bool overlapsHorizontally (const Rect& other) const
    {
        return x < other.right() && other.x < right();
    }

    bool overlapsVertically (const Rect& other) const
    {
        return y < other.bottom() && other.y < bottom();
    }

    bool intersects (const Rect& other) const
    {
        return overlapsHorizontally (other) && overlapsVertically (other);
    }

    bool operator== (const Rect& other) const
    {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }

    bool operator!= (const Rect& other) const { return ! (*this == other); }
};

} // namespace ll
