#pragma once

#include "forwards.hpp"
#include <ostream>

namespace sheetpack {

    /// Rectangle dimensions. The orientation is significant.
    struct size {
        int width=0, height=0;

        size() { ;; }
        size(int w, int h)
        : width(w), height(h)
        { ;; }

        long long area() const { return (long long)width * height; }

        /// Both dimensions are strictly positive
        bool is_valid() const { return width > 0 && height > 0; }

        /// Rotation is a no-op for the shape
        bool is_square() const { return width == height; }

        /// Returns the shape rotated by 90 degrees
        size swapped() const { return size(height, width); }

        /// Returns the shape with the smaller dimension first
        size canonical() const { return width <= height ? *this : swapped(); }
    };

    inline bool operator==(size const& a, size const& b) {
        return a.width == b.width && a.height == b.height;
    }

    inline bool operator!=(size const& a, size const& b) {
        return !(a == b);
    }

    inline bool operator<(size const& a, size const& b) {
        return a.width < b.width || (a.width == b.width && a.height < b.height);
    }

    inline std::ostream& operator<<(std::ostream& os, size const& s) {
        return os << "(" << s.width << ", " << s.height << ")";
    }

    /// Position of the bottom-left corner of a placed rectangle
    struct offset {
        int x=0, y=0;

        offset() { ;; }
        offset(int _x, int _y)
        : x(_x), y(_y)
        { ;; }
    };

    inline bool operator==(offset const& a, offset const& b) {
        return a.x == b.x && a.y == b.y;
    }

    inline std::ostream& operator<<(std::ostream& os, offset const& o) {
        return os << "(" << o.x << ", " << o.y << ")";
    }

    /// Sum of the areas of all sizes
    inline long long total_area(size_list const& sizes) {
        long long area = 0;
        for(auto const& s : sizes)
            area += s.area();
        return area;
    }

} // sheetpack
