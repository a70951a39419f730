#pragma once

#include "forwards.hpp"
#include <sheetpack/geometry.hpp>
#include <string>

/// Simple rect
struct rect {
    int x=0, y=0, width=0, height=0;
    
    rect() { ;; }
    rect(int _x, int _y, int _w, int _h)
    : x(_x), y(_y), width(_w), height(_h)
    { ;; }
};

/// Describes sheet item generic properties
struct sheet_item {
    std::string name;               ///< Item label given by the user
    sheetpack::size size;           ///< Item size as requested
    bool rotated=false;             ///< Is the item rotated on the sheet
    rect box;                       ///< Rect to place the item into
};

/// Describes sheet properties
struct sheet_props {
    sheetpack::size size;           ///< Dimensions of the sheet
    int index = 0;                  ///< Sequential number of the sheet
    double density = 0;             ///< Packing density reported by the oracle
    float occupancy = 0;            ///< Covered share of the sheet (the value in the range [0,1])
};
