#pragma once

/// Json fields dictionary
struct json_sheet_dict {
    static const char* size;
    static const char* index;
    static const char* density;
    static const char* occupancy;
    static const char* regions;
    static const char* region_rect;
    static const char* region_rotated;
    static const char* region_name;
    static const char* sheet_size;
    static const char* sheets;
    static const char* sheet_items;
    static const char* placed;
    static const char* unplaced;
    static const char* items;
    static const char* item_name;
    static const char* item_size;
    static const char* item_count;
};
