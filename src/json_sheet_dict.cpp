#include "json_sheet_dict.hpp"

const char* json_sheet_dict::size               = "size";
const char* json_sheet_dict::index              = "index";
const char* json_sheet_dict::density            = "density";
const char* json_sheet_dict::occupancy          = "occupancy";
const char* json_sheet_dict::regions            = "regions";
const char* json_sheet_dict::region_rect        = "rect";
const char* json_sheet_dict::region_rotated     = "rotated";
const char* json_sheet_dict::region_name        = "name";
const char* json_sheet_dict::sheet_size         = "sheet_size";
const char* json_sheet_dict::sheets             = "sheets";
const char* json_sheet_dict::sheet_items        = "items";
const char* json_sheet_dict::placed             = "placed";
const char* json_sheet_dict::unplaced           = "unplaced";
const char* json_sheet_dict::items              = "items";
const char* json_sheet_dict::item_name          = "name";
const char* json_sheet_dict::item_size          = "size";
const char* json_sheet_dict::item_count         = "count";
