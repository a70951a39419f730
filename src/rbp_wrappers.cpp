#include "rbp_wrappers.hpp"
#include "helpers.hpp"
#include <map>
#include <string>

namespace  {
    bool update_sheet_item(int base_width, int base_height, rbp::Rect const& rect, sheet_item& item) {
        bool isSameRect = \
        (rect.height == base_height && rect.width == base_width) ||
        (rect.height == base_width && rect.width == base_height);
        
        if(!isSameRect)
            return false;
        
        if(rect.width == 0 || rect.height == 0)
            return false;
        
        item.box.x = rect.x;
        item.box.y = rect.y;
        item.box.width = rect.width;
        item.box.height = rect.height;
        item.rotated = base_width == rect.height && base_width != rect.width;

        return true;
    }
}


bool max_rects_bin::packer::insert_rect(int width, int height, sheet_item& item) {
    auto rect = rbp_packer().Insert(width, height, prefs().insert_heuristic);
    return update_sheet_item(width, height, rect, item);
}

void max_rects_bin::packer::clean_bin() {
    // items keep the orientation they are inserted with
    rbp_packer().Init(prefs().bin_width,
                      prefs().bin_height,
                      false);
}


bool skyline_bin::packer::insert_rect(int width, int height, sheet_item& item) {
    auto rect = rbp_packer().Insert(width, height, prefs().insert_heuristic);
    return update_sheet_item(width, height, rect, item);
}

void skyline_bin::packer::clean_bin() {
    rbp_packer().Init(prefs().bin_width,
                      prefs().bin_height,
                      prefs().use_waste_map);
}


bool guillotine_bin::packer::insert_rect(int width, int height, sheet_item& item) {
    auto rect = rbp_packer().Insert(width, height,
                                    prefs().use_merge,
                                    prefs().insert_heuristic,
                                    prefs().split_heuristic);
    return update_sheet_item(width, height, rect, item);
}

void guillotine_bin::packer::clean_bin() {
    rbp_packer().Init(prefs().bin_width,
                      prefs().bin_height);
}


bool packer_kind_from_name(std::string const& name, packer_kind& kind) {
    static const std::map<std::string, packer_kind> packerKinds = {
        {"maxrects", packer_kind::max_rects},
        {"skyline", packer_kind::skyline},
        {"guillotine", packer_kind::guillotine},
    };
    
    auto pos = packerKinds.find(name);
    if(pos == packerKinds.end())
        return false;
    
    kind = pos->second;
    return true;
}

bin_packer_ptr create_bin_packer(packer_kind kind, int bin_width, int bin_height) {
    bin_packer_ptr binPacker;
    switch (kind) {
        case packer_kind::skyline: {
            auto packer = std::make_shared<skyline_bin::packer>();
            packer->prefs()
            .set_bin_width(bin_width)
            .set_bin_height(bin_height);
            binPacker = packer;
            break;
        }
        case packer_kind::guillotine: {
            auto packer = std::make_shared<guillotine_bin::packer>();
            packer->prefs()
            .set_bin_width(bin_width)
            .set_bin_height(bin_height);
            binPacker = packer;
            break;
        }
        default: {
            auto packer = std::make_shared<max_rects_bin::packer>();
            packer->prefs()
            .set_bin_width(bin_width)
            .set_bin_height(bin_height);
            binPacker = packer;
            break;
        }
    }
    
    binPacker->clean_bin();
    return binPacker;
}
