#include <sheetpack/sheet_allocator.hpp>
#include <sheetpack/packing_search.hpp>
#include <sheetpack/shape_groups.hpp>
#include <sheetpack/errors.hpp>
#include <stdexcept>
#include <sstream>
#include <easylogging++.h>

#define MODULE_LOGGER "sheet_allocator"

using namespace ::std;

namespace sheetpack {

item_pool::item_pool(size_list const& sizes) {
    _items.reserve(sizes.size());
    for(size_t i = 0; i < sizes.size(); ++i)
        _items.push_back(pool_item(i, sizes[i]));
}

size_list item_pool::sizes() const {
    size_list output;
    output.reserve(_items.size());
    for(auto const& item : _items)
        output.push_back(item.item_size);
    return output;
}

bool item_pool::take(size const& placed, pool_item& taken) {
    auto pos = _items.end();
    for(auto it = _items.begin(); it != _items.end(); ++it) {
        if(it->item_size == placed) {
            pos = it;
            break;
        }
    }

    if(pos == _items.end()) {
        size const swapped = placed.swapped();
        for(auto it = _items.begin(); it != _items.end(); ++it) {
            if(it->item_size == swapped) {
                pos = it;
                break;
            }
        }
    }

    if(pos == _items.end())
        return false;

    taken = *pos;
    _items.erase(pos);
    return true;
}

size_t allocation_result::placed_count() const {
    size_t items = 0;
    for(auto const& s : sheets)
        items += s.packing.sizes.size();
    return items;
}

allocation_result allocate_sheets(size_list const& sizes,
                                  size const& bin,
                                  placement_oracle& oracle,
                                  allocator_props const& props)
{
    validate_sizes(sizes);
    if(!bin.is_valid()) {
        ostringstream msg;
        msg << "Invalid sheet size " << bin;
        throw invalid_input_error(msg.str());
    }

    // Any non-empty feasible subset is accepted
    auto const searchProps = max_usage_props()
        .set_threshold(boost::none)
        .enable_exhaustive(props.exhaustive);

    item_pool pool(sizes);
    allocation_result result;

    while(!pool.empty()) {
        if(props.max_sheets && result.sheets.size() >= props.max_sheets) {
            result.reason = stop_reason::sheet_limit;
            break;
        }

        packing_result packing;
        if(!find_max_usage(pool.sizes(), bin, oracle, searchProps, packing)) {
            result.reason = stop_reason::stalled;
            break;
        }

        sheet filled;
        filled.bounds = bin;
        for(auto const& placed : packing.sizes) {
            pool_item taken;
            if(!pool.take(placed, taken)) {
                ostringstream msg;
                msg << "Placed item " << placed << " is missing from the pool";
                throw logic_error(msg.str());
            }
            filled.item_indexes.push_back(taken.index);
        }
        filled.packing = move(packing);

        CLOG(INFO, MODULE_LOGGER) << "Sheet " << result.sheets.size()
                                  << ": " << filled.item_indexes.size() << " items, "
                                  << pool.count() << " left";
        result.sheets.push_back(move(filled));
    }

    result.unplaced = pool.items();

    CLOG(INFO, MODULE_LOGGER) << "Fit " << result.placed_count() << " items on "
                              << result.sheets.size() << " sheets";
    if(!result.unplaced.empty()) {
        CLOG(WARNING, MODULE_LOGGER) << result.unplaced.size() << " items left unplaced ("
                                     << to_string(result.reason) << ")";
    }

    return result;
}

char const* to_string(stop_reason reason) {
    switch (reason) {
        case stop_reason::completed:
            return "completed";
        case stop_reason::stalled:
            return "stalled";
        case stop_reason::sheet_limit:
            return "sheet_limit";
    }
    return "unknown";
}

} // sheetpack
