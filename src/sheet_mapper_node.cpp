#include "sheet_mapper_node.hpp"
#include "helpers.hpp"
#include <sheetpack/packing_search.hpp>
#include <sheetpack/sheet_allocator.hpp>
#include <sheetpack/errors.hpp>
#include <easylogging++.h>

#define MODULE_LOGGER "sheet_mapper"

using namespace ::sheetpack;
using namespace ::std;

namespace {
    
    // Turns a single packing into an allocation of the given items
    allocation_result allocationOf(packing_result const& packing, sheetpack::size const& bin, size_list const& sizes) {
        item_pool pool(sizes);
        allocation_result result;
        
        sheet filled;
        filled.bounds = bin;
        for(auto const& placed : packing.sizes) {
            pool_item taken;
            if(!pool.take(placed, taken))
                throw logic_error("Placed item is missing from the pool");
            filled.item_indexes.push_back(taken.index);
        }
        filled.packing = packing;
        result.sheets.push_back(move(filled));
        
        result.unplaced = pool.items();
        return result;
    }
    
    // Everything stays unplaced
    allocation_result emptyAllocation(size_list const& sizes) {
        allocation_result result;
        result.unplaced = item_pool(sizes).items();
        result.reason = stop_reason::stalled;
        return result;
    }
}

struct sheet_mapper_node::Pimpl: sheet_mapper_props {
    sheet_builder* mainChain = nullptr;
    sheet_props sheetTmpl;          ///< Sheet template
    vector<sheet_item> items;       ///< Collected items
    
    size_list itemSizes() const {
        size_list sizes;
        sizes.reserve(items.size());
        for(auto const& item : items)
            sizes.push_back(item.size);
        return sizes;
    }
    
    // Runs the configured search over the collected items
    allocation_result allocate() {
        auto const sizes = itemSizes();
        auto const bin = sheetTmpl.size;
        
        switch (mode) {
            case search_mode::max_usage: {
                packing_result packing;
                auto searchProps = max_usage_props()
                    .set_threshold(threshold)
                    .enable_exhaustive(exhaustive);
                if(!find_max_usage(sizes, bin, *oracle, searchProps, packing))
                    return emptyAllocation(sizes);
                return allocationOf(packing, bin, sizes);
            }
            case search_mode::optimal_packing: {
                packing_result packing;
                if(!find_optimal_packing(sizes, bin, *oracle, packing))
                    return emptyAllocation(sizes);
                return allocationOf(packing, bin, sizes);
            }
            default:
                return allocate_sheets(sizes, bin, *oracle, allocator_props()
                                       .enable_exhaustive(exhaustive)
                                       .set_max_sheets(max_sheets));
        }
    }
    
    // Forwards the allocated sheets and leftovers to the chain
    bool transferAllocation(allocation_result const& allocation, bool finalize) {
        for(auto const& leftover : allocation.unplaced) {
            if(!mainChain->add_unplaced_item(items[leftover.index]))
                return false;
        }
        
        if(allocation.sheets.empty()) {
            // The chain still has to be finalized
            if(!mainChain->begin_sheet(sheetTmpl))
                return false;
            return mainChain->end_sheet(finalize);
        }
        
        for(size_t i = 0; i < allocation.sheets.size(); ++i) {
            auto const& filled = allocation.sheets[i];
            auto const& packing = filled.packing;
            
            sheet_props props = sheetTmpl;
            props.size = filled.bounds;
            props.index = (int)i;
            props.density = packing.density;
            props.occupancy = (float)((double)total_area(packing.sizes) / (double)filled.bounds.area());
            if(!mainChain->begin_sheet(props))
                return false;
            
            for(size_t k = 0; k < packing.sizes.size(); ++k) {
                auto const& placed = packing.sizes[k];
                auto const& position = packing.positions[k];
                
                sheet_item item = items[filled.item_indexes[k]];
                item.box = rect(position.x, position.y, placed.width, placed.height);
                item.rotated = placed != item.size;
                if(!mainChain->add_sheet_item(item))
                    return false;
            }
            
            bool const last = i + 1 == allocation.sheets.size();
            if(!mainChain->end_sheet(last && finalize))
                return false;
        }
        
        return true;
    }
};


sheet_mapper_node::sheet_mapper_node(sheet_mapper_props const& props): _pimpl(new Pimpl) {
    (sheet_mapper_props&)(*_pimpl) = props;
    
    auto& safeForwarder = this->safe_fwd();
    _pimpl->mainChain = &safeForwarder;
}

sheet_mapper_node::~sheet_mapper_node() {
    ;;
}

bool sheet_mapper_node::begin_sheet(sheet_props const& sheet) {
    if(!sheet.size.is_valid()) {
        CLOG(ERROR, MODULE_LOGGER) << "Invalid sheet size " << sheet.size;
        return false;
    }
    
    _pimpl->sheetTmpl = sheet;
    _pimpl->items.clear();
    return true;
}

bool sheet_mapper_node::add_sheet_item(sheet_item const& item) {
    if(!item.size.is_valid()) {
        CLOG(ERROR, MODULE_LOGGER) << "The item " << item.name
                                   << " has invalid size " << item.size;
        return false;
    }
    
    if(item.size.canonical().width > (std::min)(_pimpl->sheetTmpl.size.width, _pimpl->sheetTmpl.size.height) ||
       item.size.canonical().height > (std::max)(_pimpl->sheetTmpl.size.width, _pimpl->sheetTmpl.size.height)) {
        CLOG(WARNING, MODULE_LOGGER) << "The item " << item.name << " is too big to fit the sheet";
    }
    
    // Collect items
    _pimpl->items.push_back(item);
    return true;
}

bool sheet_mapper_node::end_sheet(bool finalize) {
    if(!_pimpl->oracle) {
        CLOG(ERROR, MODULE_LOGGER) << "No placement oracle";
        return false;
    }
    
    allocation_result allocation;
    try {
        allocation = _pimpl->allocate();
    } catch(invalid_input_error const& e) {
        CLOG(ERROR, MODULE_LOGGER) << e.what();
        return false;
    }
    
    CLOG(INFO, MODULE_LOGGER) << "Mapped " << allocation.placed_count() << " of "
                              << _pimpl->items.size() << " items onto "
                              << allocation.sheets.size() << " sheets";
    
    bool const isOk = _pimpl->transferAllocation(allocation, finalize);
    _pimpl->items.clear();
    return isOk;
}

void sheet_mapper_node::reset() {
    _pimpl->items.clear();
    _pimpl->sheetTmpl = sheet_props();
    safe_fwd().reset();
}
