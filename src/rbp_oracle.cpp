#include "rbp_oracle.hpp"
#include "bin_packer.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <easylogging++.h>

#define MODULE_LOGGER "rbp_oracle"

using namespace ::sheetpack;
using namespace ::std;

struct rbp_oracle::Pimpl: rbp_oracle_props {
    // Inserts all sizes into the bin keeping their orientation
    bool fillBin(bin_packer& packer, size_list const& sizes, offset_list& positions) {
        positions.clear();
        positions.reserve(sizes.size());
        
        for(auto const& s : sizes) {
            sheet_item item;
            if(!packer.insert_rect(s.width, s.height, item))
                return false;
            
            // the oracle places items as they are
            if(item.rotated && !s.is_square())
                return false;
            
            positions.push_back(offset(item.box.x, item.box.y));
        }
        
        return true;
    }
};

rbp_oracle::rbp_oracle(rbp_oracle_props const& props): _pimpl(new Pimpl) {
    (rbp_oracle_props&)(*_pimpl) = props;
}

rbp_oracle::~rbp_oracle() {
    ;;
}

bool rbp_oracle::attempt_pack(size_list const& sizes, sheetpack::size const& bin, offset_list& positions) {
    auto packer = _pimpl->create_bin ? _pimpl->create_bin(bin.width, bin.height) : nullptr;
    if(!packer) {
        CLOG(ERROR, MODULE_LOGGER) << "Can't create a bin of size " << bin;
        return false;
    }
    
    offset_list placed;
    if(!_pimpl->fillBin(*packer, sizes, placed))
        return false;
    
    CLOG(TRACE, MODULE_LOGGER) << "Packed " << sizes.size() << " items, occupancy " << packer->occupancy();
    positions = move(placed);
    return true;
}

double rbp_oracle::density(size_list const& sizes, offset_list const& positions) const {
    long long right = 0, top = 0;
    for(size_t i = 0; i < sizes.size() && i < positions.size(); ++i) {
        right = (std::max)(right, (long long)positions[i].x + sizes[i].width);
        top = (std::max)(top, (long long)positions[i].y + sizes[i].height);
    }
    
    const long long boundsArea = right * top;
    if(boundsArea <= 0)
        return 0;
    
    return (double)total_area(sizes) / (double)boundsArea;
}
