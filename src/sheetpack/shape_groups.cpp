#include <sheetpack/shape_groups.hpp>
#include <sheetpack/errors.hpp>
#include <map>
#include <sstream>

using namespace ::std;

namespace sheetpack {

void validate_sizes(size_list const& sizes) {
    for(size_t i = 0; i < sizes.size(); ++i) {
        if(!sizes[i].is_valid()) {
            ostringstream msg;
            msg << "Item " << i << " has invalid size " << sizes[i];
            throw invalid_input_error(msg.str());
        }
    }
}

shape_group_list make_shape_groups(size_list const& sizes) {
    validate_sizes(sizes);

    shape_group_list groups;
    map<size, size_t> positions;    // canonical shape -> group position
    for(auto const& s : sizes) {
        size shape = s.canonical();
        auto pos = positions.find(shape);
        if(pos == positions.end()) {
            positions.insert(make_pair(shape, groups.size()));
            groups.push_back(shape_group(shape, 1));
            continue;
        }
        ++groups[pos->second].count;
    }

    return groups;
}

} // sheetpack
