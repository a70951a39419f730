#include <sheetpack/rotation_enumerator.hpp>
#include <sheetpack/errors.hpp>
#include <sstream>

using namespace ::std;

namespace sheetpack {

group_options<size> unique_rotation_combinations(size const& shape, int count) {
    if(!shape.is_valid() || count < 0) {
        ostringstream msg;
        msg << "Invalid shape group " << shape << " x " << count;
        throw invalid_input_error(msg.str());
    }

    group_options<size> output;
    if(shape.is_square()) {
        output.push_back(size_list(count, shape));
        return output;
    }

    // i items keep the orientation, the rest is swapped
    size const swapped = shape.swapped();
    for(int i = 0; i <= count; ++i) {
        size_list sequence(i, shape);
        sequence.insert(sequence.end(), count - i, swapped);
        output.push_back(move(sequence));
    }

    return output;
}

vector<size_list> find_rotations(size_list const& sizes) {
    auto const groups = make_shape_groups(sizes);

    size_list prefix;
    vector<group_options<size>> rotatable;
    for(auto const& group : groups) {
        if(group.is_symmetric()) {
            prefix.insert(prefix.end(), group.count, group.shape);
            continue;
        }
        rotatable.push_back(unique_rotation_combinations(group.shape, group.count));
    }

    vector<size_list> output;
    for_each_combination(prefix, rotatable, [&output](size_list const& combination) {
        output.push_back(combination);
    });

    return output;
}

size_t count_rotation_combinations(size_list const& sizes) {
    size_t combinations = 1;
    for(auto const& group : make_shape_groups(sizes)) {
        if(!group.is_symmetric())
            combinations *= group.count + 1;
    }
    return combinations;
}

} // sheetpack
