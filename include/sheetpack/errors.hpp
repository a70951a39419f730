#pragma once

#include <stdexcept>
#include <string>

namespace sheetpack {

    /// Raised for malformed input before any search starts
    class invalid_input_error: public std::invalid_argument {
    public:
        explicit invalid_input_error(std::string const& what)
        : std::invalid_argument(what)
        { ;; }
    };

} // sheetpack
