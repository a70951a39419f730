#pragma once

#include "forwards.hpp"
#include "helpers.hpp"
#include <boost/optional.hpp>
#include <istream>

/// Items parser properties
struct json_parser_props {
    using props = json_parser_props;
    
    sheet_builder_ptr sheet_builder;                    ///< Sheet builder
    boost::optional<sheetpack::size> sheet_size;        ///< Overrides the sheet size of the document
    
    /// Sets sheet builder
    props& set_sheet_builder(sheet_builder_ptr arg) {sheet_builder=std::move(arg); return *this;}
    /// Sets sheet size
    props& set_sheet_size(boost::optional<sheetpack::size> arg) {sheet_size=arg; return *this;}
};

/**
 @brief Parses the item list from json and feeds it to the sheet builder.
 The document looks like
 @code
 { "sheet_size": [50, 50],
   "items": [ { "name": "shelf", "size": [30, 3], "count": 4 } ] }
 @endcode
 The name defaults to "item<N>" and the count defaults to 1.
 */
bool parse_json_items(std::istream& items_stream, json_parser_props const& props);
