#include "json_items_parser.hpp"
#include "sheet_builder.hpp"
#include "json_sheet_dict.hpp"
#include <rapidjson/rapidjson.h>
#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <easylogging++.h>

#define MODULE_LOGGER "json_parser"

using namespace ::rapidjson;
using namespace ::std;

// undef colliding windows definings
#ifdef GetObject
#undef GetObject
#endif

namespace {
    using Dict = json_sheet_dict;

    bool parseSize(Value const& jSize, sheetpack::size& result) {
        if(!jSize.IsArray() || jSize.Size() != 2 || !jSize[0].IsInt() || !jSize[1].IsInt())
            return false;
        
        result = sheetpack::size(jSize[0].GetInt(), jSize[1].GetInt());
        return true;
    }
    
    bool parseItem(Value const& jItem, int itemIndex, sheet_item& item, int& count) {
        if(!jItem.IsObject())
            return false;
        
        auto sizePos = jItem.FindMember(Dict::item_size);
        if(sizePos == jItem.MemberEnd() || !parseSize(sizePos->value, item.size))
            return false;
        
        item.name = "item" + to_string(itemIndex);
        auto namePos = jItem.FindMember(Dict::item_name);
        if(namePos != jItem.MemberEnd()) {
            if(!namePos->value.IsString())
                return false;
            item.name = namePos->value.GetString();
        }
        
        count = 1;
        auto countPos = jItem.FindMember(Dict::item_count);
        if(countPos != jItem.MemberEnd()) {
            if(!countPos->value.IsInt() || countPos->value.GetInt() < 0)
                return false;
            count = countPos->value.GetInt();
        }
        
        return true;
    }
    
} // anonymous

bool parse_json_items(std::istream& itemsStream, json_parser_props const& props) {
    IStreamWrapper rjStream(itemsStream);
    Document doc;
    doc.ParseStream(rjStream);
    
    if(doc.HasParseError() || !doc.IsObject()) {
        CLOG(ERROR, MODULE_LOGGER) << "Invalid JSON stream";
        return false;
    }
    
    if(!props.sheet_builder) {
        CLOG(ERROR, MODULE_LOGGER) << "No sheet builder";
        return false;
    }

    // Parse sheet info
    sheet_props sheet;
    if(props.sheet_size) {
        sheet.size = *props.sheet_size;
    } else {
        auto sizePos = doc.FindMember(Dict::sheet_size);
        if(sizePos == doc.MemberEnd() || !parseSize(sizePos->value, sheet.size)) {
            CLOG(ERROR, MODULE_LOGGER) << "Sheet size is missing";
            return false;
        }
    }
    
    auto itemsPos = doc.FindMember(Dict::items);
    if(itemsPos == doc.MemberEnd() || !itemsPos->value.IsArray()) {
        CLOG(ERROR, MODULE_LOGGER) << "Items array is missing";
        return false;
    }

    auto& writer = *(props.sheet_builder);
    if(!writer.begin_sheet(sheet))
        return false;

    // Parse items
    bool hasError = false;
    int itemIndex = 0;
    for(auto const& jItem : itemsPos->value.GetArray()) {
        sheet_item item;
        int count = 0;
        
        hasError = !parseItem(jItem, itemIndex, item, count);
        if(hasError) {
            CLOG(ERROR, MODULE_LOGGER) << "Malformed item #" << itemIndex;
            break;
        }
        
        for(int i = 0; i < count && !hasError; ++i)
            hasError = !writer.add_sheet_item(item);
        
        if(hasError) {
            CLOG(ERROR, MODULE_LOGGER)\
            << "Error processing the item "\
            << item.name;
            break;
        }
        ++itemIndex;
    }
    
    if(hasError) {
        writer.reset();
        return false;
    }
    
    return writer.end_sheet(true);
}
