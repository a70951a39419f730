#include "json_writer_node.hpp"
#include "json_sheet_dict.hpp"
#include "helpers.hpp"
#include <rapidjson/document.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <easylogging++.h>

#include <stdexcept>

#define MODULE_LOGGER "json_writer"

using namespace ::std;
using namespace ::rapidjson;

namespace rj = ::rapidjson;

namespace {
    using Dict = json_sheet_dict;
    
    rj::Value sizeArray(sheetpack::size const& s, rj::Document::AllocatorType& allocator) {
        rj::Value entry(rj::kArrayType);
        entry.PushBack(rj::Value(s.width).Move(), allocator);
        entry.PushBack(rj::Value(s.height).Move(), allocator);
        return entry;
    }
    
    void writeDocument(rj::Document const& doc, std::ostream& outs, char const* what) {
        OStreamWrapper rjStream(outs);
        PrettyWriter<OStreamWrapper> writer(rjStream);
        if(!doc.Accept(writer) || !outs) {
            CLOG(ERROR, MODULE_LOGGER) << "Error writing " << what;
            throw std::runtime_error(string("Error writing ") + what);
        }
    }
}

struct json_writer_node::Pimpl: json_writer_props {
    rj::Document summaryDoc;    ///< The document for sheets summary
    rj::Value sheetsArray;      ///< Summary entries of the written sheets
    rj::Value unplacedArray;    ///< Summary entries of the unplaced items
    int placedCount = 0;        ///< Items placed on all sheets
    
    rj::Document doc;           ///< The document for sheet map
    rj::Value itemsArray;       ///< Sheet items array
    sheet_props currentSheet;   ///< Properties of the active sheet
    
    void reset() {
        resetJsonContent();
        summaryDoc = Document(kObjectType);
        sheetsArray = Value(kArrayType);
        unplacedArray = Value(kArrayType);
        placedCount = 0;
    }
    
    void resetJsonContent() {
        doc = Document(kObjectType);
        itemsArray = Value(kArrayType);
    }
    
    // Writes content of the document to a stream provided by the gen_sheet_stream
    void onNextSheet(rj::SizeType itemCount) {
        if(itemCount > 0) {
            auto outs = this->gen_sheet_stream ? this->gen_sheet_stream(currentSheet.index) : nullptr;
            if(!outs) {
                CLOG(ERROR, MODULE_LOGGER) << "Invalid JSON stream!";
                throw std::runtime_error("Error writing JSON sheet");
            }
            writeDocument(doc, *outs, "JSON sheet");
            
            // Register the sheet in the summary
            auto& allocator = summaryDoc.GetAllocator();
            rj::Value entry(rj::kObjectType);
            entry.AddMember(StringRef(Dict::index), rj::Value(currentSheet.index).Move(), allocator);
            entry.AddMember(StringRef(Dict::sheet_items), rj::Value(itemCount).Move(), allocator);
            entry.AddMember(StringRef(Dict::density), rj::Value(currentSheet.density).Move(), allocator);
            sheetsArray.PushBack(entry, allocator);
        }
        // Prepare the node for a next sheet
        resetJsonContent();
    }
    
    // Writes the summary to a stream provided by the gen_summary_stream
    void writeSummary() {
        auto outs = this->gen_summary_stream ? this->gen_summary_stream() : nullptr;
        if(!outs) {
            CLOG(ERROR, MODULE_LOGGER) << "Invalid summary stream!";
            throw std::runtime_error("Error writing sheets summary");
        }
        
        auto& allocator = summaryDoc.GetAllocator();
        summaryDoc.AddMember(StringRef(Dict::sheet_size), sizeArray(currentSheet.size, allocator).Move(), allocator);
        summaryDoc.AddMember(StringRef(Dict::placed), rj::Value(placedCount).Move(), allocator);
        summaryDoc.AddMember(StringRef(Dict::sheets), sheetsArray, allocator);
        summaryDoc.AddMember(StringRef(Dict::unplaced), unplacedArray, allocator);
        writeDocument(summaryDoc, *outs, "sheets summary");
    }
};

json_writer_node::json_writer_node(json_writer_props const& props)
: _pimpl(new Pimpl)
{
    ((json_writer_props&)*_pimpl) = props;
    _pimpl->reset();
}

json_writer_node::~json_writer_node() {
    ;;
}

bool json_writer_node::add_sheet_item(sheet_item const& item) {
    auto& allocator = _pimpl->doc.GetAllocator();

    // Fill the items array with item's properties
    rj::Value rectEntry(rj::kArrayType);
    rectEntry.PushBack(rj::Value(item.box.x).Move(), allocator);
    rectEntry.PushBack(rj::Value(item.box.y).Move(), allocator);
    rectEntry.PushBack(rj::Value(item.box.width).Move(), allocator);
    rectEntry.PushBack(rj::Value(item.box.height).Move(), allocator);

    rj::Value itemEntry(rj::kObjectType);
    itemEntry.AddMember(StringRef(Dict::region_rect), rectEntry, allocator);
    itemEntry.AddMember(StringRef(Dict::region_rotated), rj::Value(item.rotated).Move(), allocator);
    itemEntry.AddMember(StringRef(Dict::region_name), rj::Value(item.name.c_str(), allocator).Move(),
                        allocator);

    _pimpl->itemsArray.PushBack(itemEntry, allocator);
    ++_pimpl->placedCount;
    
    return safe_fwd().add_sheet_item(item);
}

bool json_writer_node::add_unplaced_item(sheet_item const& item) {
    auto& allocator = _pimpl->summaryDoc.GetAllocator();
    
    rj::Value itemEntry(rj::kObjectType);
    itemEntry.AddMember(StringRef(Dict::item_name), rj::Value(item.name.c_str(), allocator).Move(), allocator);
    itemEntry.AddMember(StringRef(Dict::item_size), sizeArray(item.size, allocator).Move(), allocator);
    _pimpl->unplacedArray.PushBack(itemEntry, allocator);
    
    return safe_fwd().add_unplaced_item(item);
}

bool json_writer_node::begin_sheet(sheet_props const& sheet) {
    auto& allocator = _pimpl->doc.GetAllocator();
    auto& body = _pimpl->doc;
    _pimpl->currentSheet = sheet;
    
    // Fill the document with sheet properties
    body.AddMember(StringRef(Dict::index), rj::Value(sheet.index).Move(), allocator);
    body.AddMember(StringRef(Dict::size), sizeArray(sheet.size, allocator).Move(), allocator);
    body.AddMember(StringRef(Dict::density), rj::Value(sheet.density).Move(), allocator);
    body.AddMember(StringRef(Dict::occupancy), rj::Value(sheet.occupancy).Move(), allocator);

    return safe_fwd().begin_sheet(sheet);
}

bool json_writer_node::end_sheet(bool finalize) {
    auto& allocator = _pimpl->doc.GetAllocator();
    auto& body = _pimpl->doc;

    // Write sheet's content to a stream unless it's empty
    auto itemCount = _pimpl->itemsArray.Size();
    body.AddMember(StringRef(Dict::regions), _pimpl->itemsArray, allocator);
    _pimpl->onNextSheet(itemCount);
    
    if(finalize) {
        // Write the summary on final stage and start over
        _pimpl->writeSummary();
        _pimpl->reset();
    }
    
    return safe_fwd().end_sheet(finalize);
}

void json_writer_node::reset() {
    _pimpl->reset();
    safe_fwd().reset();
}
