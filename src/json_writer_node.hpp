#pragma once

#include "chain_node.hpp"

/// Json writer properties
struct json_writer_props {
    using ostream_ptr = std::shared_ptr<std::ostream>;
    using ostream_generator = std::function<ostream_ptr()>;
    using sheet_ostream_generator = std::function<ostream_ptr(int)>;

    sheet_ostream_generator gen_sheet_stream;   ///< Stream factory for storing a sheet by its index
    ostream_generator gen_summary_stream;       ///< Stream factory for storing the sheets summary
};

/// The node dumps sheet mapping to Json format
class json_writer_node: public chain_node {
public:
    struct init_props: json_writer_props {
        using props = init_props;
        
        /// Sets stream factory for storing sheet content
        props& set_sheet_stream_generator(sheet_ostream_generator arg) {gen_sheet_stream=std::move(arg); return *this;}
        /// Sets stream factory for storing the sheets summary
        props& set_summary_generator(ostream_generator arg) {gen_summary_stream=std::move(arg); return *this;}
    };
    
    explicit json_writer_node(json_writer_props const& props);
    virtual ~json_writer_node();

    bool begin_sheet(sheet_props const& sheet) override;
    bool add_sheet_item(sheet_item const& item) override;
    bool add_unplaced_item(sheet_item const& item) override;
    bool end_sheet(bool finalize) override;
    void reset() override;
    
private:
    struct Pimpl;
    std::unique_ptr<Pimpl> _pimpl;
};
