#include "forwards.hpp"
#include "helpers.hpp"
#include "json_writer_node.hpp"
#include "json_items_parser.hpp"
#include "sheet_mapper_node.hpp"
#include "rbp_oracle.hpp"
#include "rbp_wrappers.hpp"
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <iostream>
#include <fstream>
#include <map>
#include <easylogging++.h>

using namespace std;

namespace fs = boost::filesystem;
namespace po = boost::program_options;

INITIALIZE_EASYLOGGINGPP

namespace {

    const std::string defaultSummaryFilename = "sheets_map.json";

    // Creates the placement oracle on top of the selected rbp packer
    sheetpack::placement_oracle_ptr createOracle(po::variables_map const& vars) {
        packer_kind kind = packer_kind::max_rects;
        if(!packer_kind_from_name(vars["packer"].as<string>(), kind)) {
            LOG(ERROR) << "Invalid packer was selected!";
            return nullptr;
        }
        
        auto binFactory = [kind](int sheetWidth, int sheetHeight) {
            return create_bin_packer(kind, sheetWidth, sheetHeight);
        };
        return make_shared<rbp_oracle>(rbp_oracle::init_props()
                                       .set_bin_factory(binFactory));
    }
    
    bool extractSearchMode(po::variables_map const& vars, sheet_mapper_props::search_mode& mode) {
        const string searchMode(vars["mode"].as<string>());

        static const map<string, sheet_mapper_props::search_mode> searchModes = {
            {"multi", sheet_mapper_props::multi_sheet},
            {"max-usage", sheet_mapper_props::max_usage},
            {"optimal", sheet_mapper_props::optimal_packing},
        };
        
        auto pos = searchModes.find(searchMode);
        if(pos == searchModes.end()) {
            return false;
        }
        
        mode = pos->second;
        
        return true;
    }
    
    // Creates default sheet mapper
    chain_node_ptr createSheetMapper(po::variables_map const& vars) {
        std::string const outDir(vars["dst"].as<string>());
        
        auto searchMode = sheet_mapper_props::multi_sheet;
        if(!extractSearchMode(vars, searchMode)) {
            LOG(ERROR) << "Invalid search mode was selected!";
            return nullptr;
        }
        
        const double threshold = vars["threshold"].as<double>();
        if(threshold <= 0.0 || threshold > 1.0) {
            LOG(ERROR) << "The threshold must be in (0,1]";
            return nullptr;
        }
        
        auto oracle = createOracle(vars);
        if(!oracle)
            return nullptr;
        
        // Sheet mapper packs input items into the bunch of sheets
        chain_node_ptr chain = make_shared<sheet_mapper_node>(sheet_mapper_node::init_props()
                                                              .set_mode(searchMode)
                                                              .set_oracle(oracle)
                                                              .set_threshold(threshold)
                                                              .enable_exhaustive(vars["exhaustive"].as<bool>())
                                                              .set_max_sheets(vars["max-sheets"].as<size_t>()));
        
        // The next node is in charge of writing results to JSON files
        json_writer_props::sheet_ostream_generator sheetStreamGen = [outDir](int index) {
            string sheetName = "sheet" + to_string(index) + ".json";
            auto file = fs::path(outDir) / sheetName;
            return make_shared<ofstream>(file.generic_string(), ios_base::binary);
        };
        json_writer_props::ostream_generator summaryStreamGen = [outDir]() {
            auto file = fs::path(outDir) / defaultSummaryFilename;
            return make_shared<ofstream>(file.generic_string(), ios_base::binary);
        };
        
        auto jsonWriter = make_shared<json_writer_node>(json_writer_node::init_props()
                                                         .set_sheet_stream_generator(sheetStreamGen)
                                                         .set_summary_generator(summaryStreamGen));
        chain->set_child(jsonWriter);

        // Return builded chain
        return chain;
    }
    
    // Sheet size given on the command line
    bool extractSheetSize(po::variables_map const& vars, boost::optional<sheetpack::size>& sheetSize) {
        const bool hasWidth = vars.count("width") > 0;
        const bool hasHeight = vars.count("height") > 0;
        if(!hasWidth && !hasHeight)
            return true;
        
        if(hasWidth != hasHeight) {
            LOG(ERROR) << "Both sheet width and height are required";
            return false;
        }
        
        sheetSize = sheetpack::size(vars["width"].as<int>(), vars["height"].as<int>());
        return true;
    }

    // Setup logging
    void initLogging(po::variables_map const& vars) {
        el::Loggers::addFlag(el::LoggingFlag::CreateLoggerAutomatically);
        
        el::Configurations conf;
        conf.setToDefault();
        if(!vars["verbose"].as<bool>()) {
            // Disable detailed logging by default
            conf.set(el::Level::Info, el::ConfigurationType::Enabled, "false");
            conf.set(el::Level::Warning, el::ConfigurationType::Enabled, "false");
            conf.set(el::Level::Verbose, el::ConfigurationType::Enabled, "false");
            conf.set(el::Level::Debug, el::ConfigurationType::Enabled, "false");
            conf.set(el::Level::Trace, el::ConfigurationType::Enabled, "false");
        }
        el::Loggers::setDefaultConfigurations(conf, true);
    }

} // anonymous


int main(int argc, const char * argv[]) {
    po::options_description desc("Sheet mapper options");
    desc.add_options()
        ("help", "Help message")
        ("verbose,v", po::bool_switch()->default_value(false), "Verbose mode")
        ("width,w", po::value<int>(), "Sheet width, overrides the items file")
        ("height,h", po::value<int>(), "Sheet height, overrides the items file")
        ("packer", po::value<string>()->default_value("maxrects"), "Placement algorithm [maxrects, skyline, guillotine]. "
                                                              "skyline and guillotine may turn items on their own, such layouts are skipped")
        ("mode", po::value<string>()->default_value("multi"), "Search mode [multi, max-usage, optimal]")
        ("threshold,t", po::value<double>()->default_value(0.9), "Minimal sheet coverage in max-usage mode")
        ("exhaustive", po::bool_switch()->default_value(false), "Keep the densest of equal-area subsets")
        ("max-sheets", po::value<size_t>()->default_value(0), "Available sheets, 0 is unlimited")
        ("src", po::value<string>()->required(), "Items file")
        ("dst", po::value<string>()->required(), "Output directory")
    ;
    
    po::positional_options_description pos;
    pos.add("src", 1).add("dst", 1);
    
    // Parse command line arguments
    po::variables_map vars;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vars);
        po::notify(vars);
    } catch( po::error const& e) {
        cout << e.what() << endl;
        cout << desc << endl;
        return 1;
    }
    
    // Check for the help argument
    if(vars.count("help") > 0) {
        cout << desc;
        return 1;
    }

    initLogging(vars);
    
    boost::optional<sheetpack::size> sheetSize;
    if(!extractSheetSize(vars, sheetSize))
        return 1;
    
    fs::path const srcFile(vars["src"].as<string>());
    fs::path const dstDir(vars["dst"].as<string>());
    
    boost::system::error_code ec;
    fs::create_directories(dstDir, ec);
    if(ec) {
        LOG(ERROR) << "Can't create the output directory " << dstDir << ": " << ec.message();
        return 1;
    }
    
    // create and set up the Sheet Mapper
    auto sheetMapper = createSheetMapper(vars);
    if(!sheetMapper) {
        LOG(ERROR) << "Error during creating the sheet mapper";
        return 1;
    }
    
    ifstream itemsStream(srcFile.c_str(), std::ios_base::in | std::ios_base::binary);
    if(!itemsStream) {
        LOG(ERROR) << "Can't open the items file " << srcFile;
        return 1;
    }
    
    // data processing...
    LOG(INFO) << "Perform mapping items onto sheets";
    sheetMapper->reset();
    try {
        bool res = parse_json_items(itemsStream,
                                    json_parser_props()
                                    .set_sheet_builder(sheetMapper)
                                    .set_sheet_size(sheetSize));
        if(!res) {
            LOG(ERROR) << "An error during mapping items of " << srcFile;
            return 1;
        }
    } catch(std::exception const& e) {
        LOG(ERROR) << e.what();
        return 1;
    }
    
    return 0;
}
