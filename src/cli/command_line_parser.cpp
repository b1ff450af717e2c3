#include "conduit/cli/command_line_parser.hpp"

#include <boost/program_options.hpp>
#include <iostream>
#include <sstream>

namespace po = boost::program_options;

namespace conduit::cli {

CommandLineOptions CommandLineParser::parse(int argc,
                                            const char* const argv[]) {
    CommandLineOptions options;

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Print help information")
        ("version,v", "Print version information")
        ("config,c", po::value<std::string>(), "Configuration file (YAML, JSON or INI)")
        ("endpoint,e", po::value<std::string>()->default_value(options.endpoint),
         "Endpoint the echo consumer listens on")
        ("send,s", po::value<std::vector<std::string>>()->composing(),
         "Body to send to the endpoint; may be repeated")
    ;

    std::ostringstream usage;
    usage << desc;
    options.usage = usage.str();

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        options.show_help = vm.count("help") > 0;
        options.show_version = vm.count("version") > 0;
        if (vm.count("config")) {
            options.config_file = vm["config"].as<std::string>();
        }
        options.endpoint = vm["endpoint"].as<std::string>();
        if (vm.count("send")) {
            options.bodies = vm["send"].as<std::vector<std::string>>();
        }
    } catch (const po::error& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        options.parse_error = true;
        options.show_help = true;
    }

    return options;
}

}  // namespace conduit::cli
