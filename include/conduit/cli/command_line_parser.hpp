#pragma once
#include <string>
#include <vector>

namespace conduit::cli {

struct CommandLineOptions {
    bool show_version = false;
    bool show_help = false;
    bool parse_error = false;
    std::string config_file;
    std::string endpoint = "direct:echo";
    std::vector<std::string> bodies;
    std::string usage;
};

class CommandLineParser {
public:
    static CommandLineOptions parse(int argc, const char* const argv[]);
};

}  // namespace conduit::cli
