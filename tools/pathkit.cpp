#include <pathkit/PathKit.hpp>
#include "cli/PathKitTool.hpp"
#include "log/TaggedLogger.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
#ifdef PK_LOG_DEBUG
    PK::set_thread_name("pathkit");
#endif
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);
    PK::LocalFileSystem fs;
    return PK::CLI::runPathKit(args, std::cout, std::cerr, fs);
}
