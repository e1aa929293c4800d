#include <exception>
#include <iostream>

#include "nhdsync/app.hpp"
#include "nhdsync/util/config_loader.hpp"

int main(int argc, char** argv) {
    try {
        const auto options = nhdsync::util::parse_options(argc, argv);
        return nhdsync::run(options.config_path);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        nhdsync::util::print_usage(argv[0]);
        return 1;
    }
}
