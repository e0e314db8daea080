#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "app/shell_app.hpp"

namespace {

void print_usage(std::ostream &out) {
    out << "usage: penkit [--config <file>] [--continue-on-error] [script ...]" << std::endl;
}

} // namespace

int main(int argc, char **argv) {
    penkit::AppOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);

        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "penkit: " << arg << " needs a file argument" << std::endl;
                print_usage(std::cerr);
                return 1;
            }
            options.config_path = argv[++i];
        } else if (arg == "--continue-on-error") {
            options.continue_on_error = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            return 0;
        } else if (arg.starts_with("-")) {
            std::cerr << "penkit: unknown option " << arg << std::endl;
            print_usage(std::cerr);
            return 1;
        } else {
            options.scripts.emplace_back(arg);
        }
    }

    penkit::ShellApp app(std::move(options));
    return app.run();
}
