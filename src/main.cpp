#include "termcoord/application/demo_app.hpp"
#include "termcoord/io/posix_terminal.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

auto main(int argc, char* argv[]) -> int {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto options = termcoord::parse_args(args);

    if (options.show_help) {
        std::cout << termcoord::usage();
        return 0;
    }
    if (!options.error.empty()) {
        std::cerr << "termcoord-demo: " << options.error << "\n\n" << termcoord::usage();
        return 2;
    }

    termcoord::DemoApp app(std::make_unique<termcoord::PosixTerminal>());
    return app.run(options);
}
