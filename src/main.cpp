#include "pepcheck/application/pepcheck_app.hpp"
#include "pepcheck/application/stream_reporter.hpp"
#include "pepcheck/io/file_system.hpp"
#include "pepcheck/ui/ftxui_reporter.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <unistd.h>

auto main(int argc, char* argv[]) -> int {
    using namespace pepcheck;

    Config config;
    try {
        config = parse_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage();
        return 2;
    }

    if (config.show_help) {
        std::cout << usage();
        return 0;
    }
    if (config.show_version) {
        std::cout << "pepcheck " << VERSION << '\n';
        return 0;
    }

    // Colors only when a person is watching
    std::unique_ptr<IReporter> reporter;
    if (isatty(STDOUT_FILENO) != 0) {
        reporter = std::make_unique<FtxuiReporter>(std::cout);
    } else {
        reporter = std::make_unique<StreamReporter>(std::cout, std::cerr);
    }

    PepcheckApp app(std::make_unique<FileSystem>(), std::move(reporter));
    return app.run(config);
}
