#include "lintignore/application/ignore_app.hpp"
#include "lintignore/io/cache_store.hpp"
#include "lintignore/io/file_system.hpp"
#include "lintignore/parsers/diagnostic_parser.hpp"
#include "lintignore/parsers/directive_matcher.hpp"

#include <cstdlib>
#include <memory>
#include <optional>
#include <iostream>
#include <string>

namespace {

auto print_usage() -> void {
    std::cout << "Usage: lintignore [options]\n";
    std::cout << "  -i, --input <file>     Read diagnostics from file (default: stdin)\n";
    std::cout << "      --cache-dir <dir>  Directive cache location (default: .lintignore-cache)\n";
    std::cout << "      --no-cache         Neither read nor write the directive cache\n";
    std::cout << "      --show-suppressed  Also list diagnostics that were suppressed\n";
    std::cout << "      --summary          Print a per-analyzer summary table\n";
    std::cout << "      --width <n>        Width of the summary table (default: 60)\n";
    std::cout << "  -h, --help             Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  flake8 src | lintignore                     # Drop findings in ignored regions\n";
    std::cout << "  lintignore -i findings.txt --summary        # File input with summary\n";
    std::cout << "  lintignore --no-cache < findings.txt        # Always rescan sources\n";
}

auto parse_args(int argc, char* argv[]) -> std::optional<lintignore::Config> {
    lintignore::Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            config.input_file = argv[++i];
        } else if (arg == "--cache-dir" && i + 1 < argc) {
            config.cache_dir = argv[++i];
        } else if (arg == "--no-cache") {
            config.use_cache = false;
        } else if (arg == "--show-suppressed") {
            config.show_suppressed = true;
        } else if (arg == "--summary") {
            config.show_summary = true;
        } else if (arg == "--width" && i + 1 < argc) {
            try {
                config.summary_width = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --width expects a number\n";
                return std::nullopt;
            }
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return std::nullopt;
        }
    }

    return config;
}

} // namespace

auto main(int argc, char* argv[]) -> int {
    auto config = parse_args(argc, argv);
    if (!config) {
        print_usage();
        return lintignore::kExitError;
    }

    std::unique_ptr<lintignore::ICacheStore> cache;
    if (config->use_cache) {
        cache = std::make_unique<lintignore::DirectoryCacheStore>(config->cache_dir);
    }

    lintignore::IgnoreApp app(std::make_unique<lintignore::FileSystemAccessor>(), std::move(cache),
                              std::make_unique<lintignore::DiagnosticParser>(),
                              std::make_unique<lintignore::DirectiveMatcher>(), std::cout,
                              std::cerr);
    return app.run(*config);
}
