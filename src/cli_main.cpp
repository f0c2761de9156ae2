#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "docpatch/Commands.hpp"
#include "docpatch/Logging.hpp"

using namespace docpatch;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("docpatch", "Compute, apply and merge JSON patches (RFC 6902 / RFC 7396)");
        options.positional_help("COMMAND LEFT RIGHT");

        options.add_options()
            ("indent", "JSON indentation, --indent=-1 for compact output", cxxopts::value<int>()->default_value("2"))
            ("to", "Output format for patch/merge results: json|toml", cxxopts::value<std::string>()->default_value("json"))
            ("unsafe", "Apply patches without rollback on failure")
            ("v,verbose", "Log debug output to stderr")
            ("h,help", "Show help");

        // Command + its two inputs captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands:\n"
                      << "  diff ORIGINAL CHANGED   print the patch turning ORIGINAL into CHANGED\n"
                      << "  patch DOC PATCH         apply PATCH to DOC\n"
                      << "  merge DOC OVERLAY       merge-patch DOC with OVERLAY\n\n"
                      << "A dash (-) reads a JSON document from stdin. When both inputs are\n"
                      << "dashes, the first document on stdin is read first.\n";
            return result.count("help") ? kExitSuccess : kExitUsageError;
        }

        if (result.count("verbose")) {
            set_log_level(spdlog::level::debug);
        }

        CommandOptions opts;
        opts.indent = result["indent"].as<int>();
        opts.format = parse_output_format(result["to"].as<std::string>());
        opts.unsafe = result.count("unsafe") > 0;

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv.front();
        std::vector<std::string> inputs(cmdv.begin() + 1, cmdv.end());

        return run_command(cmd, inputs, opts, {std::cin, std::cout, std::cerr});

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitUsageError;
    }
}
