/**
 * @file Commands.cpp
 * @brief Command implementations
 */

#include "docpatch/Commands.hpp"
#include "docpatch/Diff.hpp"
#include "docpatch/Errors.hpp"
#include "docpatch/Loader.hpp"
#include "docpatch/Logging.hpp"
#include "docpatch/Merge.hpp"
#include "docpatch/Patch.hpp"

#include <iostream>
#include <utility>

namespace docpatch {

namespace {

/**
 * @brief Load both inputs of a command
 *
 * When both are "-", two values are read from the input stream in order.
 */
std::pair<Value, Value> load_inputs(const std::string& first, const std::string& second,
                                    std::istream& in) {
    if (first == kStdinPath && second == kStdinPath) {
        auto docs = read_documents(in, 2);
        return {std::move(docs[0]), std::move(docs[1])};
    }

    auto load = [&in](const std::string& path) {
        if (path == kStdinPath) {
            return std::move(read_documents(in, 1).front());
        }
        return load_document(path);
    };
    Value a = load(first);
    Value b = load(second);
    return {std::move(a), std::move(b)};
}

void print_document(const Value& doc, const CommandOptions& options, std::ostream& out) {
    if (options.format == OutputFormat::Toml) {
        out << to_toml_string(doc);
    } else {
        out << to_json_string(doc, options.indent) << "\n";
    }
}

} // anonymous namespace

OutputFormat parse_output_format(const std::string& name) {
    if (name == "json") return OutputFormat::Json;
    if (name == "toml") return OutputFormat::Toml;
    throw Error("Unknown output format: " + name + " (expected json or toml)");
}

int run_diff(const std::string& left, const std::string& right,
             const CommandOptions& options, CommandStreams io) {
    try {
        auto [before, after] = load_inputs(left, right, io.in);
        io.out << to_string(diff(before, after), options.indent) << "\n";
        return kExitSuccess;
    } catch (const Error& e) {
        io.err << "Error: " << e.what() << "\n";
        return kExitUsageError;
    }
}

int run_patch(const std::string& doc, const std::string& patch,
              const CommandOptions& options, CommandStreams io) {
    Value target;
    Patch ops;
    try {
        auto [document, patch_doc] = load_inputs(doc, patch, io.in);
        target = std::move(document);
        ops = patch_from_json(patch_doc);
    } catch (const PatchFormatError& e) {
        io.err << "Error: second argument is not a valid patch: " << e.what() << "\n";
        return kExitInvalidPatch;
    } catch (const Error& e) {
        io.err << "Error: " << e.what() << "\n";
        return kExitUsageError;
    }

    logger()->debug("applying {} operations ({})", ops.size(),
                    options.unsafe ? "unsafe" : "atomic");

    try {
        if (options.unsafe) {
            apply_unsafe(target, ops);
        } else {
            docpatch::apply(target, ops);
        }
    } catch (const PatchError& e) {
        io.err << "Patch did not apply: " << e.what() << "\n";
        return kExitPatchFailed;
    }

    try {
        print_document(target, options, io.out);
    } catch (const Error& e) {
        io.err << "Error: " << e.what() << "\n";
        return kExitUsageError;
    }
    return kExitSuccess;
}

int run_merge(const std::string& doc, const std::string& overlay,
              const CommandOptions& options, CommandStreams io) {
    try {
        auto [target, patch_doc] = load_inputs(doc, overlay, io.in);
        merge(target, patch_doc);
        print_document(target, options, io.out);
        return kExitSuccess;
    } catch (const Error& e) {
        io.err << "Error: " << e.what() << "\n";
        return kExitUsageError;
    }
}

int run_command(const std::string& command, const std::vector<std::string>& args,
                const CommandOptions& options, CommandStreams io) {
    using Runner = int (*)(const std::string&, const std::string&,
                           const CommandOptions&, CommandStreams);
    Runner runner = nullptr;
    if (command == "diff") {
        runner = run_diff;
    } else if (command == "patch") {
        runner = run_patch;
    } else if (command == "merge") {
        runner = run_merge;
    } else {
        io.err << "Unknown command: " << command << "\n";
        return kExitUsageError;
    }

    if (args.size() != 2) {
        io.err << "Error: '" << command << "' expects exactly two inputs, got "
               << args.size() << "\n";
        return kExitUsageError;
    }
    return runner(args[0], args[1], options, io);
}

} // namespace docpatch
