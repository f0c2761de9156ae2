/**
 * @file Commands.hpp
 * @brief Command implementations behind the docpatch tool
 *
 * Each command loads its two inputs, runs the corresponding engine and
 * prints the result. Commands never throw for bad input: they report on
 * the error stream and return an exit code.
 */

#ifndef DOCPATCH_COMMANDS_HPP
#define DOCPATCH_COMMANDS_HPP

#include <iosfwd>
#include <string>
#include <vector>

namespace docpatch {

/**
 * @brief Process exit codes
 */
enum ExitCode : int {
    kExitSuccess = 0,       ///< Command completed
    kExitPatchFailed = 1,   ///< Patch did not apply
    kExitInvalidPatch = 2,  ///< PATCH input is not a patch document
    kExitUsageError = 3     ///< Bad arguments, missing file or unparsable input
};

/// Output format for documents printed by patch and merge
enum class OutputFormat {
    Json,
    Toml
};

/**
 * @brief Options shared by all commands
 */
struct CommandOptions {
    /// Spaces per level for JSON output, negative for compact
    int indent = 2;

    /// Format of patched/merged documents; diff always prints JSON
    OutputFormat format = OutputFormat::Json;

    /// Apply patches without rollback
    bool unsafe = false;
};

/**
 * @brief Streams a command reads from and writes to
 */
struct CommandStreams {
    std::istream& in;   ///< Source for "-" inputs
    std::ostream& out;  ///< Command result
    std::ostream& err;  ///< Diagnostics
};

/**
 * @brief Parse an output format name ("json" or "toml")
 * @throws Error for any other name
 */
OutputFormat parse_output_format(const std::string& name);

/**
 * @brief Print the patch that turns LEFT into RIGHT
 * @return kExitSuccess, or kExitUsageError if an input can't be loaded
 */
int run_diff(const std::string& left, const std::string& right,
             const CommandOptions& options, CommandStreams io);

/**
 * @brief Apply the patch document PATCH to DOC and print the result
 *
 * Example:
 * ```cpp
 * CommandOptions options;
 * int code = run_patch("doc.json", "changes.json", options,
 *                      {std::cin, std::cout, std::cerr});
 * ```
 *
 * @return kExitSuccess, kExitPatchFailed, kExitInvalidPatch or
 *         kExitUsageError
 */
int run_patch(const std::string& doc, const std::string& patch,
              const CommandOptions& options, CommandStreams io);

/**
 * @brief Merge-patch DOC with OVERLAY and print the result
 * @return kExitSuccess or kExitUsageError
 */
int run_merge(const std::string& doc, const std::string& overlay,
              const CommandOptions& options, CommandStreams io);

/**
 * @brief Dispatch a command by name
 *
 * @param command "diff", "patch" or "merge"
 * @param args Exactly two input paths ("-" for standard input)
 * @return Exit code of the command, or kExitUsageError for an unknown
 *         command or a wrong argument count
 */
int run_command(const std::string& command, const std::vector<std::string>& args,
                const CommandOptions& options, CommandStreams io);

} // namespace docpatch

#endif // DOCPATCH_COMMANDS_HPP
