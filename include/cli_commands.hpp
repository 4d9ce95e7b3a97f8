#ifndef CLI_COMMANDS_HPP
#define CLI_COMMANDS_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "EnvError.hpp"
#include "evaluator.hpp"

namespace envx {
namespace cli {

// Settings gathered from the command line
struct Options {
    bool json = false;       // --json
    bool tokens = false;     // --tokens: dump the token stream instead
    bool parse_only = false; // --parse: dump parsed assignments instead
    bool empty_env = false;  // -E: start from an empty environment
    bool show_help = false;
    bool show_version = false;
    EvalOptions eval;

    // STRING or @FILE, processed in order
    std::vector<std::string> inputs;
};

// Command result structure
struct CommandResult {
    int exit_code;
    std::string message;
};

// Text to evaluate plus the name used in diagnostics
struct Source {
    std::string name;
    std::string text;
};

std::string usage();

// Fills `out`; a non-zero exit code means the arguments were rejected.
CommandResult parse_arguments(const std::vector<std::string>& args, Options& out);

// "@path" reads a file ("@-" is stdin), anything else is the text itself.
std::optional<Source> load_source(const std::string& arg, std::string& error);

EnvMap process_environment();

// "value" with C-style escapes for quotes, backslashes and control bytes
std::string quote_value(const std::string& value);

// One line per update: NAME = "value" or unset NAME
std::string format_updates(const EnvUpdates& updates);

// {"NAME": "value", "GONE": null}
std::string updates_to_json(const EnvUpdates& updates, int indent = 2);

void print_syntax_error(const SyntaxError& e, std::ostream& err, bool color);

// Process every input in order against an accumulating environment
CommandResult run(const Options& options, EnvMap env, std::ostream& out, std::ostream& err);

}  // namespace cli
}  // namespace envx

#endif  // CLI_COMMANDS_HPP
