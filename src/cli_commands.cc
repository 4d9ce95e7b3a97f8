#include "cli_commands.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "colors.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "print_debug.hpp"

extern char** environ;

using json = nlohmann::json;

namespace envx {
namespace cli {

std::string usage() {
    std::ostringstream ss;
    ss << "Usage: envx [options] [--] [STRING | @FILE]...\n"
       << "Show the results of processing environment assignments.\n"
       << "\n"
       << "Each argument is evaluated in order against the environment built so far.\n"
       << "An argument starting with '@' names a file to read ('@-' reads stdin).\n"
       << "\n"
       << "Options:\n"
       << "  -E, --empty        Start from an empty environment instead of the process one\n"
       << "      --json         Print the updates of each argument as a JSON object\n"
       << "      --tokens       Print the token stream of each argument and stop\n"
       << "      --parse        Print the parsed assignments of each argument and stop\n"
       << "      --uppercase    Treat variable names as case-insensitive (uppercase them)\n"
       << "      --no-uppercase Keep variable names as written\n"
       << "  -v, --version      Print version and exit\n"
       << "  -h, --help         Show this help message\n";
    return ss.str();
}

CommandResult parse_arguments(const std::vector<std::string>& args, Options& out) {
    bool seen_double_dash = false;
    for (const auto& arg : args) {
        if (seen_double_dash || arg.empty() || arg[0] != '-' || arg == "-") {
            out.inputs.push_back(arg);
            continue;
        }

        if (arg == "--") {
            seen_double_dash = true;
        } else if (arg == "-h" || arg == "--help") {
            out.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            out.show_version = true;
        } else if (arg == "-E" || arg == "--empty") {
            out.empty_env = true;
        } else if (arg == "--json") {
            out.json = true;
        } else if (arg == "--tokens") {
            out.tokens = true;
        } else if (arg == "--parse") {
            out.parse_only = true;
        } else if (arg == "--uppercase") {
            out.eval.uppercase_names = true;
        } else if (arg == "--no-uppercase") {
            out.eval.uppercase_names = false;
        } else {
            return {1, "envx: unknown option '" + arg + "'\nTry 'envx --help' for more information."};
        }
    }
    return {0, ""};
}

std::optional<Source> load_source(const std::string& arg, std::string& error) {
    if (arg.empty() || arg[0] != '@') {
        return Source{"<string>", arg};
    }

    std::string path = arg.substr(1);
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return Source{"<stdin>", buffer.str()};
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        error = "Could not open file " + path;
        return std::nullopt;
    }
    buffer << file.rdbuf();
    if (file.bad()) {
        error = "Could not read file " + path;
        return std::nullopt;
    }
    return Source{path, buffer.str()};
}

EnvMap process_environment() {
    EnvMap env;
    if (!environ) return env;
    for (char** entry = environ; *entry; ++entry) {
        std::string kv(*entry);
        size_t eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    return env;
}

std::string quote_value(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\f': out += "\\f"; break;
            case '\v': out += "\\v"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out += "\"";
    return out;
}

std::string format_updates(const EnvUpdates& updates) {
    std::string out;
    for (const auto& entry : updates) {
        if (entry.second) {
            out += entry.first + " = " + quote_value(*entry.second) + "\n";
        } else {
            out += "unset " + entry.first + "\n";
        }
    }
    return out;
}

std::string updates_to_json(const EnvUpdates& updates, int indent) {
    json j = json::object();
    for (const auto& entry : updates) {
        if (entry.second) {
            j[entry.first] = *entry.second;
        } else {
            j[entry.first] = nullptr;
        }
    }
    // invalid UTF-8 in values is replaced, not thrown
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

void print_syntax_error(const SyntaxError& e, std::ostream& err, bool color) {
    err << Color::paint("SyntaxError", Color::bold + Color::bright_red, color)
        << " at " << e.filename() << ":" << e.line() << ":" << e.offset() << "\n"
        << e.message() << "\n"
        << Color::paint(" --> Traced at:", Color::bright_black, color) << "\n"
        << e.line_trace() << "\n";
}

CommandResult run(const Options& options, EnvMap env, std::ostream& out, std::ostream& err) {
    const bool color = Color::supports_color();

    if (options.eval.uppercase_names) {
        EnvMap folded;
        for (const auto& kv : env) folded[normalize_name(kv.first, options.eval)] = kv.second;
        env.swap(folded);
    }

    for (const auto& arg : options.inputs) {
        std::string error;
        std::optional<Source> source = load_source(arg, error);
        if (!source) {
            err << "Error: " << error << std::endl;
            return {1, error};
        }

        if (options.tokens) {
            Lexer lexer(source->text, source->name);
            print_tokens(lexer.tokenize(), out);
            continue;
        }

        try {
            if (options.parse_only) {
                print_assignments(parse(source->text, source->name), out);
                continue;
            }

            Evaluator evaluator(env, options.eval);
            EnvUpdates updates = evaluator.evaluate(source->text, source->name);
            if (options.json) {
                out << updates_to_json(updates) << "\n";
            } else {
                out << format_updates(updates);
            }
            updates.apply_to(env);
        } catch (const SyntaxError& e) {
            print_syntax_error(e, err, color);
            return {1, e.message()};
        }
    }
    return {0, ""};
}

}  // namespace cli
}  // namespace envx
