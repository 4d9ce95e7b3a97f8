#pragma once
#include <string>
#include <vector>

#include "EnvError.hpp"
#include "ast.hpp"
#include "lexer.hpp"
#include "token.hpp"

namespace envx {

// Single-pass parser for assignment text. Pulls tokens from the Lexer on
// demand and never re-scans; next() yields one assignment at a time so a
// caller can stop early. Throws SyntaxError on malformed input.
class Parser {
   public:
    explicit Parser(Lexer& lexer);

    // Fill `out` with the next assignment; false once the input is exhausted.
    bool next(Assignment& out);

    // All remaining assignments in file order
    std::vector<Assignment> parse();

   private:
    Lexer& lexer;
    bool done = false;

    Token consume();

    std::vector<Fragment> parse_assignment(const Token& name_end);
    std::vector<Fragment> parse_value();
    void parse_quoted(const Token& quote, std::vector<Fragment>& out);
    void skip_comment();

    SyntaxError syntax_error(const std::string& msg, const Token& tok);

    static bool is_identifier(const std::string& s);
    static void trim_whitespace(std::vector<Fragment>& fragments);
};

// Convenience: parse a whole string
std::vector<Assignment> parse(const std::string& text, const std::string& filename = "");

}  // namespace envx
