// src/parser/parser.cpp
#include "parser.hpp"

#include <cctype>

namespace envx {

Parser::Parser(Lexer& lexer) : lexer(lexer) {}

Token Parser::consume() {
    return lexer.next_token();
}

SyntaxError Parser::syntax_error(const std::string& msg, const Token& tok) {
    // no recovery: the stream position is meaningless after an error
    done = true;
    return SyntaxError(msg, tok.loc);
}

bool Parser::is_identifier(const std::string& s) {
    if (s.empty()) return false;
    unsigned char first = static_cast<unsigned char>(s[0]);
    if (!(std::isalpha(first) || first == '_') || first > 0x7F) return false;
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c > 0x7F || !(std::isalnum(c) || c == '_')) return false;
    }
    return true;
}

// Discard a comment up to and including the terminating newline. A newline
// cannot be escaped in a comment, so an escaped newline ends it too.
void Parser::skip_comment() {
    while (true) {
        Token tok = consume();
        if (tok.type == TokenType::NEWLINE || tok.type == TokenType::EOF_TOKEN) return;
        if (tok.escapes_newline()) return;
    }
}

// Top level: blank lines, comments and assignments. Anything else is an error.
bool Parser::next(Assignment& out) {
    while (!done) {
        Token tok = consume();
        switch (tok.type) {
            case TokenType::EOF_TOKEN:
                done = true;
                return false;

            case TokenType::NEWLINE:
            case TokenType::WS:
                break;

            case TokenType::COMMENT:
                skip_comment();
                break;

            case TokenType::TEXT: {
                if (!is_identifier(tok.value)) {
                    throw syntax_error("Expected a variable assignment or comment", tok);
                }
                // position just past the name, reported if the input ends here
                Token name_end(TokenType::TEXT, "",
                    TokenLocation(tok.loc.filename, tok.loc.line, tok.loc.end_col(), 0, tok.loc.src_mgr));

                out.name = tok.value;
                out.loc = tok.loc;
                out.loc.src_mgr = nullptr;  // assignments outlive the lexer
                out.fragments = parse_assignment(name_end);
                return true;
            }

            case TokenType::ESCAPE:
            case TokenType::ASSIGN:
            case TokenType::DQUOTE:
            case TokenType::SQUOTE:
                throw syntax_error("Expected a variable assignment or comment", tok);
        }
    }
    return false;
}

std::vector<Assignment> Parser::parse() {
    std::vector<Assignment> assignments;
    Assignment a;
    while (next(a)) {
        assignments.push_back(std::move(a));
        a = Assignment();
    }
    return assignments;
}

std::vector<Assignment> parse(const std::string& text, const std::string& filename) {
    Lexer lexer(text, filename);
    Parser parser(lexer);
    return parser.parse();
}

}  // namespace envx
