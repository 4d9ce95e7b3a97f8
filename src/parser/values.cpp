// src/parser/values.cpp
// Right-hand side of an assignment: unquoted runs, quoted spans, comments.
#include <cstddef>

#include "parser.hpp"

namespace envx {

// After the name: optional blanks, then '=' and the value.
std::vector<Fragment> Parser::parse_assignment(const Token& name_end) {
    while (true) {
        Token tok = consume();
        switch (tok.type) {
            case TokenType::WS:
                break;

            case TokenType::ASSIGN:
                return parse_value();

            case TokenType::EOF_TOKEN:
                throw syntax_error("Expected '=' after variable name", name_end);

            case TokenType::ESCAPE:
            case TokenType::COMMENT:
            case TokenType::DQUOTE:
            case TokenType::NEWLINE:
            case TokenType::SQUOTE:
            case TokenType::TEXT:
                throw syntax_error("Expected '=' after variable name", tok);
        }
    }
}

std::vector<Fragment> Parser::parse_value() {
    std::vector<Fragment> fragments;
    bool ended = false;

    while (!ended) {
        Token tok = consume();
        switch (tok.type) {
            case TokenType::NEWLINE:
            case TokenType::EOF_TOKEN:
                ended = true;
                break;

            case TokenType::COMMENT:
                // a comment needs blank space in front of it: a=b#c keeps "#c"
                if (!fragments.empty() && fragments.back().whitespace) {
                    skip_comment();
                    ended = true;
                } else {
                    fragments.emplace_back(tok.value);
                }
                break;

            case TokenType::WS:
                fragments.emplace_back(tok.value, false, true);
                break;

            case TokenType::ASSIGN:
                // '=' inside a value is plain text
                fragments.emplace_back(tok.value);
                break;

            case TokenType::TEXT:
                fragments.emplace_back(tok.value, true);
                break;

            case TokenType::DQUOTE:
            case TokenType::SQUOTE:
                parse_quoted(tok, fragments);
                break;

            case TokenType::ESCAPE:
                fragments.emplace_back(tok.escaped());
                break;
        }
    }

    trim_whitespace(fragments);
    return fragments;
}

// Everything up to the matching quote of the same kind and length.
// Single quotes keep escapes verbatim and never expand; double quotes
// process escapes and expand everything else.
void Parser::parse_quoted(const Token& quote, std::vector<Fragment>& out) {
    const bool expandable = quote.type == TokenType::DQUOTE;
    bool empty = true;

    while (true) {
        Token tok = consume();
        switch (tok.type) {
            case TokenType::EOF_TOKEN:
                throw syntax_error("Expected a matching end quote", quote);

            case TokenType::DQUOTE:
            case TokenType::SQUOTE:
                if (tok.type == quote.type && tok.value == quote.value) {
                    if (empty) out.emplace_back("");  // explicit empty string
                    return;
                }
                out.emplace_back(tok.value, expandable);
                break;

            case TokenType::ESCAPE:
                if (quote.type == TokenType::SQUOTE) {
                    if (tok.escaped() == quote.value) {
                        // \' ends a '...' string, keeping only the backslash
                        out.emplace_back(tok.value.substr(0, 1));
                        return;
                    }
                    out.emplace_back(tok.value);
                } else {
                    out.emplace_back(tok.escaped());
                }
                break;

            case TokenType::ASSIGN:
            case TokenType::COMMENT:
            case TokenType::NEWLINE:
            case TokenType::WS:
            case TokenType::TEXT:
                out.emplace_back(tok.value, expandable);
                break;
        }
        empty = false;
    }
}

void Parser::trim_whitespace(std::vector<Fragment>& fragments) {
    size_t first = 0;
    while (first < fragments.size() && fragments[first].whitespace) first++;
    size_t last = fragments.size();
    while (last > first && fragments[last - 1].whitespace) last--;

    fragments.erase(fragments.begin() + static_cast<std::ptrdiff_t>(last), fragments.end());
    fragments.erase(fragments.begin(), fragments.begin() + static_cast<std::ptrdiff_t>(first));
}

}  // namespace envx
