#pragma once

#include <algorithm>
#include <string>

#include "SourceManager.hpp"

namespace envx {

// Token types produced by the Lexer. Order mirrors the scan priority.
enum class TokenType {
    ESCAPE,   // backslash + one character (newline included)
    ASSIGN,   // =
    COMMENT,  // # (comment start or literal, decided by the parser)
    DQUOTE,   // """ or "
    NEWLINE,  // \n
    SQUOTE,   // ''' or '
    WS,       // run of space, \t, \r, \f, \v
    TEXT,     // anything else

    EOF_TOKEN  // end of the pull stream, never carries content
};

const char* token_type_name(TokenType t);

// Location / span of a token in the source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<string>")
    int line = 1;          // 1-based
    int col = 0;           // 0-based byte offset from the start of the line
    int length = 0;        // token length in bytes

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    int end_col() const { return col + std::max(0, length); }

    // file:line:col with a 1-based column, the way editors expect it
    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col + 1);
    }
    std::string get_line_trace() const;
};

struct Token {
    TokenType type = TokenType::EOF_TOKEN;
    std::string value;  // raw text matched, escapes included
    TokenLocation loc;

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }

    bool is(TokenType t) const { return type == t; }

    // ESCAPE helpers: the escaped character(s) without the backslash
    std::string escaped() const { return value.size() > 1 ? value.substr(1) : std::string(); }
    bool escapes_newline() const { return type == TokenType::ESCAPE && value == "\\\n"; }

    std::string debug_string() const {
        return loc.to_string() + " " + token_type_name(type) + " [" + value + "]";
    }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col, length);
}

}  // namespace envx
