#include "lexer.hpp"

#include <cstring>

namespace envx {

const char* token_type_name(TokenType t) {
    switch (t) {
        case TokenType::ESCAPE:
            return "ESCAPE";
        case TokenType::ASSIGN:
            return "ASSIGN";
        case TokenType::COMMENT:
            return "COMMENT";
        case TokenType::DQUOTE:
            return "DQUOTE";
        case TokenType::NEWLINE:
            return "NEWLINE";
        case TokenType::SQUOTE:
            return "SQUOTE";
        case TokenType::WS:
            return "WS";
        case TokenType::TEXT:
            return "TEXT";
        case TokenType::EOF_TOKEN:
            return "EOF_TOKEN";
    }
    return "TOKEN(?)";
}

Lexer::Lexer(const std::string& source, const std::string& filename)
    : src(source),
      filename(filename.empty() ? "<string>" : filename),
      src_mgr(this->filename, source) {}

bool Lexer::eof() const {
    return i >= src.size();
}

char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}

bool Lexer::starts_with(const char* lit) const {
    size_t n = std::strlen(lit);
    return src.compare(i, n, lit) == 0;
}

bool Lexer::is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

// True when the character at the cursor begins any token other than TEXT.
// A backslash only counts when something follows it to escape.
bool Lexer::at_special() const {
    char c = peek();
    switch (c) {
        case '=':
        case '#':
        case '"':
        case '\'':
        case '\n':
            return true;
        case '\\':
            return i + 1 < src.size();
        default:
            return is_blank(c);
    }
}

// Byte length of the UTF-8 sequence starting at `at`, clamped to the input.
// Malformed lead bytes count as a single byte.
size_t Lexer::utf8_length(size_t at) const {
    unsigned char c = static_cast<unsigned char>(src[at]);
    size_t len = 1;
    if ((c & 0xE0) == 0xC0) {
        len = 2;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4;
    }
    size_t n = 1;
    while (n < len && at + n < src.size() &&
        (static_cast<unsigned char>(src[at + n]) & 0xC0) == 0x80) {
        n++;
    }
    return n;
}

Token Lexer::make_token(TokenType type, size_t start, int tok_line, int tok_col) {
    std::string value = src.substr(start, i - start);
    TokenLocation loc(filename, tok_line, tok_col, static_cast<int>(value.size()), &src_mgr);

    // Newlines inside the token (NEWLINE itself or an escaped newline) move
    // the position for whatever comes next.
    for (size_t k = start; k < i; ++k) {
        if (src[k] == '\n') {
            line++;
            line_start = k + 1;
        }
    }
    return Token{type, value, loc};
}

Token Lexer::next_token() {
    if (eof()) {
        TokenLocation loc(filename, line, static_cast<int>(i - line_start), 0, &src_mgr);
        return Token{TokenType::EOF_TOKEN, "", loc};
    }

    size_t start = i;
    int tok_line = line;
    int tok_col = static_cast<int>(i - line_start);
    char c = peek();

    if (c == '\\' && i + 1 < src.size()) {
        i += 1 + utf8_length(i + 1);
        return make_token(TokenType::ESCAPE, start, tok_line, tok_col);
    }
    if (c == '=') {
        i++;
        return make_token(TokenType::ASSIGN, start, tok_line, tok_col);
    }
    if (c == '#') {
        i++;
        return make_token(TokenType::COMMENT, start, tok_line, tok_col);
    }
    // triple quotes must win over single ones
    if (c == '"') {
        i += starts_with("\"\"\"") ? 3 : 1;
        return make_token(TokenType::DQUOTE, start, tok_line, tok_col);
    }
    if (c == '\n') {
        i++;
        return make_token(TokenType::NEWLINE, start, tok_line, tok_col);
    }
    if (c == '\'') {
        i += starts_with("'''") ? 3 : 1;
        return make_token(TokenType::SQUOTE, start, tok_line, tok_col);
    }
    if (is_blank(c)) {
        while (!eof() && is_blank(peek())) i++;
        return make_token(TokenType::WS, start, tok_line, tok_col);
    }

    // default branch: everything up to the next special character is TEXT
    i++;
    while (!eof() && !at_special()) i++;
    return make_token(TokenType::TEXT, start, tok_line, tok_col);
}

std::vector<Token> Lexer::tokenize() {
    i = 0;
    line = 1;
    line_start = 0;

    std::vector<Token> out;
    while (true) {
        Token tok = next_token();
        bool done = tok.type == TokenType::EOF_TOKEN;
        out.push_back(std::move(tok));
        if (done) break;
    }
    return out;
}

}  // namespace envx
