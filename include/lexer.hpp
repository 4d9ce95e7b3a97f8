#pragma once

#include <string>
#include <vector>

#include "SourceManager.hpp"
#include "token.hpp"

namespace envx {

// Splits assignment text into ESCAPE/ASSIGN/COMMENT/DQUOTE/NEWLINE/SQUOTE/WS
// tokens, folding everything else into TEXT runs. Never fails.
//
// Tokens are pulled one at a time with next_token(); once the input is
// exhausted it keeps returning EOF_TOKEN. Token locations point at the
// Lexer's own SourceManager, so the Lexer must outlive its tokens' traces.
class Lexer {
   public:
    Lexer(const std::string& source, const std::string& filename = "");

    Lexer(const Lexer&) = delete;
    Lexer& operator=(const Lexer&) = delete;

    Token next_token();

    // Scan the whole input from the start; the last token is EOF_TOKEN.
    std::vector<Token> tokenize();

    const SourceManager& source() const { return src_mgr; }

   private:
    const std::string src;
    const std::string filename;
    SourceManager src_mgr;
    size_t i = 0;
    int line = 1;
    size_t line_start = 0;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    bool starts_with(const char* lit) const;
    bool at_special() const;
    size_t utf8_length(size_t at) const;

    static bool is_blank(char c);

    Token make_token(TokenType type, size_t start, int tok_line, int tok_col);
};

}  // namespace envx
