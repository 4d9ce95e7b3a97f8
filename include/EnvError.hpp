#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

namespace envx {

// Raised by the Parser for a malformed line or an unterminated quote.
// Positions follow compiler conventions: 1-based line and column, with
// end_offset one past the last column of the offending token.
class SyntaxError : public std::runtime_error {
   public:
    SyntaxError(const std::string& message, const TokenLocation& loc)
        : std::runtime_error(format_message(message, loc)),
          msg(message),
          file(loc.filename),
          lineno(loc.line),
          col(loc.col + 1),
          end_col(loc.col + 1 + loc.length),
          line_text(loc.src_mgr ? loc.src_mgr->get_line(loc.line) : std::string()),
          trace(loc.get_line_trace()) {}

    const std::string& message() const { return msg; }
    const std::string& filename() const { return file; }
    int line() const { return lineno; }
    int offset() const { return col; }
    int end_offset() const { return end_col; }
    const std::string& text() const { return line_text; }

    // " * 3 | offending line" followed by a caret marker
    const std::string& line_trace() const { return trace; }

   private:
    std::string msg;
    std::string file;
    int lineno;
    int col;
    int end_col;
    std::string line_text;
    std::string trace;

    static std::string format_message(const std::string& message, const TokenLocation& loc) {
        return "SyntaxError at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }
};

}  // namespace envx
