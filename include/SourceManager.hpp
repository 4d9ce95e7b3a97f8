#pragma once
#include <sstream>
#include <string>
#include <vector>

namespace envx {

// Keeps the source text of one parse and answers "what is on line N" for
// diagnostics. Lines are split on '\n' only, the same rule the Lexer uses to
// count them, so a token's line number always indexes the right text.
class SourceManager {
   public:
    std::string filename;
    std::string source;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname), source(src) {
        build_line_index();
    }

    int line_count() const { return static_cast<int>(line_starts.size()); }

    // Text of a 1-based line without its trailing newline
    std::string get_line(int line_num) const {
        if (line_num < 1 || line_num > line_count()) return "";
        size_t start = line_starts[line_num - 1];
        size_t end = source.find('\n', start);
        if (end == std::string::npos) end = source.size();
        return source.substr(start, end - start);
    }

    std::string format_error_context(int line, int col, int length = 1) const {
        std::stringstream ss;
        ss << " * " << line << " | ";
        size_t gutter = ss.str().size();
        ss << get_line(line) << "\n";
        ss << std::string(gutter + static_cast<size_t>(col < 0 ? 0 : col), ' ');
        ss << std::string(static_cast<size_t>(length > 1 ? length : 1), '^');
        return ss.str();
    }

   private:
    std::vector<size_t> line_starts;

    void build_line_index() {
        line_starts.push_back(0);
        for (size_t i = 0; i < source.size(); ++i) {
            if (source[i] == '\n') line_starts.push_back(i + 1);
        }
    }
};

}  // namespace envx
