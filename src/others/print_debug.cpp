#include "print_debug.hpp"
#include <string>

namespace envx {

static std::string escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\f': out += "\\f"; break;
            case '\v': out += "\\v"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& os) {
    os << "[\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        os << "  {\n";
        os << "    \"type\": \"" << token_type_name(tok.type) << "\",\n";
        os << "    \"value\": \"" << escape(tok.value) << "\",\n";
        os << "    \"loc\": \"" << tok.loc.to_string() << "\",\n";
        os << "    \"length\": " << tok.loc.length << "\n";
        os << "  }" << (i + 1 < tokens.size() ? "," : "") << "\n";
    }
    os << "]\n";
}

void print_assignments(const std::vector<Assignment>& assignments, std::ostream& os) {
    for (const auto& a : assignments) {
        os << a.loc.to_string() << " " << a.name;
        if (a.is_unset()) {
            os << " (unset)\n";
            continue;
        }
        os << " =";
        for (const auto& f : a.fragments) {
            os << " [" << escape(f.text) << "]";
            if (f.expandable) os << "$";
        }
        os << "\n";
    }
}

}  // namespace envx
