#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "token.hpp"

namespace envx {

// Resolves a substitution name to its value; nullopt (or an empty string)
// expands to nothing.
using NameLookup = std::function<std::optional<std::string>(const std::string&)>;

// A piece of an assignment value.
//  - expandable: $name / ${name} substitution applies (unquoted or "..." text)
//  - whitespace: unquoted blank run, trimmed from both ends of the value
struct Fragment {
    std::string text;
    bool expandable = false;
    bool whitespace = false;

    Fragment() = default;
    explicit Fragment(const std::string& t, bool expandable = false, bool whitespace = false)
        : text(t), expandable(expandable), whitespace(whitespace) {}

    std::string expand(const NameLookup& lookup) const;

    bool operator==(const Fragment& other) const {
        return text == other.text && expandable == other.expandable && whitespace == other.whitespace;
    }
};

// name = fragments; no fragments at all means the variable is unset
struct Assignment {
    std::string name;
    std::vector<Fragment> fragments;
    TokenLocation loc;  // where the name was written

    bool is_unset() const { return fragments.empty(); }

    // Concatenated text with no substitution applied
    std::string raw_value() const {
        std::string out;
        for (const auto& f : fragments) out += f.text;
        return out;
    }
};

}  // namespace envx
