#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace envx {

// A concrete environment: name -> value
using EnvMap = std::map<std::string, std::string>;

// Value of one update; nullopt means "unset this variable"
using EnvValue = std::optional<std::string>;

// Windows environments are case-insensitive; names are uppercased there.
inline bool default_uppercase_names() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

struct EvalOptions {
    bool uppercase_names = default_uppercase_names();
};

// The name as stored and looked up under options
std::string normalize_name(const std::string& name, const EvalOptions& options);

// Updates produced by one evaluation, in the order names were first
// assigned. Reassigning a name replaces its value in place.
class EnvUpdates {
   public:
    using Entry = std::pair<std::string, EnvValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    void set(const std::string& name, EnvValue value);

    bool contains(const std::string& name) const;

    // nullptr when the name was never assigned
    const EnvValue* find(const std::string& name) const;

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    const_iterator begin() const { return entries.begin(); }
    const_iterator end() const { return entries.end(); }

    // Apply on top of env: set values, erase unset names
    void apply_to(EnvMap& env) const;

   private:
    std::vector<Entry> entries;
    std::unordered_map<std::string, size_t> index;
};

// Resolves assignments against the updates of the current pass, then the
// base environment. The evaluator keeps its own copy of the base.
class Evaluator {
   public:
    explicit Evaluator(EnvMap base, EvalOptions options = EvalOptions());

    EnvUpdates evaluate(const std::vector<Assignment>& assignments);
    EnvUpdates evaluate(const std::string& text, const std::string& filename = "");

    std::string normalize_name(const std::string& name) const;

    // Value visible to $name right now, nullopt if unknown or unset
    std::optional<std::string> lookup(const std::string& name) const;

    std::string expand_value(const Assignment& assignment) const;

    const EvalOptions& options() const { return opts; }

   private:
    EnvMap base;  // keys already normalized
    EvalOptions opts;
    EnvUpdates updates;

    void assign(const Assignment& assignment);
};

// Parse text and return the updates it makes to env. Unset names map to
// nullopt so a caller can delete them from its own environment.
EnvUpdates evaluate(const std::string& text, const EnvMap& env, const EvalOptions& options = EvalOptions());

// env with the updates from text applied; unset names are removed.
EnvMap expand(const std::string& text, const EnvMap& env, const EvalOptions& options = EvalOptions());

}  // namespace envx
