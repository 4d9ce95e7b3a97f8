#include "evaluator.hpp"

#include <cctype>
#include <utility>

#include "lexer.hpp"
#include "parser.hpp"

namespace envx {

namespace {

bool is_name_start(unsigned char c) {
    return c < 0x80 && (std::isalpha(c) || c == '_');
}

bool is_name_char(unsigned char c) {
    return c < 0x80 && (std::isalnum(c) || c == '_');
}

std::string to_upper(const std::string& s) {
    std::string out = s;
    for (auto& ch : out) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return out;
}

}  // namespace

std::string normalize_name(const std::string& name, const EvalOptions& options) {
    return options.uppercase_names ? to_upper(name) : name;
}

// Replaces $name and ${name}. Anything else after a '$', including a "${"
// without its closing brace, is copied through unchanged.
std::string Fragment::expand(const NameLookup& lookup) const {
    if (!expandable || text.find('$') == std::string::npos) return text;

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '$') {
            out.push_back(text[i++]);
            continue;
        }

        size_t start = i + 1;
        const bool braced = start < text.size() && text[start] == '{';
        if (braced) start++;

        size_t end = start;
        if (end < text.size() && is_name_start(static_cast<unsigned char>(text[end]))) {
            end++;
            while (end < text.size() && is_name_char(static_cast<unsigned char>(text[end]))) end++;
        }

        if (end == start || (braced && (end >= text.size() || text[end] != '}'))) {
            out.push_back('$');
            i++;
            continue;
        }

        std::optional<std::string> value = lookup ? lookup(text.substr(start, end - start)) : std::nullopt;
        if (value) out += *value;
        i = braced ? end + 1 : end;
    }
    return out;
}

// ---------------------------------------------------------------------------
// EnvUpdates

void EnvUpdates::set(const std::string& name, EnvValue value) {
    auto it = index.find(name);
    if (it != index.end()) {
        entries[it->second].second = std::move(value);
        return;
    }
    index.emplace(name, entries.size());
    entries.emplace_back(name, std::move(value));
}

bool EnvUpdates::contains(const std::string& name) const {
    return index.count(name) != 0;
}

const EnvValue* EnvUpdates::find(const std::string& name) const {
    auto it = index.find(name);
    if (it == index.end()) return nullptr;
    return &entries[it->second].second;
}

void EnvUpdates::apply_to(EnvMap& env) const {
    for (const auto& entry : entries) {
        if (entry.second) {
            env[entry.first] = *entry.second;
        } else {
            env.erase(entry.first);
        }
    }
}

// ---------------------------------------------------------------------------
// Evaluator

Evaluator::Evaluator(EnvMap base, EvalOptions options) : opts(options) {
    if (opts.uppercase_names) {
        for (auto& kv : base) {
            this->base[to_upper(kv.first)] = std::move(kv.second);
        }
    } else {
        this->base = std::move(base);
    }
}

std::string Evaluator::normalize_name(const std::string& name) const {
    return envx::normalize_name(name, opts);
}

std::optional<std::string> Evaluator::lookup(const std::string& name) const {
    std::string key = normalize_name(name);

    // an unset earlier in this pass hides the base value
    if (const EnvValue* v = updates.find(key)) return *v;

    auto it = base.find(key);
    if (it != base.end()) return it->second;
    return std::nullopt;
}

std::string Evaluator::expand_value(const Assignment& assignment) const {
    NameLookup resolve = [this](const std::string& name) { return lookup(name); };
    std::string value;
    for (const auto& fragment : assignment.fragments) {
        value += fragment.expand(resolve);
    }
    return value;
}

void Evaluator::assign(const Assignment& assignment) {
    std::string name = normalize_name(assignment.name);
    if (assignment.is_unset()) {
        updates.set(name, std::nullopt);
    } else {
        // expand before storing so "A=$A:x" sees the previous A
        std::string value = expand_value(assignment);
        updates.set(name, std::move(value));
    }
}

EnvUpdates Evaluator::evaluate(const std::vector<Assignment>& assignments) {
    updates = EnvUpdates();
    for (const auto& a : assignments) assign(a);
    return updates;
}

EnvUpdates Evaluator::evaluate(const std::string& text, const std::string& filename) {
    updates = EnvUpdates();
    Lexer lexer(text, filename);
    Parser parser(lexer);
    Assignment a;
    while (parser.next(a)) {
        assign(a);
    }
    return updates;
}

EnvUpdates evaluate(const std::string& text, const EnvMap& env, const EvalOptions& options) {
    Evaluator evaluator(env, options);
    return evaluator.evaluate(text);
}

EnvMap expand(const std::string& text, const EnvMap& env, const EvalOptions& options) {
    Evaluator evaluator(env, options);
    EnvUpdates updates = evaluator.evaluate(text);

    EnvMap result;
    if (options.uppercase_names) {
        for (const auto& kv : env) result[normalize_name(kv.first, options)] = kv.second;
    } else {
        result = env;
    }
    updates.apply_to(result);
    return result;
}

}  // namespace envx
