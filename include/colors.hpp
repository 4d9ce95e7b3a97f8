#pragma once

#include <unistd.h>  // for isatty(), STDERR_FILENO

#include <string>  // for std::string

namespace envx {
namespace Color {
inline bool supports_color(int fd = STDERR_FILENO) {
    return isatty(fd);
}
const std::string reset = "\033[0m";
const std::string bold = "\033[1m";

const std::string red = "\033[31m";
const std::string green = "\033[32m";
const std::string yellow = "\033[33m";
const std::string cyan = "\033[36m";

const std::string bright_black = "\033[90m";  // gray
const std::string bright_red = "\033[91m";

inline std::string paint(const std::string& text, const std::string& color, bool enabled) {
    return enabled ? color + text + reset : text;
}
}  // namespace Color
}  // namespace envx
