#pragma once
#include <iostream>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace envx {

void print_tokens(const std::vector<Token>& tokens, std::ostream& os = std::cout);

void print_assignments(const std::vector<Assignment>& assignments, std::ostream& os = std::cout);

}  // namespace envx
