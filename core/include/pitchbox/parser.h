#pragma once
#include "ast.h"
#include "lexer.h"

#include <string>

namespace pitchbox::script {

// Parse a pitchbox script into an AST. On failure `err` carries the first
// syntax error with its location.
bool parse_module(const std::string& src, Module* out, SyntaxError* err);

} // namespace pitchbox::script
