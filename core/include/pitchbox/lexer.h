#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace pitchbox::script {

enum class TokKind {
    Name,
    Int,
    Float,
    String,   // text holds the decoded value
    FString,  // text holds the undecoded body, ival is 1 for rf-strings
    Op,       // operators and delimiters, text holds the spelling
    Newline,
    Indent,
    Dedent,
    End,
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text;
    int64_t ival{0};
    double fval{0.0};
    int line{1};
    int col{1};
};

struct SyntaxError {
    int line{0};
    int col{0};
    std::string message;
};

// Tokenize Python-style source. Indentation becomes Indent/Dedent tokens,
// newlines inside brackets are ignored, comments are dropped.
bool tokenize(const std::string& src, std::vector<Token>* out, SyntaxError* err);

const char* tok_kind_name(TokKind k);

} // namespace pitchbox::script
