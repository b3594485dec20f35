#include "pitchbox/lexer.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace pitchbox::script {

const char* tok_kind_name(TokKind k) {
    switch (k) {
        case TokKind::Name: return "name";
        case TokKind::Int: return "integer";
        case TokKind::Float: return "float";
        case TokKind::String: return "string";
        case TokKind::FString: return "f-string";
        case TokKind::Op: return "operator";
        case TokKind::Newline: return "newline";
        case TokKind::Indent: return "indent";
        case TokKind::Dedent: return "dedent";
        case TokKind::End: return "end of input";
    }
    return "?";
}

namespace {

// Longest first so that "**=" wins over "**" and "*".
const char* const kOps[] = {
    "**=", "//=", "...",
    "**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=", "&=", "|=", "->",
    "+", "-", "*", "/", "%", "<", ">", "=", "(", ")", "[", "]", "{", "}",
    ",", ":", ".", ";", "&", "|", "~", "^", "@",
};

class Lexer {
public:
    explicit Lexer(const std::string& s) : src_(s) {}

    bool run(std::vector<Token>* out, SyntaxError* err) {
        out_ = out;
        out_->clear();
        indents_.assign(1, 0);
        if (!lex(err)) return false;
        return true;
    }

private:
    const std::string& src_;
    size_t pos_{0};
    int line_{1};
    int col_{1};
    int depth_{0};  // bracket nesting
    std::vector<int> indents_;
    std::vector<Token>* out_{nullptr};

    char peek(size_t ahead = 0) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    void advance() {
        if (pos_ >= src_.size()) return;
        if (src_[pos_] == '\n') { line_++; col_ = 1; }
        else col_++;
        pos_++;
    }

    bool fail(SyntaxError* err, int line, int col, const std::string& msg) {
        if (err) { err->line = line; err->col = col; err->message = msg; }
        return false;
    }

    void emit(TokKind k, std::string text, int line, int col) {
        Token t;
        t.kind = k;
        t.text = std::move(text);
        t.line = line;
        t.col = col;
        out_->push_back(std::move(t));
    }

    bool last_is_newline() const {
        return out_->empty() || out_->back().kind == TokKind::Newline ||
               out_->back().kind == TokKind::Indent || out_->back().kind == TokKind::Dedent;
    }

    // Measures leading whitespace of a logical line. Returns false on a blank
    // or comment-only line (which never affects indentation).
    bool measure_indent(int* width) {
        int w = 0;
        while (peek() == ' ' || peek() == '\t' || peek() == '\f') {
            if (peek() == '\t') w = (w / 8 + 1) * 8;
            else if (peek() == ' ') w++;
            advance();
        }
        *width = w;
        char c = peek();
        if (c == '\n' || c == '#' || c == '\r' || c == '\0') return false;
        if (c == '\\' && (peek(1) == '\n')) return false;
        return true;
    }

    bool handle_indent(SyntaxError* err) {
        int w = 0;
        if (!measure_indent(&w)) return true;
        if (w > indents_.back()) {
            indents_.push_back(w);
            emit(TokKind::Indent, "", line_, 1);
        } else {
            while (w < indents_.back()) {
                indents_.pop_back();
                emit(TokKind::Dedent, "", line_, 1);
            }
            if (w != indents_.back()) return fail(err, line_, col_, "unindent does not match any outer indentation level");
        }
        return true;
    }

    bool lex(SyntaxError* err) {
        bool at_line_start = true;
        while (pos_ < src_.size()) {
            if (at_line_start && depth_ == 0) {
                if (!handle_indent(err)) return false;
                at_line_start = false;
            }
            char c = peek();
            if (c == '\0') break;
            if (c == '#') {
                while (pos_ < src_.size() && peek() != '\n') advance();
                continue;
            }
            if (c == '\r') { advance(); continue; }
            if (c == '\n') {
                if (depth_ == 0 && !last_is_newline()) emit(TokKind::Newline, "", line_, col_);
                advance();
                at_line_start = true;
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\f') { advance(); continue; }
            if (c == '\\') {
                if (peek(1) == '\n') { advance(); advance(); continue; }
                if (peek(1) == '\r' && peek(2) == '\n') { advance(); advance(); advance(); continue; }
                return fail(err, line_, col_, "unexpected character after line continuation");
            }
            if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                if (!lex_name_or_string(err)) return false;
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
                if (!lex_number(err)) return false;
                continue;
            }
            if (c == '"' || c == '\'') {
                if (!lex_string(std::string(), line_, col_, err)) return false;
                continue;
            }
            if (!lex_op(err)) return false;
        }
        if (depth_ > 0) return fail(err, line_, col_, "unexpected end of input inside brackets");
        if (!last_is_newline()) emit(TokKind::Newline, "", line_, col_);
        while (indents_.size() > 1) {
            indents_.pop_back();
            emit(TokKind::Dedent, "", line_, col_);
        }
        emit(TokKind::End, "", line_, col_);
        return true;
    }

    bool lex_name_or_string(SyntaxError* err) {
        const int line = line_, col = col_;
        std::string word;
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') {
            word.push_back(peek());
            advance();
        }
        if ((peek() == '"' || peek() == '\'') && word.size() <= 2) {
            std::string prefix;
            for (char ch : word) prefix.push_back((char)std::tolower(static_cast<unsigned char>(ch)));
            if (prefix == "r" || prefix == "f" || prefix == "b" || prefix == "u" ||
                prefix == "rf" || prefix == "fr" || prefix == "rb" || prefix == "br") {
                return lex_string(prefix, line, col, err);
            }
        }
        emit(TokKind::Name, word, line, col);
        return true;
    }

    bool lex_number(SyntaxError* err) {
        const int line = line_, col = col_;
        std::string digits;
        bool is_float = false;
        if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'o' || peek(1) == 'O' ||
                              peek(1) == 'b' || peek(1) == 'B')) {
            const char base_ch = (char)std::tolower(static_cast<unsigned char>(peek(1)));
            advance(); advance();
            while (std::isxdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
                if (peek() != '_') digits.push_back(peek());
                advance();
            }
            const int base = base_ch == 'x' ? 16 : (base_ch == 'o' ? 8 : 2);
            errno = 0;
            char* end = nullptr;
            long long v = std::strtoll(digits.c_str(), &end, base);
            if (digits.empty() || errno == ERANGE || (end && *end != '\0'))
                return fail(err, line, col, "invalid integer literal");
            Token t;
            t.kind = TokKind::Int;
            t.ival = v;
            t.text = digits;
            t.line = line; t.col = col;
            out_->push_back(std::move(t));
            return true;
        }
        auto take_digits = [&]() {
            while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
                if (peek() != '_') digits.push_back(peek());
                advance();
            }
        };
        take_digits();
        if (peek() == '.') {
            is_float = true;
            digits.push_back('.');
            advance();
            take_digits();
        }
        if (peek() == 'e' || peek() == 'E') {
            char sign = peek(1);
            if (std::isdigit(static_cast<unsigned char>(sign)) ||
                ((sign == '+' || sign == '-') && std::isdigit(static_cast<unsigned char>(peek(2))))) {
                is_float = true;
                digits.push_back('e');
                advance();
                if (peek() == '+' || peek() == '-') { digits.push_back(peek()); advance(); }
                take_digits();
            }
        }
        if (peek() == 'j' || peek() == 'J') return fail(err, line, col, "complex literals are not supported");
        if (std::isalpha(static_cast<unsigned char>(peek())) || peek() == '_')
            return fail(err, line_, col_, "invalid decimal literal");

        Token t;
        t.line = line; t.col = col;
        t.text = digits;
        if (is_float) {
            t.kind = TokKind::Float;
            t.fval = std::strtod(digits.c_str(), nullptr);
        } else {
            errno = 0;
            long long v = std::strtoll(digits.c_str(), nullptr, 10);
            if (errno == ERANGE) {
                // Too large for int64: degrade to float like a lossy literal.
                t.kind = TokKind::Float;
                t.fval = std::strtod(digits.c_str(), nullptr);
            } else {
                t.kind = TokKind::Int;
                t.ival = v;
            }
        }
        out_->push_back(std::move(t));
        return true;
    }

    static void append_utf8(std::string* out, uint32_t cp) {
        if (cp < 0x80) {
            out->push_back((char)cp);
        } else if (cp < 0x800) {
            out->push_back((char)(0xC0 | (cp >> 6)));
            out->push_back((char)(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out->push_back((char)(0xE0 | (cp >> 12)));
            out->push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back((char)(0x80 | (cp & 0x3F)));
        } else {
            out->push_back((char)(0xF0 | (cp >> 18)));
            out->push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
            out->push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back((char)(0x80 | (cp & 0x3F)));
        }
    }

    bool read_hex(int n, uint32_t* out, SyntaxError* err) {
        uint32_t v = 0;
        for (int i = 0; i < n; i++) {
            char h = peek();
            if (!std::isxdigit(static_cast<unsigned char>(h))) return fail(err, line_, col_, "truncated escape sequence");
            v = v * 16 + (uint32_t)(std::isdigit(static_cast<unsigned char>(h)) ? h - '0' : (std::tolower(h) - 'a' + 10));
            advance();
        }
        *out = v;
        return true;
    }

    bool lex_string(const std::string& prefix, int line, int col, SyntaxError* err) {
        const bool raw = prefix.find('r') != std::string::npos;
        const bool fstr = prefix.find('f') != std::string::npos;
        if (prefix.find('b') != std::string::npos) return fail(err, line, col, "bytes literals are not supported");

        const char q = peek();
        bool triple = peek(1) == q && peek(2) == q;
        advance();
        if (triple) { advance(); advance(); }

        std::string body;
        for (;;) {
            if (pos_ >= src_.size()) return fail(err, line, col, "unterminated string literal");
            char c = peek();
            if (!triple && c == '\n') return fail(err, line, col, "unterminated string literal");
            if (c == q) {
                if (!triple) { advance(); break; }
                if (peek(1) == q && peek(2) == q) { advance(); advance(); advance(); break; }
            }
            if (c == '\\') {
                if (raw || fstr) {
                    // raw and f-string bodies keep escapes; f-strings decode later
                    body.push_back(c);
                    advance();
                    if (pos_ < src_.size()) { body.push_back(peek()); advance(); }
                    continue;
                }
                advance();
                char e = peek();
                advance();
                switch (e) {
                    case 'n': body.push_back('\n'); break;
                    case 't': body.push_back('\t'); break;
                    case 'r': body.push_back('\r'); break;
                    case '0': body.push_back('\0'); break;
                    case 'a': body.push_back('\a'); break;
                    case 'b': body.push_back('\b'); break;
                    case 'f': body.push_back('\f'); break;
                    case 'v': body.push_back('\v'); break;
                    case '\\': body.push_back('\\'); break;
                    case '\'': body.push_back('\''); break;
                    case '"': body.push_back('"'); break;
                    case '\n': break;
                    case 'x': { uint32_t v = 0; if (!read_hex(2, &v, err)) return false; append_utf8(&body, v); break; }
                    case 'u': { uint32_t v = 0; if (!read_hex(4, &v, err)) return false; append_utf8(&body, v); break; }
                    case 'U': { uint32_t v = 0; if (!read_hex(8, &v, err)) return false; append_utf8(&body, v); break; }
                    default: body.push_back('\\'); body.push_back(e); break;
                }
                continue;
            }
            body.push_back(c);
            advance();
        }
        emit(fstr ? TokKind::FString : TokKind::String, std::move(body), line, col);
        if (fstr) out_->back().ival = raw ? 1 : 0;
        return true;
    }

    bool lex_op(SyntaxError* err) {
        for (const char* op : kOps) {
            size_t n = 0;
            while (op[n] && peek(n) == op[n]) n++;
            if (op[n] != '\0') continue;
            const int line = line_, col = col_;
            for (size_t i = 0; i < n; i++) advance();
            std::string s(op);
            if (s == "(" || s == "[" || s == "{") depth_++;
            if (s == ")" || s == "]" || s == "}") {
                if (depth_ == 0) return fail(err, line, col, "unmatched '" + s + "'");
                depth_--;
            }
            emit(TokKind::Op, s, line, col);
            return true;
        }
        return fail(err, line_, col_, std::string("invalid character '") + peek() + "'");
    }
};

} // namespace

bool tokenize(const std::string& src, std::vector<Token>* out, SyntaxError* err) {
    if (!out) return false;
    Lexer lx(src);
    return lx.run(out, err);
}

} // namespace pitchbox::script
