#include "pitchbox/parser.h"

#include <set>

namespace pitchbox::script {

namespace {

constexpr int kMaxParseDepth = 200;

struct ParseFail {
    SyntaxError err;
};

const std::set<std::string>& keywords() {
    static const std::set<std::string> k = {
        "False", "None", "True", "and", "as", "assert", "async", "await", "break", "class",
        "continue", "def", "del", "elif", "else", "except", "finally", "for", "from", "global",
        "if", "import", "in", "is", "lambda", "nonlocal", "not", "or", "pass", "raise",
        "return", "try", "while", "with", "yield",
    };
    return k;
}

class Parser {
public:
    explicit Parser(std::vector<Token> toks) : toks_(std::move(toks)) {}

    void parse_file(Module* m) {
        while (!at(TokKind::End)) {
            if (at(TokKind::Newline)) { next(); continue; }
            parse_statement(&m->body);
        }
    }

    ExprPtr parse_lone_expression() {
        ExprPtr e = parse_testlist();
        while (at(TokKind::Newline)) next();
        if (!at(TokKind::End)) fail_here("unexpected trailing tokens in expression");
        return e;
    }

private:
    std::vector<Token> toks_;
    size_t i_{0};
    int depth_{0};

    struct DepthGuard {
        Parser* p;
        explicit DepthGuard(Parser* pp) : p(pp) {
            if (++p->depth_ > kMaxParseDepth) p->fail_here("too many nested expressions");
        }
        ~DepthGuard() { p->depth_--; }
    };

    const Token& cur() const { return toks_[i_]; }
    const Token& peek_tok(size_t n = 1) const {
        return toks_[i_ + n < toks_.size() ? i_ + n : toks_.size() - 1];
    }
    bool at(TokKind k) const { return cur().kind == k; }
    bool at_op(const char* op) const { return cur().kind == TokKind::Op && cur().text == op; }
    bool at_kw(const char* kw) const { return cur().kind == TokKind::Name && cur().text == kw; }
    const Token& next() {
        const Token& t = toks_[i_];
        if (i_ + 1 < toks_.size()) i_++;
        return t;
    }

    [[noreturn]] void fail_at(int line, int col, const std::string& msg) {
        ParseFail f;
        f.err.line = line;
        f.err.col = col;
        f.err.message = msg;
        throw f;
    }
    [[noreturn]] void fail_here(const std::string& msg) { fail_at(cur().line, cur().col, msg); }

    std::string describe(const Token& t) const {
        switch (t.kind) {
            case TokKind::Op: return "'" + t.text + "'";
            case TokKind::Name: return "'" + t.text + "'";
            default: return tok_kind_name(t.kind);
        }
    }

    void expect_op(const char* op) {
        if (!at_op(op)) fail_here(std::string("expected '") + op + "', found " + describe(cur()));
        next();
    }
    void expect_kw(const char* kw) {
        if (!at_kw(kw)) fail_here(std::string("expected '") + kw + "', found " + describe(cur()));
        next();
    }
    std::string expect_ident() {
        if (!at(TokKind::Name) || keywords().count(cur().text))
            fail_here("expected identifier, found " + describe(cur()));
        return next().text;
    }
    void expect_newline() {
        if (at(TokKind::End)) return;
        if (!at(TokKind::Newline)) fail_here("expected end of line, found " + describe(cur()));
        next();
    }

    ExprPtr make(ExprKind k, const Token& at_tok) {
        auto e = std::make_unique<Expr>();
        e->kind = k;
        e->line = at_tok.line;
        e->col = at_tok.col;
        return e;
    }
    StmtPtr make_stmt(StmtKind k, const Token& at_tok) {
        auto s = std::make_unique<Stmt>();
        s->kind = k;
        s->line = at_tok.line;
        s->col = at_tok.col;
        return s;
    }

    // ---------------- statements ----------------

    void parse_statement(std::vector<StmtPtr>* out) {
        DepthGuard g(this);
        if (at(TokKind::Indent)) fail_here("unexpected indent");
        if (at(TokKind::Name)) {
            const std::string& w = cur().text;
            if (w == "if") { out->push_back(parse_if()); return; }
            if (w == "while") { out->push_back(parse_while()); return; }
            if (w == "for") { out->push_back(parse_for()); return; }
            if (w == "def") { out->push_back(parse_def()); return; }
            if (w == "class" || w == "try" || w == "with" || w == "async" || w == "raise" ||
                w == "yield" || w == "await" || w == "except" || w == "finally") {
                fail_here("'" + w + "' statements are not supported");
            }
            if (w == "elif" || w == "else") fail_here("'" + w + "' without matching 'if'");
        }
        parse_simple_line(out);
    }

    void parse_simple_line(std::vector<StmtPtr>* out) {
        for (;;) {
            out->push_back(parse_small());
            if (at_op(";")) {
                next();
                if (at(TokKind::Newline) || at(TokKind::End)) break;
                continue;
            }
            break;
        }
        expect_newline();
    }

    StmtPtr parse_small() {
        const Token& t = cur();
        if (t.kind == TokKind::Name) {
            if (t.text == "pass") { next(); return make_stmt(StmtKind::Pass, t); }
            if (t.text == "break") { next(); return make_stmt(StmtKind::Break, t); }
            if (t.text == "continue") { next(); return make_stmt(StmtKind::Continue, t); }
            if (t.text == "return") {
                auto s = make_stmt(StmtKind::Return, t);
                next();
                if (!at(TokKind::Newline) && !at(TokKind::End) && !at_op(";")) s->value = parse_testlist();
                return s;
            }
            if (t.text == "import") return parse_import();
            if (t.text == "from") return parse_from_import();
            if (t.text == "global" || t.text == "nonlocal") {
                auto s = make_stmt(t.text == "global" ? StmtKind::Global : StmtKind::Nonlocal, t);
                next();
                s->idents.push_back(expect_ident());
                while (at_op(",")) { next(); s->idents.push_back(expect_ident()); }
                return s;
            }
            if (t.text == "del") {
                auto s = make_stmt(StmtKind::Del, t);
                next();
                s->targets.push_back(parse_bitor());
                while (at_op(",")) { next(); s->targets.push_back(parse_bitor()); }
                for (auto& tg : s->targets) check_target(*tg, "delete");
                return s;
            }
            if (t.text == "assert") {
                auto s = make_stmt(StmtKind::Assert, t);
                next();
                s->value = parse_test();
                if (at_op(",")) { next(); s->target = parse_test(); }
                return s;
            }
        }
        return parse_expr_stmt();
    }

    static bool is_aug_op(const Token& t) {
        if (t.kind != TokKind::Op) return false;
        static const std::set<std::string> ops = {"+=", "-=", "*=", "/=", "//=", "%=", "**=", "&=", "|="};
        return ops.count(t.text) > 0;
    }

    void check_target(const Expr& e, const char* what) {
        switch (e.kind) {
            case ExprKind::Name:
            case ExprKind::Attribute:
            case ExprKind::Subscript:
                return;
            case ExprKind::Tuple:
            case ExprKind::List:
                for (const auto& it : e.items) check_target(*it, what);
                return;
            default:
                fail_at(e.line, e.col, std::string("cannot ") + what + " to this expression");
        }
    }

    StmtPtr parse_expr_stmt() {
        const Token& start = cur();
        ExprPtr first = parse_testlist();
        if (is_aug_op(cur())) {
            auto s = make_stmt(StmtKind::AugAssign, start);
            std::string op = next().text;
            s->name = op.substr(0, op.size() - 1);
            if (first->kind != ExprKind::Name && first->kind != ExprKind::Attribute &&
                first->kind != ExprKind::Subscript) {
                fail_at(first->line, first->col, "illegal expression for augmented assignment");
            }
            s->target = std::move(first);
            s->value = parse_testlist();
            return s;
        }
        if (at_op("=")) {
            auto s = make_stmt(StmtKind::Assign, start);
            s->targets.push_back(std::move(first));
            while (at_op("=")) {
                next();
                s->targets.push_back(parse_testlist());
            }
            s->value = std::move(s->targets.back());
            s->targets.pop_back();
            for (auto& tg : s->targets) check_target(*tg, "assign");
            return s;
        }
        if (at_op(":")) fail_here("annotated assignments are not supported");
        auto s = make_stmt(StmtKind::Expr, start);
        s->value = std::move(first);
        return s;
    }

    std::string parse_dotted_name() {
        std::string name = expect_ident();
        while (at_op(".")) {
            next();
            name += "." + expect_ident();
        }
        return name;
    }

    StmtPtr parse_import() {
        auto s = make_stmt(StmtKind::Import, cur());
        next();
        for (;;) {
            Alias a;
            a.line = cur().line;
            a.col = cur().col;
            a.name = parse_dotted_name();
            if (at_kw("as")) { next(); a.asname = expect_ident(); }
            s->names.push_back(std::move(a));
            if (!at_op(",")) break;
            next();
        }
        return s;
    }

    StmtPtr parse_from_import() {
        auto s = make_stmt(StmtKind::ImportFrom, cur());
        next();
        if (at_op(".")) fail_here("relative imports are not supported");
        s->name = parse_dotted_name();
        expect_kw("import");
        const bool paren = at_op("(");
        if (paren) next();
        if (at_op("*")) {
            Alias a;
            a.line = cur().line;
            a.col = cur().col;
            a.name = "*";
            next();
            s->names.push_back(std::move(a));
        } else {
            for (;;) {
                Alias a;
                a.line = cur().line;
                a.col = cur().col;
                a.name = expect_ident();
                if (at_kw("as")) { next(); a.asname = expect_ident(); }
                s->names.push_back(std::move(a));
                if (!at_op(",")) break;
                next();
                if (paren && at_op(")")) break;
            }
        }
        if (paren) expect_op(")");
        return s;
    }

    void parse_suite(std::vector<StmtPtr>* body) {
        expect_op(":");
        if (!at(TokKind::Newline)) {
            parse_simple_line(body);
            return;
        }
        next();
        if (!at(TokKind::Indent)) fail_here("expected an indented block");
        next();
        while (!at(TokKind::Dedent) && !at(TokKind::End)) {
            if (at(TokKind::Newline)) { next(); continue; }
            parse_statement(body);
        }
        if (at(TokKind::Dedent)) next();
    }

    StmtPtr parse_if() {
        auto s = make_stmt(StmtKind::If, cur());
        next();
        s->value = parse_namedless_test();
        parse_suite(&s->body);
        if (at_kw("elif")) {
            s->orelse.push_back(parse_if());
        } else if (at_kw("else")) {
            next();
            parse_suite(&s->orelse);
        }
        return s;
    }

    StmtPtr parse_while() {
        auto s = make_stmt(StmtKind::While, cur());
        next();
        s->value = parse_namedless_test();
        parse_suite(&s->body);
        if (at_kw("else")) {
            next();
            parse_suite(&s->orelse);
        }
        return s;
    }

    StmtPtr parse_for() {
        auto s = make_stmt(StmtKind::For, cur());
        next();
        s->target = parse_target_list();
        expect_kw("in");
        s->value = parse_testlist();
        parse_suite(&s->body);
        if (at_kw("else")) {
            next();
            parse_suite(&s->orelse);
        }
        return s;
    }

    StmtPtr parse_def() {
        auto s = make_stmt(StmtKind::FunctionDef, cur());
        next();
        s->name = expect_ident();
        expect_op("(");
        s->params = parse_params(")");
        expect_op(")");
        if (at_op("->")) { next(); (void)parse_test(); }
        parse_suite(&s->body);
        return s;
    }

    std::vector<Param> parse_params(const char* closer) {
        std::vector<Param> params;
        std::set<std::string> seen;
        bool saw_default = false;
        while (!at_op(closer)) {
            if (at_op("*") || at_op("**")) fail_here("variadic parameters are not supported");
            Param p;
            const Token& pt = cur();
            p.name = expect_ident();
            if (!seen.insert(p.name).second) fail_at(pt.line, pt.col, "duplicate parameter '" + p.name + "'");
            if (std::string(closer) == ")" && at_op(":")) { next(); (void)parse_test(); }
            if (at_op("=")) {
                next();
                p.default_value = parse_test();
                saw_default = true;
            } else if (saw_default) {
                fail_at(pt.line, pt.col, "non-default parameter follows default parameter");
            }
            params.push_back(std::move(p));
            if (!at_op(",")) break;
            next();
        }
        return params;
    }

    // ---------------- expressions ----------------

    ExprPtr parse_namedless_test() { return parse_test(); }

    // for-loop / comprehension targets: a comma list of primaries
    ExprPtr parse_target_list() {
        const Token& start = cur();
        ExprPtr first = parse_bitor();
        if (!at_op(",")) {
            check_target(*first, "assign");
            return first;
        }
        auto tup = make(ExprKind::Tuple, start);
        tup->items.push_back(std::move(first));
        while (at_op(",")) {
            next();
            if (at_kw("in")) break;
            tup->items.push_back(parse_bitor());
        }
        check_target(*tup, "assign");
        return tup;
    }

    bool starts_expression() const {
        const Token& t = cur();
        switch (t.kind) {
            case TokKind::Name:
                return !keywords().count(t.text) || t.text == "not" || t.text == "lambda" ||
                       t.text == "None" || t.text == "True" || t.text == "False";
            case TokKind::Int:
            case TokKind::Float:
            case TokKind::String:
            case TokKind::FString:
                return true;
            case TokKind::Op:
                return t.text == "(" || t.text == "[" || t.text == "{" || t.text == "-" ||
                       t.text == "+" || t.text == "~";
            default:
                return false;
        }
    }

    ExprPtr parse_testlist() {
        const Token& start = cur();
        ExprPtr first = parse_test();
        if (!at_op(",")) return first;
        auto tup = make(ExprKind::Tuple, start);
        tup->items.push_back(std::move(first));
        while (at_op(",")) {
            next();
            if (!starts_expression()) break;
            tup->items.push_back(parse_test());
        }
        return tup;
    }

    ExprPtr parse_test() {
        DepthGuard g(this);
        if (at_kw("lambda")) return parse_lambda();
        const Token& start = cur();
        ExprPtr body = parse_or();
        if (at_kw("if")) {
            next();
            auto e = make(ExprKind::IfExp, start);
            e->a = std::move(body);
            e->b = parse_or();
            expect_kw("else");
            e->c = parse_test();
            return e;
        }
        return body;
    }

    ExprPtr parse_lambda() {
        auto e = make(ExprKind::Lambda, cur());
        next();
        e->params = parse_params(":");
        expect_op(":");
        e->a = parse_test();
        return e;
    }

    ExprPtr parse_or() {
        const Token& start = cur();
        ExprPtr left = parse_and();
        if (!at_kw("or")) return left;
        auto e = make(ExprKind::BoolOp, start);
        e->text = "or";
        e->items.push_back(std::move(left));
        while (at_kw("or")) { next(); e->items.push_back(parse_and()); }
        return e;
    }

    ExprPtr parse_and() {
        const Token& start = cur();
        ExprPtr left = parse_not();
        if (!at_kw("and")) return left;
        auto e = make(ExprKind::BoolOp, start);
        e->text = "and";
        e->items.push_back(std::move(left));
        while (at_kw("and")) { next(); e->items.push_back(parse_not()); }
        return e;
    }

    ExprPtr parse_not() {
        if (at_kw("not")) {
            DepthGuard g(this);
            auto e = make(ExprKind::UnaryOp, cur());
            next();
            e->text = "not";
            e->a = parse_not();
            return e;
        }
        return parse_comparison();
    }

    bool take_cmp_op(std::string* op) {
        const Token& t = cur();
        if (t.kind == TokKind::Op &&
            (t.text == "<" || t.text == ">" || t.text == "==" || t.text == "!=" || t.text == "<=" || t.text == ">=")) {
            *op = t.text;
            next();
            return true;
        }
        if (at_kw("in")) { next(); *op = "in"; return true; }
        if (at_kw("not") && peek_tok().kind == TokKind::Name && peek_tok().text == "in") {
            next(); next();
            *op = "not in";
            return true;
        }
        if (at_kw("is")) {
            next();
            if (at_kw("not")) { next(); *op = "is not"; }
            else *op = "is";
            return true;
        }
        return false;
    }

    ExprPtr parse_comparison() {
        const Token& start = cur();
        ExprPtr left = parse_bitor();
        std::string op;
        if (!take_cmp_op(&op)) return left;
        auto e = make(ExprKind::Compare, start);
        e->a = std::move(left);
        do {
            e->cmp_ops.push_back(op);
            e->items.push_back(parse_bitor());
        } while (take_cmp_op(&op));
        return e;
    }

    ExprPtr binop(const Token& at_tok, std::string op, ExprPtr l, ExprPtr r) {
        auto e = make(ExprKind::BinOp, at_tok);
        e->text = std::move(op);
        e->a = std::move(l);
        e->b = std::move(r);
        return e;
    }

    ExprPtr parse_bitor() {
        ExprPtr left = parse_bitxor();
        while (at_op("|")) {
            const Token& t = next();
            left = binop(t, "|", std::move(left), parse_bitxor());
        }
        return left;
    }

    ExprPtr parse_bitxor() {
        ExprPtr left = parse_bitand();
        while (at_op("^")) {
            const Token& t = next();
            left = binop(t, "^", std::move(left), parse_bitand());
        }
        return left;
    }

    ExprPtr parse_bitand() {
        ExprPtr left = parse_arith();
        while (at_op("&")) {
            const Token& t = next();
            left = binop(t, "&", std::move(left), parse_arith());
        }
        return left;
    }

    ExprPtr parse_arith() {
        ExprPtr left = parse_term();
        while (at_op("+") || at_op("-")) {
            const Token& t = next();
            left = binop(t, t.text, std::move(left), parse_term());
        }
        return left;
    }

    ExprPtr parse_term() {
        ExprPtr left = parse_factor();
        while (at_op("*") || at_op("/") || at_op("//") || at_op("%") || at_op("@")) {
            if (at_op("@")) fail_here("matrix multiplication is not supported");
            const Token& t = next();
            left = binop(t, t.text, std::move(left), parse_factor());
        }
        return left;
    }

    ExprPtr parse_factor() {
        if (at_op("-") || at_op("+") || at_op("~")) {
            DepthGuard g(this);
            auto e = make(ExprKind::UnaryOp, cur());
            e->text = next().text;
            e->a = parse_factor();
            return e;
        }
        return parse_power();
    }

    ExprPtr parse_power() {
        ExprPtr base = parse_primary();
        if (at_op("**")) {
            const Token& t = next();
            DepthGuard g(this);
            return binop(t, "**", std::move(base), parse_factor());
        }
        return base;
    }

    ExprPtr parse_primary() {
        ExprPtr e = parse_atom();
        for (;;) {
            if (at_op("(")) {
                DepthGuard g(this);
                auto call = make(ExprKind::Call, cur());
                next();
                call->a = std::move(e);
                parse_call_args(call.get());
                expect_op(")");
                e = std::move(call);
            } else if (at_op("[")) {
                DepthGuard g(this);
                auto sub = make(ExprKind::Subscript, cur());
                next();
                sub->a = std::move(e);
                sub->b = parse_subscript_list();
                expect_op("]");
                e = std::move(sub);
            } else if (at_op(".")) {
                auto attr = make(ExprKind::Attribute, cur());
                next();
                if (!at(TokKind::Name)) fail_here("expected attribute name");
                attr->line = cur().line;
                attr->col = cur().col;
                attr->text = next().text;
                attr->a = std::move(e);
                e = std::move(attr);
            } else {
                return e;
            }
        }
    }

    void parse_call_args(Expr* call) {
        bool saw_keyword = false;
        while (!at_op(")")) {
            if (at_op("**")) fail_here("keyword unpacking is not supported");
            if (at_op("*")) {
                auto st = make(ExprKind::Starred, cur());
                next();
                st->a = parse_test();
                call->items.push_back(std::move(st));
            } else if (at(TokKind::Name) && peek_tok().kind == TokKind::Op && peek_tok().text == "=") {
                Keyword kw;
                kw.line = cur().line;
                kw.col = cur().col;
                kw.name = expect_ident();
                next();
                kw.value = parse_test();
                for (const auto& other : call->keywords)
                    if (other.name == kw.name) fail_at(kw.line, kw.col, "keyword argument repeated: " + kw.name);
                call->keywords.push_back(std::move(kw));
                saw_keyword = true;
            } else {
                if (saw_keyword) fail_here("positional argument follows keyword argument");
                const Token& start = cur();
                ExprPtr arg = parse_test();
                if (at_kw("for")) {
                    // generator argument: sum(x for x in xs)
                    auto comp = make(ExprKind::ListComp, start);
                    comp->a = std::move(arg);
                    parse_comprehension_clauses(comp.get());
                    arg = std::move(comp);
                }
                call->items.push_back(std::move(arg));
            }
            if (!at_op(",")) break;
            next();
        }
    }

    ExprPtr parse_subscript_list() {
        const Token& start = cur();
        ExprPtr first = parse_subscript();
        if (!at_op(",")) return first;
        auto tup = make(ExprKind::Tuple, start);
        tup->items.push_back(std::move(first));
        while (at_op(",")) {
            next();
            if (at_op("]")) break;
            tup->items.push_back(parse_subscript());
        }
        return tup;
    }

    ExprPtr parse_subscript() {
        const Token& start = cur();
        ExprPtr lower;
        if (!at_op(":")) {
            lower = parse_test();
            if (!at_op(":")) return lower;
        }
        auto sl = make(ExprKind::Slice, start);
        sl->a = std::move(lower);
        next();  // ':'
        if (!at_op(":") && !at_op("]") && !at_op(",")) sl->b = parse_test();
        if (at_op(":")) {
            next();
            if (!at_op("]") && !at_op(",")) sl->c = parse_test();
        }
        return sl;
    }

    void parse_comprehension_clauses(Expr* comp) {
        while (at_kw("for")) {
            next();
            Comprehension gen;
            gen.target = parse_target_list();
            expect_kw("in");
            gen.iter = parse_or();
            while (at_kw("if")) {
                next();
                gen.conds.push_back(parse_or());
            }
            comp->generators.push_back(std::move(gen));
        }
    }

    ExprPtr parse_atom() {
        DepthGuard g(this);
        const Token& t = cur();
        switch (t.kind) {
            case TokKind::Int: {
                auto e = make(ExprKind::Int, t);
                e->ival = t.ival;
                next();
                return e;
            }
            case TokKind::Float: {
                auto e = make(ExprKind::Float, t);
                e->fval = t.fval;
                next();
                return e;
            }
            case TokKind::String:
            case TokKind::FString:
                return parse_strings();
            case TokKind::Name: {
                if (t.text == "True" || t.text == "False") {
                    auto e = make(ExprKind::Bool, t);
                    e->bval = t.text == "True";
                    next();
                    return e;
                }
                if (t.text == "None") {
                    next();
                    return make(ExprKind::NoneLit, t);
                }
                if (keywords().count(t.text)) fail_here("invalid syntax near '" + t.text + "'");
                auto e = make(ExprKind::Name, t);
                e->text = t.text;
                next();
                return e;
            }
            case TokKind::Op:
                if (t.text == "(") return parse_paren();
                if (t.text == "[") return parse_list();
                if (t.text == "{") return parse_dict();
                if (t.text == "...") fail_here("Ellipsis is not supported");
                break;
            default:
                break;
        }
        fail_here("invalid syntax near " + describe(t));
    }

    ExprPtr parse_paren() {
        const Token& open = next();
        if (at_op(")")) {
            next();
            return make(ExprKind::Tuple, open);
        }
        ExprPtr first = parse_test();
        if (at_kw("for")) {
            auto comp = make(ExprKind::ListComp, open);
            comp->a = std::move(first);
            parse_comprehension_clauses(comp.get());
            expect_op(")");
            return comp;
        }
        if (at_op(")")) {
            next();
            return first;
        }
        auto tup = make(ExprKind::Tuple, open);
        tup->items.push_back(std::move(first));
        while (at_op(",")) {
            next();
            if (at_op(")")) break;
            tup->items.push_back(parse_test());
        }
        expect_op(")");
        return tup;
    }

    ExprPtr parse_list() {
        const Token& open = next();
        auto lst = make(ExprKind::List, open);
        if (at_op("]")) { next(); return lst; }
        ExprPtr first = parse_test();
        if (at_kw("for")) {
            auto comp = make(ExprKind::ListComp, open);
            comp->a = std::move(first);
            parse_comprehension_clauses(comp.get());
            expect_op("]");
            return comp;
        }
        lst->items.push_back(std::move(first));
        while (at_op(",")) {
            next();
            if (at_op("]")) break;
            lst->items.push_back(parse_test());
        }
        expect_op("]");
        return lst;
    }

    ExprPtr parse_dict() {
        const Token& open = next();
        auto d = make(ExprKind::Dict, open);
        while (!at_op("}")) {
            if (at_op("**")) fail_here("dict unpacking is not supported");
            d->items.push_back(parse_test());
            if (!at_op(":")) fail_here("set literals are not supported");
            next();
            d->values.push_back(parse_test());
            if (!at_op(",")) break;
            next();
        }
        expect_op("}");
        return d;
    }

    // Adjacent literals concatenate; any f-string part makes the whole an f-string.
    ExprPtr parse_strings() {
        const Token& first = cur();
        std::vector<ExprPtr> parts;
        bool any_f = false;
        while (at(TokKind::String) || at(TokKind::FString)) {
            const Token& t = next();
            if (t.kind == TokKind::String) {
                auto s = make(ExprKind::Str, t);
                s->text = t.text;
                parts.push_back(std::move(s));
            } else {
                any_f = true;
                parse_fstring_body(t, &parts);
            }
        }
        if (!any_f) {
            auto s = make(ExprKind::Str, first);
            for (auto& p : parts) s->text += p->text;
            return s;
        }
        auto f = make(ExprKind::FString, first);
        f->items = std::move(parts);
        return f;
    }

    static std::string decode_escapes(const std::string& s) {
        std::string out;
        for (size_t k = 0; k < s.size(); k++) {
            if (s[k] != '\\' || k + 1 >= s.size()) { out.push_back(s[k]); continue; }
            char e = s[++k];
            switch (e) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case '\\': out.push_back('\\'); break;
                case '\'': out.push_back('\''); break;
                case '"': out.push_back('"'); break;
                case '\n': break;
                default: out.push_back('\\'); out.push_back(e); break;
            }
        }
        return out;
    }

    void parse_fstring_body(const Token& t, std::vector<ExprPtr>* parts) {
        const std::string& body = t.text;
        const bool raw = t.ival != 0;
        std::string lit;
        auto flush = [&]() {
            if (lit.empty()) return;
            auto s = make(ExprKind::Str, t);
            s->text = raw ? lit : decode_escapes(lit);
            parts->push_back(std::move(s));
            lit.clear();
        };
        size_t k = 0;
        while (k < body.size()) {
            char c = body[k];
            if (c == '{') {
                if (k + 1 < body.size() && body[k + 1] == '{') { lit.push_back('{'); k += 2; continue; }
                flush();
                // find the matching close brace, honouring nested brackets and quotes
                size_t j = k + 1;
                int nest = 0;
                char quote = 0;
                size_t expr_end = std::string::npos, conv_pos = std::string::npos, spec_pos = std::string::npos;
                for (; j < body.size(); j++) {
                    char d = body[j];
                    if (quote) { if (d == quote) quote = 0; continue; }
                    if (d == '\'' || d == '"') { quote = d; continue; }
                    if (d == '(' || d == '[' || d == '{') { nest++; continue; }
                    if ((d == ')' || d == ']') && nest > 0) { nest--; continue; }
                    if (d == '}' && nest > 0) { nest--; continue; }
                    if (nest == 0 && d == '!' && j + 1 < body.size() && body[j + 1] != '=' &&
                        expr_end == std::string::npos) {
                        expr_end = j;
                        conv_pos = j + 1;
                        continue;
                    }
                    if (nest == 0 && d == ':' && spec_pos == std::string::npos) {
                        if (expr_end == std::string::npos) expr_end = j;
                        spec_pos = j + 1;
                        break;
                    }
                    if (nest == 0 && d == '}') break;
                }
                size_t close = j;
                if (spec_pos != std::string::npos) {
                    close = body.find('}', spec_pos);
                }
                if (close == std::string::npos || close >= body.size())
                    fail_at(t.line, t.col, "f-string: expecting '}'");
                if (expr_end == std::string::npos) expr_end = close;

                std::string expr_src = body.substr(k + 1, expr_end - (k + 1));
                bool blank = true;
                for (char ch : expr_src) if (ch != ' ' && ch != '\t') blank = false;
                if (blank) fail_at(t.line, t.col, "f-string: empty expression not allowed");

                auto fv = make(ExprKind::FormattedValue, t);
                fv->a = parse_embedded(expr_src, t);
                if (conv_pos != std::string::npos) {
                    char conv = body[conv_pos];
                    if (conv != 'r' && conv != 's' && conv != 'a')
                        fail_at(t.line, t.col, "f-string: invalid conversion character");
                    fv->conversion = conv;
                }
                if (spec_pos != std::string::npos) fv->text = body.substr(spec_pos, close - spec_pos);
                parts->push_back(std::move(fv));
                k = close + 1;
                continue;
            }
            if (c == '}') {
                if (k + 1 < body.size() && body[k + 1] == '}') { lit.push_back('}'); k += 2; continue; }
                fail_at(t.line, t.col, "f-string: single '}' is not allowed");
            }
            lit.push_back(c);
            k++;
        }
        flush();
    }

    ExprPtr parse_embedded(const std::string& src, const Token& host) {
        std::vector<Token> toks;
        SyntaxError se;
        if (!tokenize("(" + src + ")", &toks, &se)) fail_at(host.line, host.col, "f-string: " + se.message);
        // re-anchor every token to the host literal so locations stay meaningful
        for (auto& tk : toks) {
            tk.line = host.line;
            tk.col = host.col;
        }
        Parser sub(std::move(toks));
        sub.depth_ = depth_;
        return sub.parse_lone_expression();
    }
};

} // namespace

bool parse_module(const std::string& src, Module* out, SyntaxError* err) {
    if (!out) return false;
    std::vector<Token> toks;
    if (!tokenize(src, &toks, err)) return false;
    try {
        Parser p(std::move(toks));
        Module m;
        p.parse_file(&m);
        *out = std::move(m);
        return true;
    } catch (const ParseFail& f) {
        if (err) *err = f.err;
        return false;
    }
}

} // namespace pitchbox::script
