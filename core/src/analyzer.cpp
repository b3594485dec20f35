#include "pitchbox/analyzer.h"
#include "pitchbox/parser.h"

#include <algorithm>

namespace pitchbox {

using namespace script;

namespace {

bool is_dunder(const std::string& s) {
    return s.size() > 4 && s.compare(0, 2, "__") == 0 && s.compare(s.size() - 2, 2, "__") == 0;
}

bool contains_dunder(const std::string& s) {
    static const std::regex re(R"(__[A-Za-z_][A-Za-z0-9_]*__)");
    return std::regex_search(s, re);
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\n' || s[b] == '\r')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\n' || s[e - 1] == '\r')) e--;
    return s.substr(b, e - b);
}

class AstWalker {
public:
    AstWalker(const DenylistPolicy& p, std::vector<Violation>* out) : policy_(p), out_(out) {}

    void walk_module(const Module& m) {
        for (const auto& s : m.body) stmt(*s);
    }

private:
    const DenylistPolicy& policy_;
    std::vector<Violation>* out_;
    int depth_{0};
    bool depth_reported_{false};

    void add(const char* id, int line, int col, std::string msg) {
        Violation v;
        v.pattern_id = id;
        v.location.line = line;
        v.location.column = col;
        v.message = std::move(msg);
        out_->push_back(std::move(v));
    }

    struct Nest {
        AstWalker* w;
        Nest(AstWalker* ww, int line, int col) : w(ww) {
            if (++w->depth_ > w->policy_.max_nesting_depth && !w->depth_reported_) {
                w->depth_reported_ = true;
                w->add("AST.NESTING_TOO_DEEP", line, col,
                       "nesting exceeds " + std::to_string(w->policy_.max_nesting_depth) + " levels");
            }
        }
        ~Nest() { w->depth_--; }
    };

    void check_binding_name(const std::string& name, int line, int col) {
        if (policy_.banned_names.count(name)) {
            add("AST.BANNED_NAME", line, col, "use of banned name '" + name + "'");
        } else if (is_dunder(name)) {
            add("AST.BANNED_NAME", line, col, "use of dunder name '" + name + "'");
        }
    }

    void check_import(const std::string& module, int line, int col) {
        if (!policy_.module_allowed(module)) {
            add("AST.IMPORT_DENIED", line, col, "import of module '" + module + "' is not allowed");
        }
    }

    void params(const std::vector<Param>& ps, int line, int col) {
        for (const auto& p : ps) {
            check_binding_name(p.name, line, col);
            if (p.default_value) expr(*p.default_value);
        }
    }

    void block(const std::vector<StmtPtr>& body) {
        for (const auto& s : body) stmt(*s);
    }

    void stmt(const Stmt& s) {
        switch (s.kind) {
            case StmtKind::Expr:
            case StmtKind::Return:
                if (s.value) expr(*s.value);
                return;
            case StmtKind::Assign:
                for (const auto& t : s.targets) expr(*t);
                expr(*s.value);
                return;
            case StmtKind::AugAssign:
                expr(*s.target);
                expr(*s.value);
                return;
            case StmtKind::Assert:
                expr(*s.value);
                if (s.target) expr(*s.target);
                return;
            case StmtKind::Del:
                for (const auto& t : s.targets) expr(*t);
                return;
            case StmtKind::If:
            case StmtKind::While: {
                expr(*s.value);
                Nest n(this, s.line, s.col);
                block(s.body);
                block(s.orelse);
                return;
            }
            case StmtKind::For: {
                expr(*s.target);
                expr(*s.value);
                Nest n(this, s.line, s.col);
                block(s.body);
                block(s.orelse);
                return;
            }
            case StmtKind::FunctionDef: {
                check_binding_name(s.name, s.line, s.col);
                params(s.params, s.line, s.col);
                Nest n(this, s.line, s.col);
                block(s.body);
                return;
            }
            case StmtKind::Import:
                for (const auto& a : s.names) {
                    check_import(a.name, a.line, a.col);
                    if (!a.asname.empty()) check_binding_name(a.asname, a.line, a.col);
                }
                return;
            case StmtKind::ImportFrom: {
                const bool module_ok = policy_.module_allowed(s.name);
                for (const auto& a : s.names) {
                    const bool ok = module_ok || (a.name != "*" && policy_.module_allowed(s.name + "." + a.name));
                    if (!ok) {
                        std::string what = a.name == "*" ? s.name : s.name + "." + a.name;
                        add("AST.IMPORT_DENIED", a.line, a.col, "import of module '" + what + "' is not allowed");
                    }
                    if (a.name != "*") {
                        check_binding_name(a.name, a.line, a.col);
                        if (is_dunder(a.name) || policy_.restricted_attributes.count(a.name)) {
                            add("AST.RESTRICTED_ATTRIBUTE", a.line, a.col,
                                "import of restricted symbol '" + a.name + "'");
                        }
                    }
                    if (!a.asname.empty()) check_binding_name(a.asname, a.line, a.col);
                }
                return;
            }
            case StmtKind::Global:
            case StmtKind::Nonlocal:
                add("AST.SCOPE_ESCAPE", s.line, s.col,
                    std::string(s.kind == StmtKind::Global ? "global" : "nonlocal") + " declarations are not allowed");
                return;
            case StmtKind::Break:
            case StmtKind::Continue:
            case StmtKind::Pass:
                return;
        }
    }

    void check_string(const std::string& value, int line, int col) {
        const std::string t = trim(value);
        if (policy_.suspicious_strings.count(t)) {
            add("AST.SUSPICIOUS_STRING", line, col, "string constant names '" + t + "'");
        } else if (contains_dunder(value)) {
            add("AST.SUSPICIOUS_STRING", line, col, "string constant contains a dunder name");
        }
    }

    void expr(const Expr& e) {
        Nest n(this, e.line, e.col);
        switch (e.kind) {
            case ExprKind::Name:
                check_binding_name(e.text, e.line, e.col);
                return;
            case ExprKind::Str:
                check_string(e.text, e.line, e.col);
                return;
            case ExprKind::Attribute:
                if (e.text.compare(0, 2, "__") == 0) {
                    add("AST.DUNDER_ATTRIBUTE", e.line, e.col, "access to dunder attribute '" + e.text + "'");
                } else if (policy_.restricted_attributes.count(e.text)) {
                    add("AST.RESTRICTED_ATTRIBUTE", e.line, e.col,
                        "access to restricted attribute '" + e.text + "'");
                }
                break;
            case ExprKind::Lambda:
                params(e.params, e.line, e.col);
                break;
            case ExprKind::ListComp:
                for (const auto& g : e.generators) {
                    expr(*g.target);
                    expr(*g.iter);
                    for (const auto& c : g.conds) expr(*c);
                }
                break;
            case ExprKind::Call:
                for (const auto& kw : e.keywords) {
                    if (is_dunder(kw.name)) add("AST.BANNED_NAME", kw.line, kw.col, "dunder keyword '" + kw.name + "'");
                }
                break;
            default:
                break;
        }
        if (e.a) expr(*e.a);
        if (e.b) expr(*e.b);
        if (e.c) expr(*e.c);
        for (const auto& it : e.items) expr(*it);
        for (const auto& v : e.values) expr(*v);
        for (const auto& kw : e.keywords) expr(*kw.value);
    }
};

struct LineIndex {
    std::vector<size_t> starts;
    explicit LineIndex(const std::string& s) {
        starts.push_back(0);
        for (size_t i = 0; i < s.size(); i++)
            if (s[i] == '\n') starts.push_back(i + 1);
    }
    SourceLocation at(size_t off) const {
        auto it = std::upper_bound(starts.begin(), starts.end(), off);
        size_t idx = (size_t)(it - starts.begin()) - 1;
        SourceLocation loc;
        loc.line = (int)idx + 1;
        loc.column = (int)(off - starts[idx]) + 1;
        return loc;
    }
};

} // namespace

SafetyAnalyzer::SafetyAnalyzer() : SafetyAnalyzer(default_policy()) {}

SafetyAnalyzer::SafetyAnalyzer(DenylistPolicy policy) : policy_(std::move(policy)) {
    for (size_t i = 0; i < policy_.text_patterns.size(); i++) {
        try {
            compiled_.emplace_back(i, std::regex(policy_.text_patterns[i].regex, std::regex::ECMAScript));
        } catch (const std::regex_error& e) {
            init_error_ = "pattern " + policy_.text_patterns[i].id + ": " + e.what();
            compiled_.clear();
            return;
        }
    }
}

SafetyVerdict SafetyAnalyzer::analyze(const std::string& source) const {
    SafetyVerdict v;
    v.policy_version = policy_.version;

    if (!init_error_.empty()) {
        // fail closed: a broken policy rejects everything
        Violation viol;
        viol.pattern_id = "POLICY.INVALID";
        viol.message = init_error_;
        v.violations.push_back(std::move(viol));
        v.allowed = false;
        return v;
    }

    // Layer (a): length cap. Oversized input is not scanned further.
    if (source.size() > policy_.max_source_chars) {
        LineIndex idx(source);
        Violation viol;
        viol.pattern_id = "TXT.SOURCE_TOO_LONG";
        viol.location = idx.at(policy_.max_source_chars);
        viol.message = "source is " + std::to_string(source.size()) + " characters, limit is " +
                       std::to_string(policy_.max_source_chars);
        v.violations.push_back(std::move(viol));
        v.allowed = false;
        return v;
    }

    // Layer (a): text patterns.
    LineIndex idx(source);
    for (const auto& cp : compiled_) {
        const TextPattern& tp = policy_.text_patterns[cp.first];
        auto begin = std::sregex_iterator(source.begin(), source.end(), cp.second);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            Violation viol;
            viol.pattern_id = tp.id;
            viol.location = idx.at((size_t)it->position(0));
            viol.message = tp.message.empty() ? ("matched " + it->str(0)) : tp.message;
            v.violations.push_back(std::move(viol));
        }
    }

    // Layer (b): structural walk.
    Module mod;
    SyntaxError se;
    if (!parse_module(source, &mod, &se)) {
        Violation viol;
        viol.pattern_id = "AST.PARSE_ERROR";
        viol.location.line = se.line;
        viol.location.column = se.col;
        viol.message = se.message;
        v.violations.push_back(std::move(viol));
    } else {
        AstWalker w(policy_, &v.violations);
        w.walk_module(mod);
    }

    std::stable_sort(v.violations.begin(), v.violations.end(), [](const Violation& a, const Violation& b) {
        if (a.location.line != b.location.line) return a.location.line < b.location.line;
        return a.location.column < b.location.column;
    });
    v.allowed = v.violations.empty();
    return v;
}

} // namespace pitchbox
