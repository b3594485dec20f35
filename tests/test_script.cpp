#include "pitchbox/interp.h"
#include "pitchbox/lexer.h"
#include "pitchbox/parser.h"
#include "pitchbox/policy.h"
#include "pitchbox/sandbox_env.h"

#include "test_common.h"

#include <memory>
#include <string>

using namespace pitchbox;

namespace {

struct ScriptRun {
    std::string printed;
    std::string error_type;
    std::string error_msg;
    int error_line{0};
    bool memory_exceeded{false};
};

ScriptRun run(const std::string& src, uint64_t memory_limit = 64ULL << 20, int max_depth = 100) {
    ScriptRun r;
    script::Module m;
    script::SyntaxError se;
    if (!script::parse_module(src, &m, &se)) {
        r.error_type = "SyntaxError";
        r.error_msg = se.message;
        r.error_line = se.line;
        return r;
    }
    script::InterpLimits lim;
    lim.memory_limit_bytes = memory_limit;
    lim.max_call_depth = max_depth;
    script::Interpreter in(lim);

    ScopeRequest req;
    req.capabilities = {Capability::DatasetRead, Capability::Plot, Capability::TextOutput, Capability::Numeric};
    req.allowed_bindings = default_allowed_bindings();
    req.modules = default_policy().module_bindings;
    auto out = std::make_shared<ScopeOutputs>();
    build_sandbox_scope(in, req, out);
    try {
        in.run(m);
    } catch (const script::ResourceLimitError&) {
        r.memory_exceeded = true;
    } catch (const script::ScriptError& e) {
        r.error_type = e.type();
        r.error_msg = e.what();
        r.error_line = e.line();
    }
    r.printed = out->printed;
    return r;
}

void expect_output(const std::string& src, const std::string& want) {
    ScriptRun r = run(src);
    expect_true(r.error_type.empty(), "unexpected " + r.error_type + ": " + r.error_msg + "\n" + src);
    expect_eq_str(r.printed, want, "output of:\n" + src);
}

void test_tokenize() {
    std::vector<script::Token> toks;
    script::SyntaxError err;
    expect_true(script::tokenize("if x:\n    y = 1\n", &toks, &err), "tokenize");
    bool indent = false, dedent = false;
    for (const auto& t : toks) {
        if (t.kind == script::TokKind::Indent) indent = true;
        if (t.kind == script::TokKind::Dedent) dedent = true;
    }
    expect_true(indent && dedent, "indent/dedent tokens");

    expect_true(!script::tokenize("s = 'unterminated\n", &toks, &err), "unterminated string rejected");
    expect_eq_ll(err.line, 1, "error line");
}

void test_syntax_error_location() {
    script::Module m;
    script::SyntaxError se;
    expect_true(!script::parse_module("x = 1\ny = (2 +\n", &m, &se), "unbalanced paren rejected");
    expect_true(se.line >= 2, "syntax error points at line 2 or later");
    expect_true(!se.message.empty(), "syntax error message");
}

void test_arithmetic_and_printing() {
    expect_output("print(1 + 1)\n", "2\n");
    expect_output("print(7 // 2, 7 % 3, 2 ** 10)\n", "3 1 1024\n");
    expect_output("print(1 / 2)\n", "0.5\n");
    expect_output("print(0.1 + 0.2)\n", "0.30000000000000004\n");
    expect_output("print('a', 'b', sep='-', end='!\\n')\n", "a-b!\n");
    expect_output("x = 3\nprint(f'x={x} half={x / 2:.2f}')\n", "x=3 half=1.50\n");
    expect_output("print('%.1f%%' % 42.25)\n", "42.2%\n");
}

void test_control_flow_and_functions() {
    expect_output(
        "def fib(n):\n"
        "    if n < 2:\n"
        "        return n\n"
        "    return fib(n - 1) + fib(n - 2)\n"
        "print(fib(15))\n",
        "610\n");
    expect_output(
        "total = 0\n"
        "for i in range(10):\n"
        "    if i % 2 == 0:\n"
        "        continue\n"
        "    if i > 7:\n"
        "        break\n"
        "    total += i\n"
        "print(total)\n",
        "16\n");
    expect_output(
        "n = 0\n"
        "while n < 5:\n"
        "    n += 1\n"
        "print(n)\n",
        "5\n");
}

void test_containers() {
    expect_output("xs = [3, 1, 2]\nxs.sort()\nprint(xs, len(xs))\n", "[1, 2, 3] 3\n");
    expect_output("print([x * x for x in range(5) if x % 2 == 0])\n", "[0, 4, 16]\n");
    expect_output("d = {'a': 1}\nd['b'] = 2\nprint(sorted(d.keys()), d.get('c', 0))\n", "['a', 'b'] 0\n");
    expect_output("print(sorted(['bb', 'a', 'ccc'], key=len, reverse=True))\n", "['ccc', 'bb', 'a']\n");
    expect_output("a, b = (1, 2)\nprint(b, a)\n", "2 1\n");
    expect_output("print(', '.join(['x', 'y']).upper())\n", "X, Y\n");
}

void test_del_statement() {
    expect_output("xs = [1, 2, 3]\ndel xs[0]\nprint(xs)\n", "[2, 3]\n");
    expect_output("d = {'a': 1, 'b': 2}\ndel d['a'], d['b']\nprint(len(d))\n", "0\n");
    expect_output("a, b = 1, 2\ndel a, b\nprint('gone')\n", "gone\n");

    ScriptRun r = run("x = 1\ndel x\nprint(x)\n");
    expect_true(r.error_type == "NameError" && r.error_line == 3, "deleted name is unbound: " + r.error_type);
    r = run("del (1 + 2)\n");
    expect_true(r.error_type == "SyntaxError", "expression is not a delete target: " + r.error_type);
}

void test_imports_resolve_to_bindings() {
    expect_output("import math\nprint(math.floor(2.7))\n", "2\n");
    expect_output("import numpy as np\nprint(np.mean([1, 2, 3]))\n", "2.0\n");

    ScriptRun r = run("import os\n");
    expect_true(!r.error_type.empty(), "import of a module without a binding fails");
}

void test_script_errors() {
    ScriptRun r = run("x = 1\ny = x / 0\n");
    expect_true(r.error_type == "ZeroDivisionError", "zero division type: " + r.error_type);
    expect_eq_ll(r.error_line, 2, "zero division line");

    r = run("print(undefined_name)\n");
    expect_true(r.error_type == "NameError", "name error");

    r = run("xs = [1]\nprint(xs[5])\n");
    expect_true(r.error_type == "IndexError", "index error: " + r.error_type);

    r = run("d = {}\nd['missing']\n");
    expect_true(r.error_type == "KeyError", "key error: " + r.error_type);

    r = run("int('nope')\n");
    expect_true(r.error_type == "ValueError", "value error: " + r.error_type);
}

void test_recursion_limit() {
    ScriptRun r = run("def f(n):\n    return f(n + 1)\nf(0)\n", 64ULL << 20, 50);
    expect_true(r.error_type == "RecursionError", "recursion error: " + r.error_type);
}

void test_memory_budget() {
    // 8 MB budget; the list doubles until the budget refuses it
    ScriptRun r = run("xs = [0]\nwhile True:\n    xs = xs + xs\n", 8ULL << 20);
    expect_true(r.memory_exceeded, "memory budget enforced");

    r = run("s = 'x' * 100\nprint(len(s))\n", 8ULL << 20);
    expect_true(!r.memory_exceeded && r.printed == "100\n", "small allocations fit");

    // strings kept alive count against the budget, not just the one being built
    r = run("keep = []\ns = 'a' * 100000\nfor i in range(200):\n    keep.append(s + str(i))\n", 8ULL << 20);
    expect_true(r.memory_exceeded, "retained strings exhaust the budget");

    r = run("import numpy as np\narrs = []\nfor i in range(100):\n    arrs.append(np.arange(10000))\n", 8ULL << 20);
    expect_true(r.memory_exceeded, "retained arrays exhaust the budget");

    r = run("import pandas as pd\nframes = []\nfor i in range(100):\n"
            "    frames.append(pd.DataFrame({'x': list(range(2000)), 'y': list(range(2000))}))\n",
            8ULL << 20);
    expect_true(r.memory_exceeded, "retained frames exhaust the budget");

    // storage dropped by the script is given back
    r = run("for i in range(100):\n    s = 'a' * 1000000\nprint(len(s))\n", 8ULL << 20);
    expect_true(!r.memory_exceeded && r.printed == "1000000\n", "released strings free the budget");
}

void test_print_cap() {
    script::Module m;
    script::SyntaxError se;
    expect_true(script::parse_module("for i in range(1000):\n    print('0123456789')\n", &m, &se), "parse");
    script::Interpreter in;
    ScopeRequest req;
    req.capabilities = {Capability::TextOutput};
    req.allowed_bindings = default_allowed_bindings();
    req.max_print_bytes = 100;
    auto out = std::make_shared<ScopeOutputs>();
    build_sandbox_scope(in, req, out);
    in.run(m);
    expect_eq_ll((long long)out->printed.size(), 100, "printed text capped");
    expect_true(out->printed_truncated, "truncation flagged");
}

} // namespace

int main() {
    test_tokenize();
    test_syntax_error_location();
    test_arithmetic_and_printing();
    test_control_flow_and_functions();
    test_containers();
    test_del_statement();
    test_imports_resolve_to_bindings();
    test_script_errors();
    test_recursion_limit();
    test_memory_budget();
    test_print_cap();
    std::cerr << "test_script: ALL PASSED\n";
    return 0;
}
