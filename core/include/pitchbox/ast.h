#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pitchbox::script {

enum class ExprKind {
    Name,
    Int,
    Float,
    Str,
    FString,         // items: Str and FormattedValue parts
    FormattedValue,  // a: value, text: format spec, op: conversion ('r', 's' or 0)
    Bool,
    NoneLit,
    List,
    Tuple,
    Dict,            // items: keys, values: values
    BinOp,           // a op b
    UnaryOp,         // op a
    BoolOp,          // items joined by "and"/"or"
    Compare,         // a, then cmp_ops[i] against items[i]
    Call,            // a(items..., keywords...)
    Attribute,       // a.text
    Subscript,       // a[b]
    Slice,           // a:b:c, any may be null
    IfExp,           // a if b else c
    ListComp,        // [a for target in b if conds...]
    Lambda,          // lambda params: a
    Starred,         // *a in a call
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct Keyword {
    std::string name;
    ExprPtr value;
    int line{0};
    int col{0};
};

struct Param {
    std::string name;
    ExprPtr default_value;
};

struct Comprehension {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> conds;
};

struct Expr {
    ExprKind kind{ExprKind::NoneLit};
    int line{0};
    int col{0};

    std::string text;   // name, attribute, string value, operator spelling
    int64_t ival{0};
    double fval{0.0};
    bool bval{false};
    char conversion{0};

    ExprPtr a, b, c;
    std::vector<ExprPtr> items;
    std::vector<ExprPtr> values;
    std::vector<std::string> cmp_ops;
    std::vector<Keyword> keywords;
    std::vector<Param> params;
    std::vector<Comprehension> generators;
};

enum class StmtKind {
    Expr,
    Assign,       // targets = value (chained assignment has several targets)
    AugAssign,    // target op= value
    If,
    While,
    For,
    Break,
    Continue,
    Pass,
    FunctionDef,
    Return,
    Import,
    ImportFrom,
    Global,
    Nonlocal,
    Del,
    Assert,
};

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;

struct Alias {
    std::string name;    // dotted module name or imported symbol
    std::string asname;  // empty when no "as"
    int line{0};
    int col{0};
};

struct Stmt {
    StmtKind kind{StmtKind::Pass};
    int line{0};
    int col{0};

    std::string name;     // function name, ImportFrom module, AugAssign operator
    ExprPtr value;        // Expr/Assign/AugAssign/Return value, If/While test, For iter
    ExprPtr target;       // AugAssign/For target, Assert message
    std::vector<ExprPtr> targets;
    std::vector<StmtPtr> body;
    std::vector<StmtPtr> orelse;
    std::vector<Param> params;
    std::vector<Alias> names;
    std::vector<std::string> idents;  // Global/Nonlocal
};

struct Module {
    std::vector<StmtPtr> body;
};

} // namespace pitchbox::script
