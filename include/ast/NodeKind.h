/***
 * Name: pyscope::ast::NodeKind
 * Purpose: Closed enumeration of every AST node kind.
 * Theory of Operation:
 *   Walkers switch over this enum without a default label so that adding a kind
 *   is a compile error (-Werror=switch) until every walker handles it.
 */
#pragma once

namespace pyscope::ast {
    enum class NodeKind {
        Module,
        // statements
        FunctionDef,
        ClassDef,
        ReturnStmt,
        AssignStmt,
        AugAssignStmt,
        AnnAssignStmt,
        ExprStmt,
        IfStmt,
        WhileStmt,
        ForStmt,
        TryStmt,
        ExceptHandler,
        WithStmt,
        WithItem,
        Import,
        ImportFrom,
        RaiseStmt,
        GlobalStmt,
        NonlocalStmt,
        AssertStmt,
        DelStmt,
        PassStmt,
        BreakStmt,
        ContinueStmt,
        MatchStmt,
        MatchCase,
        // expressions
        Name,
        Attribute,
        Call,
        Subscript,
        Slice,
        Starred,
        IntLiteral,
        FloatLiteral,
        ImagLiteral,
        StringLiteral,
        BytesLiteral,
        BoolLiteral,
        NoneLiteral,
        EllipsisLiteral,
        FStringLiteral,
        BinaryExpr,
        UnaryExpr,
        Compare,
        IfExpr,
        LambdaExpr,
        NamedExpr,
        TupleLiteral,
        ListLiteral,
        SetLiteral,
        DictLiteral,
        ListComp,
        SetComp,
        DictComp,
        GeneratorExpr,
        YieldExpr,
        AwaitExpr,
        // match patterns
        PatternWildcard,
        PatternName,
        PatternLiteral,
        PatternOr,
        PatternAs,
        PatternClass,
        PatternSequence,
        PatternMapping,
        PatternStar
    };

    inline const char *to_string(const NodeKind element) {
        switch (element) {
            case NodeKind::Module: return "Module";
            case NodeKind::FunctionDef: return "FunctionDef";
            case NodeKind::ClassDef: return "ClassDef";
            case NodeKind::ReturnStmt: return "ReturnStmt";
            case NodeKind::AssignStmt: return "AssignStmt";
            case NodeKind::AugAssignStmt: return "AugAssignStmt";
            case NodeKind::AnnAssignStmt: return "AnnAssignStmt";
            case NodeKind::ExprStmt: return "ExprStmt";
            case NodeKind::IfStmt: return "IfStmt";
            case NodeKind::WhileStmt: return "WhileStmt";
            case NodeKind::ForStmt: return "ForStmt";
            case NodeKind::TryStmt: return "TryStmt";
            case NodeKind::ExceptHandler: return "ExceptHandler";
            case NodeKind::WithStmt: return "WithStmt";
            case NodeKind::WithItem: return "WithItem";
            case NodeKind::Import: return "Import";
            case NodeKind::ImportFrom: return "ImportFrom";
            case NodeKind::RaiseStmt: return "RaiseStmt";
            case NodeKind::GlobalStmt: return "GlobalStmt";
            case NodeKind::NonlocalStmt: return "NonlocalStmt";
            case NodeKind::AssertStmt: return "AssertStmt";
            case NodeKind::DelStmt: return "DelStmt";
            case NodeKind::PassStmt: return "PassStmt";
            case NodeKind::BreakStmt: return "BreakStmt";
            case NodeKind::ContinueStmt: return "ContinueStmt";
            case NodeKind::MatchStmt: return "MatchStmt";
            case NodeKind::MatchCase: return "MatchCase";
            case NodeKind::Name: return "Name";
            case NodeKind::Attribute: return "Attribute";
            case NodeKind::Call: return "Call";
            case NodeKind::Subscript: return "Subscript";
            case NodeKind::Slice: return "Slice";
            case NodeKind::Starred: return "Starred";
            case NodeKind::IntLiteral: return "IntLiteral";
            case NodeKind::FloatLiteral: return "FloatLiteral";
            case NodeKind::ImagLiteral: return "ImagLiteral";
            case NodeKind::StringLiteral: return "StringLiteral";
            case NodeKind::BytesLiteral: return "BytesLiteral";
            case NodeKind::BoolLiteral: return "BoolLiteral";
            case NodeKind::NoneLiteral: return "NoneLiteral";
            case NodeKind::EllipsisLiteral: return "EllipsisLiteral";
            case NodeKind::FStringLiteral: return "FStringLiteral";
            case NodeKind::BinaryExpr: return "BinaryExpr";
            case NodeKind::UnaryExpr: return "UnaryExpr";
            case NodeKind::Compare: return "Compare";
            case NodeKind::IfExpr: return "IfExpr";
            case NodeKind::LambdaExpr: return "LambdaExpr";
            case NodeKind::NamedExpr: return "NamedExpr";
            case NodeKind::TupleLiteral: return "TupleLiteral";
            case NodeKind::ListLiteral: return "ListLiteral";
            case NodeKind::SetLiteral: return "SetLiteral";
            case NodeKind::DictLiteral: return "DictLiteral";
            case NodeKind::ListComp: return "ListComp";
            case NodeKind::SetComp: return "SetComp";
            case NodeKind::DictComp: return "DictComp";
            case NodeKind::GeneratorExpr: return "GeneratorExpr";
            case NodeKind::YieldExpr: return "YieldExpr";
            case NodeKind::AwaitExpr: return "AwaitExpr";
            case NodeKind::PatternWildcard: return "PatternWildcard";
            case NodeKind::PatternName: return "PatternName";
            case NodeKind::PatternLiteral: return "PatternLiteral";
            case NodeKind::PatternOr: return "PatternOr";
            case NodeKind::PatternAs: return "PatternAs";
            case NodeKind::PatternClass: return "PatternClass";
            case NodeKind::PatternSequence: return "PatternSequence";
            case NodeKind::PatternMapping: return "PatternMapping";
            case NodeKind::PatternStar: return "PatternStar";
        }
        return "unknown";
    }
} // namespace pyscope::ast
