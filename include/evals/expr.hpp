// the built-in expression back-end: a small, side-effect free, javascript-flavoured subset.
// literals, variables, member and index access, arithmetic, comparison, logic and the ternary. no calls, no assignment.
#pragma once
#include <map>
#include <string>
#include <vector>
#include <utility>
#include <defs.h>
#include <evals/core.hpp>


struct ExprContext { // what an expression node needs while it evaluates
    Scope* scope;
    const Position& at;
    const std::string& source;
};


struct ExprNode {
    virtual ~ExprNode() = default;

    virtual Value eval(ExprContext& ctx) = 0;
};


struct LiteralExpr : ExprNode {
    Value value;

    LiteralExpr(Value v);

    Value eval(ExprContext& ctx);
};


struct IdentifierExpr : ExprNode {
    std::string name;

    IdentifierExpr(std::string n);

    Value eval(ExprContext& ctx); // unbound names are null, not an error
};


struct MemberExpr : ExprNode {
    ExprNode* object;
    ExprNode* key; // .name is parsed into a string literal key, so a.b and a["b"] are the same thing

    MemberExpr(ExprNode* obj, ExprNode* k);

    Value eval(ExprContext& ctx);
};


struct UnaryExpr : ExprNode {
    char op; // ! - +
    ExprNode* operand;

    UnaryExpr(char o, ExprNode* operand);

    Value eval(ExprContext& ctx);
};


struct BinaryExpr : ExprNode {
    std::string op;
    ExprNode* left;
    ExprNode* right;

    BinaryExpr(std::string o, ExprNode* l, ExprNode* r);

    Value eval(ExprContext& ctx);
};


struct TernaryExpr : ExprNode {
    ExprNode* condition;
    ExprNode* ifTrue;
    ExprNode* ifFalse;

    TernaryExpr(ExprNode* c, ExprNode* t, ExprNode* f);

    Value eval(ExprContext& ctx);
};


struct ListExpr : ExprNode {
    std::vector<ExprNode*> items;

    Value eval(ExprContext& ctx);
};


struct MapExpr : ExprNode {
    std::vector<std::pair<std::string, ExprNode*>> entries;

    Value eval(ExprContext& ctx);
};


double toNumber(const Value& v); // javascript-ish: null is 0, booleans are 0/1, numeric strings parse, everything else is NaN

bool looseEquals(const Value& a, const Value& b); // == (=== is Value::equals)


struct ExprEvaluator : Evaluator {
    std::vector<ExprNode*> nodes; // owns every ExprNode this evaluator has parsed
    std::map<std::string, ExprNode*> cache; // source -> parsed tree; templates evaluate the same expressions over and over

    ExprEvaluator() = default;

    ExprEvaluator(const ExprEvaluator&) = delete;

    ExprEvaluator& operator=(const ExprEvaluator&) = delete;

    ~ExprEvaluator();

    Value evaluate(const std::string& source, Scope* scope, const Position& at);

    const char* name();

    ExprNode* parse(const std::string& source, const Position& at); // throws EvaluationError for anything outside the subset

    template <typename T, typename... Args>
    T* make(Args&&... args) {
        T* node = new T(std::forward<Args>(args)...);
        nodes.push_back(node);
        return node;
    }
};
