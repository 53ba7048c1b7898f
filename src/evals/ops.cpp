// evaluation for the built-in expression subset
#include <evals/expr.hpp>
#include <errors.hpp>
#include <scope.hpp>
#include <util.hpp>
#include <cmath>
#include <cstdlib>


double toNumber(const Value& v) {
    switch (v.type) {
        case Value::Null:
            return 0;
        case Value::Boolean:
            return v.boolean ? 1 : 0;
        case Value::Number:
            return v.number;
        case Value::String: {
            std::string s = trim(v.string);
            if (s.size() == 0) {
                return 0;
            }
            char* end;
            double ret = strtod(s.c_str(), &end);
            return *end == 0 ? ret : NAN;
        }
        default:
            return NAN;
    }
}

bool looseEquals(const Value& a, const Value& b) {
    if (a.type == b.type) {
        return a.equals(b);
    }
    if (a.type == Value::Null || b.type == Value::Null) {
        return false;
    }
    if (a.type == Value::Boolean) {
        return looseEquals(Value(toNumber(a)), b);
    }
    if (b.type == Value::Boolean) {
        return looseEquals(a, Value(toNumber(b)));
    }
    if ((a.type | b.type) == (Value::Number | Value::String)) {
        return toNumber(a) == toNumber(b);
    }
    return false;
}


LiteralExpr::LiteralExpr(Value v) : value(v) {}

Value LiteralExpr::eval(ExprContext& ctx) {
    return value;
}


IdentifierExpr::IdentifierExpr(std::string n) : name(n) {}

Value IdentifierExpr::eval(ExprContext& ctx) {
    const Value* found = ctx.scope -> lookup(name);
    if (found == NULL) {
        return Value();
    }
    return *found;
}


MemberExpr::MemberExpr(ExprNode* obj, ExprNode* k) : object(obj), key(k) {}

Value MemberExpr::eval(ExprContext& ctx) {
    Value obj = object -> eval(ctx);
    Value k = key -> eval(ctx);
    std::string name;
    if (!k.stringify(name)) {
        throw EvaluationError(ctx.at, std::string("a ") + k.typeName() + " can't be used as a key", ctx.source);
    }
    if (obj.type == Value::Null) {
        throw EvaluationError(ctx.at, "can't read '" + name + "' of null", ctx.source);
    }
    if (obj.type & (Value::List | Value::String)) {
        if (k.type == Value::Number) {
            double idx = k.number;
            if (idx < 0 || idx != std::floor(idx) || idx >= obj.size()) {
                return Value();
            }
            if (obj.type == Value::List) {
                return obj.list[(size_t)idx];
            }
            return Value(std::string(1, obj.string[(size_t)idx]));
        }
        if (name == "length") {
            return Value((double)obj.size());
        }
        return Value();
    }
    if (obj.type == Value::Map) {
        const Value* found = obj.get(name);
        if (found != NULL) {
            return *found;
        }
        if (name == "length") {
            return Value((double)obj.size());
        }
    }
    return Value(); // numbers and booleans have no properties worth having
}


UnaryExpr::UnaryExpr(char o, ExprNode* operand) : op(o), operand(operand) {}

Value UnaryExpr::eval(ExprContext& ctx) {
    Value v = operand -> eval(ctx);
    if (op == '!') {
        return Value(!v.truthyness());
    }
    double n = toNumber(v);
    return Value(op == '-' ? -n : n);
}


BinaryExpr::BinaryExpr(std::string o, ExprNode* l, ExprNode* r) : op(o), left(l), right(r) {}

Value BinaryExpr::eval(ExprContext& ctx) {
    if (op == "&&" || op == "||") { // short-circuit, and hand back the operand itself rather than a boolean
        Value l = left -> eval(ctx);
        if (l.truthyness() == (op == "||")) {
            return l;
        }
        return right -> eval(ctx);
    }
    Value l = left -> eval(ctx);
    Value r = right -> eval(ctx);
    if (op == "==") {
        return Value(looseEquals(l, r));
    }
    if (op == "!=") {
        return Value(!looseEquals(l, r));
    }
    if (op == "===") {
        return Value(l.equals(r));
    }
    if (op == "!==") {
        return Value(!l.equals(r));
    }
    if (op == "+" && (l.type == Value::String || r.type == Value::String)) {
        std::string one, two;
        if (!l.stringify(one) || !r.stringify(two)) {
            throw EvaluationError(ctx.at, std::string("can't concatenate a ") + (l.type == Value::String ? r : l).typeName() + " onto a string", ctx.source);
        }
        return Value(one + two);
    }
    if (l.type == Value::String && r.type == Value::String) { // only comparisons are left that care about strings
        int cmp = l.string.compare(r.string);
        if (op == "<") return Value(cmp < 0);
        if (op == ">") return Value(cmp > 0);
        if (op == "<=") return Value(cmp <= 0);
        if (op == ">=") return Value(cmp >= 0);
    }
    double a = toNumber(l);
    double b = toNumber(r);
    switch (op[0]) {
        case '+':
            return Value(a + b);
        case '-':
            return Value(a - b);
        case '*':
            return Value(a * b);
        case '/':
            return Value(a / b);
        case '%':
            return Value(std::fmod(a, b));
        case '<':
            return Value(op.size() == 1 ? a < b : a <= b);
        case '>':
            return Value(op.size() == 1 ? a > b : a >= b);
    }
    throw EvaluationError(ctx.at, "unknown operator " + op, ctx.source);
}


TernaryExpr::TernaryExpr(ExprNode* c, ExprNode* t, ExprNode* f) : condition(c), ifTrue(t), ifFalse(f) {}

Value TernaryExpr::eval(ExprContext& ctx) {
    return condition -> eval(ctx).truthyness() ? ifTrue -> eval(ctx) : ifFalse -> eval(ctx);
}


Value ListExpr::eval(ExprContext& ctx) {
    Value ret = Value::makeList();
    for (ExprNode* item : items) {
        ret.push(item -> eval(ctx));
    }
    return ret;
}


Value MapExpr::eval(ExprContext& ctx) {
    Value ret = Value::makeMap();
    for (auto& entry : entries) {
        ret.set(entry.first, entry.second -> eval(ctx));
    }
    return ret;
}
