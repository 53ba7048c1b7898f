#include <evals/core.hpp>
#include <evals/expr.hpp>
#include <evals/lua.hpp>
#include <errors.hpp>


bool hasEvaluator(const std::string& name) {
    return name == "expr" || name == "lua";
}

std::unique_ptr<Evaluator> makeEvaluator(const std::string& name) {
    if (name == "expr") {
        return std::unique_ptr<Evaluator>(new ExprEvaluator());
    }
    if (name == "lua") {
        return std::unique_ptr<Evaluator>(new LuaEvaluator());
    }
    throw ZpugError("no expression evaluator named '" + name + "' (there's expr and lua)");
}
