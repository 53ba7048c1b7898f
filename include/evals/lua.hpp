// the LuaJIT back-end: every expression runs as `return <expr>` in one lua state per compile.
// template variables aren't copied in up front; the chunks' environment table pulls them out of the current Scope on demand,
// falling back to _G for the standard library.
#pragma once
#include <map>
#include <string>
#include <luajit-2.1/lua.hpp>
#include <defs.h>
#include <evals/core.hpp>


struct LuaEvaluator : Evaluator {
    lua_State* lua;
    Scope* current = NULL; // the scope of the expression being evaluated right now
    std::map<std::string, int> chunks; // source -> registry reference of the compiled chunk
    int environment; // registry reference of the table every chunk runs in

    LuaEvaluator();

    LuaEvaluator(const LuaEvaluator&) = delete;

    LuaEvaluator& operator=(const LuaEvaluator&) = delete;

    ~LuaEvaluator();

    Value evaluate(const std::string& source, Scope* scope, const Position& at);

    const char* name();

    static void push(lua_State* L, const Value& v);

    static Value pull(lua_State* L, int index, const Position& at, const std::string& source, int depth = 0);
};
