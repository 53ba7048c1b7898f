// VariableEnvironment holds what the host hands to a compile; Scope layers loop variables and mixin parameters on top of it during rendering.
#pragma once
#include <string>
#include <vector>
#include <utility>
#include <value.hpp>


struct VariableEnvironment { // write it before a compile starts, the compile only reads it
    std::vector<std::pair<std::string, Value>> vars;

    void set(const std::string& name, Value v);

    const Value* get(const std::string& name) const;
};


struct Scope {
    Scope* parent = NULL; // NULL for the root scope, which reads through to env
    const VariableEnvironment* env = NULL;
    std::vector<std::pair<std::string, Value>> locals;

    Scope(const VariableEnvironment* environment); // root scope

    Scope(Scope* p); // child scope

    void set(const std::string& name, Value v); // binds in THIS scope only

    void assign(const std::string& name, Value v); // rebinds wherever a scope on the way to the root already has it, else binds here. env is never written

    const Value* lookup(const std::string& name) const; // walks towards the root, NULL if nothing's bound anywhere
};
