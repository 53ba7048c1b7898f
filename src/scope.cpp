#include <scope.hpp>


void VariableEnvironment::set(const std::string& name, Value v) {
    for (auto& var : vars) {
        if (var.first == name) {
            var.second = v;
            return;
        }
    }
    vars.push_back({ name, v });
}

const Value* VariableEnvironment::get(const std::string& name) const {
    for (auto& var : vars) {
        if (var.first == name) {
            return &var.second;
        }
    }
    return NULL;
}


Scope::Scope(const VariableEnvironment* environment) : env(environment) {}

Scope::Scope(Scope* p) : parent(p) {}

void Scope::set(const std::string& name, Value v) {
    for (auto& local : locals) {
        if (local.first == name) {
            local.second = v;
            return;
        }
    }
    locals.push_back({ name, v });
}

void Scope::assign(const std::string& name, Value v) {
    for (Scope* s = this; s != NULL; s = s -> parent) {
        for (auto& local : s -> locals) {
            if (local.first == name) {
                local.second = v;
                return;
            }
        }
    }
    set(name, v);
}

const Value* Scope::lookup(const std::string& name) const {
    for (auto& local : locals) {
        if (local.first == name) {
            return &local.second;
        }
    }
    if (parent != NULL) {
        return parent -> lookup(name);
    }
    if (env != NULL) {
        return env -> get(name);
    }
    return NULL;
}
