// the evaluator boundary: the renderer hands expression source + a scope to an Evaluator and gets a Value back.
// the core pipeline never looks inside an expression; back-ends are picked by name at compile time.
#pragma once
#include <string>
#include <memory>
#include <defs.h>
#include <value.hpp>
#include <position.hpp>


struct Evaluator {
    virtual ~Evaluator() = default;

    virtual Value evaluate(const std::string& source, Scope* scope, const Position& at) = 0; // throws EvaluationError, with `at` attached

    virtual const char* name() = 0;
};


std::unique_ptr<Evaluator> makeEvaluator(const std::string& name); // "expr" or "lua". throws ZpugError otherwise.

bool hasEvaluator(const std::string& name);
