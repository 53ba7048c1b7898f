// rendering is done by the nodes themselves (Node::render); RenderContext is the state they share while walking the tree.
#pragma once
#include <map>
#include <string>
#include <vector>
#include <defs.h>
#include <value.hpp>
#include <options.h>
#include <zpugwriter.hpp>
#include <evals/core.hpp>

struct MixinScope;


struct RenderContext {
    ZpugWriter* out;
    Evaluator* evaluator;
    const CompileOptions* options;
    Scope* root; // globals. mixin bodies see these and their own parameters, nothing from the call site.
    bool terse = false; // `doctype html` was rendered: void elements close with > instead of />
    int depth = 0; // pretty-mode nesting depth
    bool inlineText = false; // inside an element whose children are all text: no line breaks
    std::map<const MixinScope*, Scope*> callers; // the scope each active mixin expansion was called from, for CallerBlock

    RenderContext(ZpugWriter* writer, Evaluator* eval, const CompileOptions* opts, Scope* globals);

    Value evaluate(const std::string& expr, Scope* scope, const Position& at);

    std::string textOf(const std::string& expr, Scope* scope, const Position& at); // evaluate for a text context: lists and maps are an error

    void beginLine(); // start a structural emission (no-op in compact mode and inside inline text)
};


std::string render(const std::vector<Node*>& nodes, Evaluator* evaluator, Scope* globals, const CompileOptions& options);
