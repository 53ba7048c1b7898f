#include <renderer.hpp>
#include <node.hpp>
#include <errors.hpp>


RenderContext::RenderContext(ZpugWriter* writer, Evaluator* eval, const CompileOptions* opts, Scope* globals) : out(writer), evaluator(eval), options(opts), root(globals) {}

Value RenderContext::evaluate(const std::string& expr, Scope* scope, const Position& at) {
    return evaluator -> evaluate(expr, scope, at);
}

std::string RenderContext::textOf(const std::string& expr, Scope* scope, const Position& at) {
    Value v = evaluate(expr, scope, at);
    std::string ret;
    if (!v.stringify(ret)) {
        throw EvaluationError(at, std::string("a ") + v.typeName() + " can't be used as text", expr);
    }
    return ret;
}

void RenderContext::beginLine() {
    if (inlineText) {
        return;
    }
    out -> beginLine(depth);
}


std::string render(const std::vector<Node*>& nodes, Evaluator* evaluator, Scope* globals, const CompileOptions& options) {
    StringWriteOutput output;
    ZpugWriter writer(output);
    writer.pretty = options.pretty;
    writer.indentString = options.indentString;
    RenderContext ctx(&writer, evaluator, &options, globals);
    renderList(nodes, &ctx, globals);
    return output.content;
}
