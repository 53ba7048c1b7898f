// the compile options struct
#pragma once
#include <string>
#include <defs.h>

struct CompileOptions {
    bool pretty = false; // insert newlines + indentation between structural emissions
    std::string indentString = "  "; // one pretty-mode indentation level
    std::string evaluator = "expr"; // which expression back-end to use, see makeEvaluator
    int mixinDepthLimit = ZPUG_DEFAULT_MIXIN_DEPTH;
    int loopLimit = ZPUG_DEFAULT_LOOP_LIMIT;
    bool verbose = false; // log pipeline progress to stdout
};
