// Linker flattens multi-file composition: it walks the extends chain, folds block overrides root to leaf, and splices
// includes in place. What comes out is one node list with no Extends, Include or named Block left in it.
#pragma once
#include <map>
#include <string>
#include <vector>
#include <defs.h>
#include <parser.hpp>
#include <fileman.hpp>
#include <options.h>


struct Linker {
    FileLoader* loader;
    NodePool* pool;
    const CompileOptions* options;
    std::vector<std::string> includeStack; // files currently being included, outermost first

    Linker(FileLoader* fileLoader, NodePool* nodePool, const CompileOptions* opts);

    std::vector<Node*> link(Template root); // throws LinkError, and SyntaxError for anything it loads

    Template load(const std::string& path, const Position& from); // read + tokenize + parse. `from` is where the reference was, for MissingFile

private:
    typedef std::map<std::string, std::vector<Node*>> Slots; // block name -> content so far

    std::vector<Node*> flatten(Template tpl);

    void resolveIncludes(std::vector<Node*>& nodes, const std::string& file);

    void declareSlots(std::vector<Node*>& nodes, Slots& slots);

    std::vector<Node*> substitute(const std::vector<Node*>& nodes, Slots& slots, std::vector<std::string>& active);
};
