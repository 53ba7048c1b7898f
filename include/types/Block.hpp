// the composition markers: block, extends and include. the linker resolves all of them; none survive to rendering.
#pragma once
#include <string>
#include <vector>
#include <node.hpp>


struct Block : Node {
    std::string name; // empty for a bare `block` inside a mixin body, which the expander fills with the call's content
    enum Mode {
        Default, // a plain `block name`: declares a slot, or replaces it when it's an override
        Append,
        Prepend,
        Replace
    } mode = Default;
    std::vector<Node*> content;

    Block(std::string blockName, Mode m, Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void bodies(std::vector<std::vector<Node*>*>& out);

    void pTree(int tabLevel);
};


struct Extends : Node {
    std::string target;

    Extends(std::string path, Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void pTree(int tabLevel);
};


struct Include : Node {
    std::string target;
    std::string filter; // include:filter. filters aren't run, the file comes in as raw text

    Include(std::string path, std::string filterName, Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void pTree(int tabLevel);
};


const char* blockModeName(Block::Mode mode);
