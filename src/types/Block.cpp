#include <types/Block.hpp>
#include <renderer.hpp>
#include <errors.hpp>


const char* blockModeName(Block::Mode mode) {
    switch (mode) {
        case Block::Append:
            return "append";
        case Block::Prepend:
            return "prepend";
        case Block::Replace:
            return "replace";
        default:
            return "default";
    }
}


Block::Block(std::string blockName, Mode m, Position p) : Node(BLOCK, p), name(blockName), mode(m) {}

void Block::render(RenderContext* ctx, Scope* scope) {
    throw RenderError(pos, name.size() > 0 ? "block '" + name + "' was never linked" : "bare block outside of a mixin");
}

Node* Block::clone(NodePool* pool) {
    Block* ret = pool -> make<Block>(name, mode, pos);
    ret -> content = cloneList(content, pool);
    return ret;
}

void Block::bodies(std::vector<std::vector<Node*>*>& out) {
    out.push_back(&content);
}

void Block::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Block %s (%s)\n", name.size() > 0 ? name.c_str() : "<caller content>", blockModeName(mode));
    pTreeList(content, tabLevel + 1);
}


Extends::Extends(std::string path, Position p) : Node(EXTENDS, p), target(path) {}

void Extends::render(RenderContext* ctx, Scope* scope) {
    throw RenderError(pos, "extends " + target + " was never linked");
}

Node* Extends::clone(NodePool* pool) {
    return pool -> make<Extends>(target, pos);
}

void Extends::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Extends %s\n", target.c_str());
}


Include::Include(std::string path, std::string filterName, Position p) : Node(INCLUDE, p), target(path), filter(filterName) {}

void Include::render(RenderContext* ctx, Scope* scope) {
    throw RenderError(pos, "include " + target + " was never linked");
}

Node* Include::clone(NodePool* pool) {
    return pool -> make<Include>(target, filter, pos);
}

void Include::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Include %s%s%s\n", target.c_str(), filter.size() > 0 ? " with filter " : "", filter.c_str());
}
