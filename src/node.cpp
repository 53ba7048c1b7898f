#include <node.hpp>
#include <cstdio>


void Node::bodies(std::vector<std::vector<Node*>*>& out) {} // leaves don't have any

void Node::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Node at %s\n", pos.toString().c_str());
}


NodePool::~NodePool() {
    for (Node* node : nodes) {
        delete node;
    }
}


std::vector<Node*> cloneList(const std::vector<Node*>& list, NodePool* pool) {
    std::vector<Node*> ret;
    ret.reserve(list.size());
    for (Node* node : list) {
        ret.push_back(node -> clone(pool));
    }
    return ret;
}

void renderList(const std::vector<Node*>& list, RenderContext* ctx, Scope* scope) {
    for (Node* node : list) {
        node -> render(ctx, scope);
    }
}

void pTreeList(const std::vector<Node*>& list, int tabLevel) {
    for (Node* node : list) {
        node -> pTree(tabLevel);
    }
}

void pTreeIndent(int tabLevel) {
    for (int x = 0; x < tabLevel; x ++) {printf("\t");}
}
