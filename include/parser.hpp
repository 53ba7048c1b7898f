// Parser turns one file's token stream into that file's AST. It doesn't load anything: extends, include and block
// come out as marker nodes for the linker.
#pragma once
#include <string>
#include <vector>
#include <defs.h>
#include <token.hpp>
#include <node.hpp>
#include <types/Element.hpp>
#include <types/Block.hpp>


struct Template {
    std::string path;
    std::vector<Node*> nodes;
    Extends* extends = NULL; // kept out of nodes; if it's set, nodes holds only block overrides and mixin definitions
};


struct Parser {
    struct Frame { // a child list the parser is currently filling
        enum Kind {
            Normal,
            CaseBody, // only when/default lines are allowed
            RawText, // block text lines, glued into one Text
            RawComment // block comment lines, glued onto the comment's text
        } kind = Normal;
        std::vector<Node*>* children = NULL;
        Node* owner = NULL;
        bool started = false; // raw frames: has the first line gone in yet?
    };

    std::vector<Token> tokens;
    size_t cursor = 0;
    NodePool* pool;
    std::string file;

    Parser(std::vector<Token> toks, NodePool* nodePool, std::string filename);

    Template parse(); // throws SyntaxError

    static std::vector<std::string> splitArguments(const std::string& list, const Position& at); // split on top-level commas, respecting quotes and brackets

    static void parseAttributes(const std::string& list, const Position& at, Element* element);

private:
    std::vector<Frame> stack;
    Frame pending; // the body the next Indent opens
    bool hasPending = false;
    Template tpl;
    std::vector<std::string> blockNames;

    Token& peek();

    Token& next();

    void expectNewline();

    void line();

    void rawLine(Frame& frame);

    void tag();

    void keyword();

    void mixinCall();

    void pipe();

    void collectSegments(std::vector<Segment>& out);

    void open(Frame::Kind kind, std::vector<Node*>* children, Node* owner);
};
