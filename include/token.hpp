#pragma once
#include <string>
#include <position.hpp>


struct Token { // immutable once the tokenizer hands it out
    enum Kind {
        TagHead,        // element name (implicit "div" for a bare .class / #id line)
        ClassShorthand, // .name
        IdShorthand,    // #name
        AttrList,       // contents of a balanced (...) after the tag head
        SelfClose,      // trailing /
        BlockText,      // trailing . - the deeper lines are raw text
        TextLiteral,
        Interpolation,  // #{...} (raw == false) or !{...} (raw == true); lexeme is the expression
        BufferedEcho,   // = expr (raw == false) or != expr (raw == true)
        Code,           // - name = expr: lexeme is the name, arg the expression
        Keyword,        // lexeme is the keyword, arg the rest of the line
        MixinCall,      // +name(args): lexeme is the name, arg the argument text
        Comment,        // lexeme is the text after // or //-; raw == true for the silent //- form
        Doctype,        // lexeme is the doctype kind
        Pipe,           // | text, or a line of literal html
        Newline,        // end of a content line
        Indent,
        Dedent,
        Eof
    } kind;

    std::string lexeme;
    std::string arg;
    std::string filter; // include:filter
    bool raw = false;
    Position pos;

    Token(Kind k, std::string lex, Position p) : kind(k), lexeme(lex), pos(p) {}

    const char* kindName() const;
};
