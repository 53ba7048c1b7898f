// error taxonomy for the whole pipeline. every stage throws the first error it hits; nothing downstream runs after that.
#pragma once
#include <string>
#include <stdexcept>
#include <position.hpp>


struct ZpugError : std::runtime_error {
    Position pos;
    std::string message;

    ZpugError(std::string msg, Position p = Position());

    virtual const char* kindName() const;

    std::string describe() const; // "file:line:col: Kind: message"
};


struct SyntaxError : ZpugError {
    std::string expected; // the construct the tokenizer or parser wanted to see

    SyntaxError(Position p, std::string expect);

    SyntaxError(Position p, std::string expect, std::string msg);

    const char* kindName() const;
};


struct IndentationError : SyntaxError {
    IndentationError(Position p, std::string msg);

    const char* kindName() const;
};


struct LinkError : ZpugError {
    enum Kind {
        UnknownBlock,
        IncludeCycle,
        ExtendsCycle,
        MissingFile
    } kind;

    LinkError(Kind k, Position p, std::string msg);

    const char* kindName() const;
};


struct ExpansionError : ZpugError {
    enum Kind {
        UnknownMixin,
        RecursionLimit
    } kind;

    ExpansionError(Kind k, Position p, std::string msg);

    const char* kindName() const;
};


struct EvaluationError : ZpugError {
    std::string expression; // source of the expression that failed, if known

    EvaluationError(Position p, std::string msg, std::string expr = "");

    const char* kindName() const;
};


struct RenderError : ZpugError {
    RenderError(Position p, std::string msg);

    const char* kindName() const;
};
