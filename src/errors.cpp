#include <errors.hpp>


std::string Position::toString() const {
    std::string ret = file.size() > 0 ? file : "<string>";
    if (line > 0) {
        ret += ":" + std::to_string(line) + ":" + std::to_string(column);
    }
    return ret;
}


ZpugError::ZpugError(std::string msg, Position p) : std::runtime_error(msg), pos(p), message(msg) {}

const char* ZpugError::kindName() const {
    return "Error";
}

std::string ZpugError::describe() const {
    if (pos.line == 0 && pos.file.size() == 0) {
        return std::string(kindName()) + ": " + message;
    }
    return pos.toString() + ": " + kindName() + ": " + message;
}


SyntaxError::SyntaxError(Position p, std::string expect) : ZpugError("expected " + expect, p), expected(expect) {}

SyntaxError::SyntaxError(Position p, std::string expect, std::string msg) : ZpugError(msg, p), expected(expect) {}

const char* SyntaxError::kindName() const {
    return "SyntaxError";
}


IndentationError::IndentationError(Position p, std::string msg) : SyntaxError(p, "consistent indentation", msg) {}

const char* IndentationError::kindName() const {
    return "IndentationError";
}


LinkError::LinkError(Kind k, Position p, std::string msg) : ZpugError(msg, p), kind(k) {}

const char* LinkError::kindName() const {
    switch (kind) {
        case UnknownBlock:
            return "LinkError(unknownBlock)";
        case IncludeCycle:
            return "LinkError(includeCycle)";
        case ExtendsCycle:
            return "LinkError(extendsCycle)";
        default:
            return "LinkError(missingFile)";
    }
}


ExpansionError::ExpansionError(Kind k, Position p, std::string msg) : ZpugError(msg, p), kind(k) {}

const char* ExpansionError::kindName() const {
    return kind == UnknownMixin ? "ExpansionError(unknownMixin)" : "ExpansionError(recursionLimit)";
}


EvaluationError::EvaluationError(Position p, std::string msg, std::string expr) : ZpugError(msg, p), expression(expr) {}

const char* EvaluationError::kindName() const {
    return "EvaluationError";
}


RenderError::RenderError(Position p, std::string msg) : ZpugError(msg, p) {}

const char* RenderError::kindName() const {
    return "RenderError";
}
