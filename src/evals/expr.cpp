// lexer + recursive descent parser for the built-in expression subset. precedence, loosest first:
// ternary, ||, &&, equality, comparison, + -, * / %, unary ! - +, postfix .name [index]
#include <evals/expr.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <cstdlib>
#include <cstring>


struct ExprToken {
    enum Kind {
        Number,
        String,
        Ident,
        Punct,
        End
    } kind;
    std::string text;
    double number = 0;
    size_t offset; // into the source, for error messages
};


static const char* puncts[] = { "===", "!==", "==", "!=", "<=", ">=", "&&", "||", "!", "<", ">", "+", "-", "*", "/", "%", "?", ":", ".", ",", "(", ")", "[", "]", "{", "}" };


struct ExprParser {
    ExprEvaluator* owner;
    const std::string& source;
    const Position& at;
    std::vector<ExprToken> tokens;
    size_t cursor = 0;

    ExprParser(ExprEvaluator* o, const std::string& src, const Position& p) : owner(o), source(src), at(p) {}

    [[noreturn]] void fail(std::string msg) {
        throw EvaluationError(at, msg, source);
    }

    void lex() {
        size_t i = 0;
        while (i < source.size()) {
            char c = source[i];
            if (isWhitespace(c)) {
                i ++;
                continue;
            }
            ExprToken t;
            t.offset = i;
            if ((c >= '0' && c <= '9') || (c == '.' && source[i + 1] >= '0' && source[i + 1] <= '9')) {
                char* end;
                t.kind = ExprToken::Number;
                t.number = strtod(source.c_str() + i, &end);
                size_t len = end - (source.c_str() + i);
                t.text = source.substr(i, len);
                i += len;
                if (i < source.size() && isIdentChar(source[i])) {
                    fail("malformed number '" + t.text + source[i] + "'");
                }
            }
            else if (c == '\'' || c == '"') {
                t.kind = ExprToken::String;
                i ++;
                while (i < source.size() && source[i] != c) {
                    if (source[i] == '\\' && i + 1 < source.size()) {
                        i ++;
                        switch (source[i]) {
                            case 'n': t.text += '\n'; break;
                            case 't': t.text += '\t'; break;
                            case 'r': t.text += '\r'; break;
                            default: t.text += source[i];
                        }
                    }
                    else {
                        t.text += source[i];
                    }
                    i ++;
                }
                if (i >= source.size()) {
                    fail("unterminated string");
                }
                i ++;
            }
            else if (isIdentStart(c)) {
                t.kind = ExprToken::Ident;
                while (i < source.size() && isIdentChar(source[i])) {
                    t.text += source[i];
                    i ++;
                }
            }
            else {
                t.kind = ExprToken::Punct;
                for (const char* p : puncts) {
                    if (source.compare(i, strlen(p), p) == 0) {
                        t.text = p;
                        break;
                    }
                }
                if (t.text.size() == 0) {
                    fail(c == '=' ? std::string("assignment isn't allowed in template expressions") : std::string("unexpected character '") + c + "'");
                }
                i += t.text.size();
            }
            tokens.push_back(t);
        }
        ExprToken end;
        end.kind = ExprToken::End;
        end.offset = source.size();
        tokens.push_back(end);
    }

    ExprToken& peek() {
        return tokens[cursor];
    }

    bool isPunct(const char* p) {
        return peek().kind == ExprToken::Punct && peek().text == p;
    }

    bool accept(const char* p) {
        if (isPunct(p)) {
            cursor ++;
            return true;
        }
        return false;
    }

    void expect(const char* p) {
        if (!accept(p)) {
            fail(std::string("expected '") + p + "' " + describe(peek()));
        }
    }

    std::string describe(ExprToken& t) {
        if (t.kind == ExprToken::End) {
            return "at the end of the expression";
        }
        return "but found '" + (t.kind == ExprToken::String ? "\"" + t.text + "\"" : t.text) + "' at offset " + std::to_string(t.offset);
    }

    ExprNode* parse() {
        lex();
        ExprNode* ret = ternary();
        if (peek().kind != ExprToken::End) {
            fail("unexpected '" + peek().text + "' at offset " + std::to_string(peek().offset));
        }
        return ret;
    }

    ExprNode* ternary() {
        ExprNode* cond = logicalOr();
        if (accept("?")) {
            ExprNode* ifTrue = ternary();
            expect(":");
            ExprNode* ifFalse = ternary(); // right-associative
            return owner -> make<TernaryExpr>(cond, ifTrue, ifFalse);
        }
        return cond;
    }

    ExprNode* logicalOr() {
        ExprNode* left = logicalAnd();
        while (accept("||")) {
            left = owner -> make<BinaryExpr>("||", left, logicalAnd());
        }
        return left;
    }

    ExprNode* logicalAnd() {
        ExprNode* left = equality();
        while (accept("&&")) {
            left = owner -> make<BinaryExpr>("&&", left, equality());
        }
        return left;
    }

    ExprNode* equality() {
        ExprNode* left = comparison();
        while (isPunct("==") || isPunct("!=") || isPunct("===") || isPunct("!==")) {
            std::string op = tokens[cursor ++].text;
            left = owner -> make<BinaryExpr>(op, left, comparison());
        }
        return left;
    }

    ExprNode* comparison() {
        ExprNode* left = additive();
        while (isPunct("<") || isPunct(">") || isPunct("<=") || isPunct(">=")) {
            std::string op = tokens[cursor ++].text;
            left = owner -> make<BinaryExpr>(op, left, additive());
        }
        return left;
    }

    ExprNode* additive() {
        ExprNode* left = multiplicative();
        while (isPunct("+") || isPunct("-")) {
            std::string op = tokens[cursor ++].text;
            left = owner -> make<BinaryExpr>(op, left, multiplicative());
        }
        return left;
    }

    ExprNode* multiplicative() {
        ExprNode* left = unary();
        while (isPunct("*") || isPunct("/") || isPunct("%")) {
            std::string op = tokens[cursor ++].text;
            left = owner -> make<BinaryExpr>(op, left, unary());
        }
        return left;
    }

    ExprNode* unary() {
        if (isPunct("!") || isPunct("-") || isPunct("+")) {
            char op = tokens[cursor ++].text[0];
            return owner -> make<UnaryExpr>(op, unary());
        }
        return postfix();
    }

    ExprNode* postfix() {
        ExprNode* expr = primary();
        while (true) {
            if (accept(".")) {
                if (peek().kind != ExprToken::Ident) {
                    fail("expected a property name after '.' " + describe(peek()));
                }
                expr = owner -> make<MemberExpr>(expr, owner -> make<LiteralExpr>(Value(tokens[cursor ++].text)));
            }
            else if (accept("[")) {
                ExprNode* key = ternary();
                expect("]");
                expr = owner -> make<MemberExpr>(expr, key);
            }
            else if (isPunct("(")) {
                fail("function calls aren't supported in template expressions");
            }
            else {
                return expr;
            }
        }
    }

    ExprNode* primary() {
        ExprToken& t = peek();
        if (t.kind == ExprToken::Number) {
            cursor ++;
            return owner -> make<LiteralExpr>(Value(t.number));
        }
        if (t.kind == ExprToken::String) {
            cursor ++;
            return owner -> make<LiteralExpr>(Value(t.text));
        }
        if (t.kind == ExprToken::Ident) {
            cursor ++;
            if (t.text == "true" || t.text == "false") {
                return owner -> make<LiteralExpr>(Value(t.text == "true"));
            }
            if (t.text == "null" || t.text == "undefined") {
                return owner -> make<LiteralExpr>(Value());
            }
            return owner -> make<IdentifierExpr>(t.text);
        }
        if (accept("(")) {
            ExprNode* inner = ternary();
            expect(")");
            return inner;
        }
        if (accept("[")) {
            ListExpr* list = owner -> make<ListExpr>();
            while (!isPunct("]")) {
                list -> items.push_back(ternary());
                if (!accept(",")) {
                    break;
                }
            }
            expect("]");
            return list;
        }
        if (accept("{")) {
            MapExpr* map = owner -> make<MapExpr>();
            while (!isPunct("}")) {
                ExprToken& key = peek();
                if (key.kind != ExprToken::Ident && key.kind != ExprToken::String && key.kind != ExprToken::Number) {
                    fail("expected a key in the object literal " + describe(key));
                }
                cursor ++;
                expect(":");
                map -> entries.push_back({ key.kind == ExprToken::Number ? numberToString(key.number) : key.text, ternary() });
                if (!accept(",")) {
                    break;
                }
            }
            expect("}");
            return map;
        }
        fail("expected a value " + describe(t));
    }
};


ExprEvaluator::~ExprEvaluator() {
    for (ExprNode* node : nodes) {
        delete node;
    }
}

ExprNode* ExprEvaluator::parse(const std::string& source, const Position& at) {
    auto cached = cache.find(source);
    if (cached != cache.end()) {
        return cached -> second;
    }
    ExprParser parser(this, source, at);
    ExprNode* ret = parser.parse();
    cache[source] = ret;
    return ret;
}

Value ExprEvaluator::evaluate(const std::string& source, Scope* scope, const Position& at) {
    ExprNode* tree = parse(source, at);
    ExprContext ctx { scope, at, source };
    return tree -> eval(ctx);
}

const char* ExprEvaluator::name() {
    return "expr";
}
