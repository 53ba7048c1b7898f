#include <parser.hpp>
#include <tokenizer.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <types/Text.hpp>
#include <types/Conditional.hpp>
#include <types/Each.hpp>
#include <types/Case.hpp>
#include <types/Mixin.hpp>
#include <types/Comment.hpp>
#include <types/While.hpp>
#include <types/Code.hpp>


static Position shifted(const Position& p, size_t by) {
    return Position(p.file, p.line, p.column + by);
}

static Text* echoText(NodePool* pool, const Token& t) { // `= expr` as a text node holding the one expression
    Text* text = pool -> make<Text>(t.pos);
    Segment seg;
    seg.isExpr = true;
    seg.text = t.lexeme;
    seg.escaped = !t.raw;
    seg.pos = t.pos;
    text -> append(seg);
    return text;
}


Parser::Parser(std::vector<Token> toks, NodePool* nodePool, std::string filename) : tokens(toks), pool(nodePool), file(filename) {}

Token& Parser::peek() {
    return tokens[cursor];
}

Token& Parser::next() {
    Token& ret = tokens[cursor];
    if (ret.kind != Token::Eof) {
        cursor ++;
    }
    return ret;
}

void Parser::expectNewline() {
    Token& t = next();
    if (t.kind != Token::Newline) {
        throw SyntaxError(t.pos, "end of line", std::string("unexpected ") + t.kindName());
    }
}

void Parser::open(Frame::Kind kind, std::vector<Node*>* children, Node* owner) {
    pending = Frame();
    pending.kind = kind;
    pending.children = children;
    pending.owner = owner;
    hasPending = true;
}

Template Parser::parse() {
    tpl = Template();
    tpl.path = file;
    stack.clear();
    Frame root;
    root.children = &tpl.nodes;
    stack.push_back(root);
    hasPending = false;
    while (peek().kind != Token::Eof) {
        Token& t = peek();
        if (t.kind == Token::Indent) {
            if (!hasPending) {
                throw SyntaxError(t.pos, "content at the same depth as the line before", "unexpected indentation: the line above can't have children");
            }
            if (pending.owner != NULL && pending.owner -> type == Node::MIXINCALL) {
                ((MixinCall*)pending.owner) -> hasBlock = true;
            }
            stack.push_back(pending);
            hasPending = false;
            next();
            continue;
        }
        if (t.kind == Token::Dedent) {
            if (stack.size() <= 1) { // the tokenizer never lets this happen
                throw SyntaxError(t.pos, "indented content", "dedent below the top level");
            }
            stack.pop_back();
            hasPending = false;
            next();
            continue;
        }
        if (t.kind == Token::Newline) {
            next();
            continue;
        }
        hasPending = false;
        Frame& frame = stack.back();
        if (frame.kind == Frame::RawText || frame.kind == Frame::RawComment) {
            rawLine(frame);
        }
        else {
            line();
        }
    }
    if (tpl.extends != NULL) { // a template that extends another is nothing but overrides
        for (Node* node : tpl.nodes) {
            bool allowed = node -> type == Node::BLOCK || node -> type == Node::MIXINDEF || (node -> type == Node::COMMENT && !((Comment*)node) -> visible);
            if (!allowed) {
                throw SyntaxError(node -> pos, "a block override", "only blocks and mixin definitions may sit beside extends");
            }
        }
    }
    return tpl;
}

void Parser::rawLine(Frame& frame) {
    Position at = peek().pos;
    std::vector<Segment> segments;
    collectSegments(segments);
    expectNewline();
    if (frame.kind == Frame::RawComment) {
        Comment* comment = (Comment*)frame.owner;
        comment -> text += "\n";
        for (Segment& seg : segments) {
            comment -> text += seg.text; // comment lines never interpolate, they're all literals
        }
        return;
    }
    if (frame.owner == NULL) { // first line of block text: now there's something to hold it
        frame.owner = pool -> make<Text>(at);
        frame.children -> push_back(frame.owner);
    }
    Text* text = (Text*)frame.owner;
    if (frame.started) {
        text -> appendLiteral("\n", at);
    }
    frame.started = true;
    for (Segment& seg : segments) {
        text -> append(seg);
    }
}

void Parser::collectSegments(std::vector<Segment>& out) {
    while (peek().kind == Token::TextLiteral || peek().kind == Token::Interpolation) {
        Token& t = next();
        Segment seg;
        seg.isExpr = t.kind == Token::Interpolation;
        seg.text = t.lexeme;
        seg.escaped = !t.raw;
        seg.pos = t.pos;
        out.push_back(seg);
    }
}

void Parser::line() {
    Token& t = peek();
    Frame& frame = stack.back();
    if (frame.kind == Frame::CaseBody) {
        if (t.kind == Token::Comment && t.raw) {
            next();
            expectNewline();
            return;
        }
        if (t.kind != Token::Keyword || (t.lexeme != "when" && t.lexeme != "default")) {
            throw SyntaxError(t.pos, "'when' or 'default'", "only when and default can sit directly inside a case");
        }
    }
    switch (t.kind) {
        case Token::TagHead:
            tag();
            break;
        case Token::Pipe:
            pipe();
            break;
        case Token::Keyword:
            keyword();
            break;
        case Token::MixinCall:
            mixinCall();
            break;
        case Token::Comment: {
            next();
            Comment* comment = pool -> make<Comment>(t.lexeme, !t.raw, t.pos);
            stack.back().children -> push_back(comment);
            expectNewline();
            open(Frame::RawComment, NULL, comment);
            break;
        }
        case Token::BufferedEcho: // no children: an indent after this is unexpected
            next();
            stack.back().children -> push_back(echoText(pool, t));
            expectNewline();
            break;
        case Token::Code:
            next();
            stack.back().children -> push_back(pool -> make<Code>(t.lexeme, t.arg, t.pos));
            expectNewline();
            break;
        case Token::Doctype:
            next();
            stack.back().children -> push_back(pool -> make<Doctype>(t.lexeme, t.pos));
            expectNewline();
            break;
        default:
            throw SyntaxError(t.pos, "a tag, keyword, comment or text", std::string("unexpected ") + t.kindName() + " at the start of a line");
    }
}

void Parser::pipe() {
    Token& t = next();
    std::vector<Segment> segments;
    collectSegments(segments);
    expectNewline();
    std::vector<Node*>* children = stack.back().children;
    Text* text = NULL;
    if (children -> size() > 0 && children -> back() -> type == Node::TEXT && ((Text*)children -> back()) -> piped) {
        text = (Text*)children -> back(); // consecutive piped lines are one text node
        text -> appendLiteral("\n", t.pos);
    }
    else {
        text = pool -> make<Text>(t.pos);
        text -> piped = true;
        children -> push_back(text);
    }
    for (Segment& seg : segments) {
        text -> append(seg);
    }
}

void Parser::tag() {
    Token& head = next();
    Element* element = pool -> make<Element>(head.lexeme, head.pos);
    stack.back().children -> push_back(element);
    while (true) {
        Token& t = peek();
        if (t.kind == Token::ClassShorthand) {
            element -> addClass(t.lexeme);
        }
        else if (t.kind == Token::IdShorthand) {
            element -> id = t.lexeme;
        }
        else if (t.kind == Token::AttrList) {
            parseAttributes(t.lexeme, t.pos, element);
        }
        else {
            break;
        }
        next();
    }
    Token& t = peek();
    if (t.kind == Token::SelfClose) {
        next();
        element -> selfClosing = true;
    }
    else if (t.kind == Token::BlockText) {
        next();
        expectNewline();
        open(Frame::RawText, &element -> children, NULL);
        return;
    }
    else if (t.kind == Token::BufferedEcho) {
        next();
        element -> children.push_back(echoText(pool, t));
    }
    else if (t.kind == Token::TextLiteral || t.kind == Token::Interpolation) {
        Text* text = pool -> make<Text>(t.pos);
        std::vector<Segment> segments;
        collectSegments(segments);
        for (Segment& seg : segments) {
            text -> append(seg);
        }
        element -> children.push_back(text);
    }
    expectNewline();
    open(Frame::Normal, &element -> children, element);
}

void Parser::mixinCall() {
    Token& t = next();
    MixinCall* call = pool -> make<MixinCall>(t.lexeme, t.pos);
    call -> args = splitArguments(t.arg, t.pos);
    stack.back().children -> push_back(call);
    expectNewline();
    open(Frame::Normal, &call -> blockContent, call);
}

void Parser::keyword() {
    Token& t = next();
    std::string& word = t.lexeme;
    std::vector<Node*>* children = stack.back().children;
    Node* last = children != NULL && children -> size() > 0 ? children -> back() : NULL; // a case body has no child list of its own
    if (word == "if" || word == "unless") {
        Conditional* cond = pool -> make<Conditional>(t.pos);
        Branch branch;
        branch.expr = t.arg;
        branch.negated = word == "unless";
        branch.pos = t.pos;
        cond -> branches.push_back(branch);
        children -> push_back(cond);
        expectNewline();
        open(Frame::Normal, &cond -> branches.back().body, cond);
    }
    else if (word == "else if" || word == "else") {
        if (last != NULL && last -> type == Node::CONDITIONAL && !((Conditional*)last) -> hasElse) {
            Conditional* cond = (Conditional*)last;
            expectNewline();
            if (word == "else if") {
                Branch branch;
                branch.expr = t.arg;
                branch.pos = t.pos;
                cond -> branches.push_back(branch);
                open(Frame::Normal, &cond -> branches.back().body, cond);
            }
            else {
                cond -> hasElse = true;
                open(Frame::Normal, &cond -> elseBody, cond);
            }
        }
        else if (word == "else" && last != NULL && last -> type == Node::EACH && !((Each*)last) -> hasElse) {
            Each* each = (Each*)last;
            expectNewline();
            each -> hasElse = true;
            open(Frame::Normal, &each -> elseBody, each);
        }
        else {
            throw SyntaxError(t.pos, word == "else" ? "an if, unless or each right before this else" : "an if or unless right before this else if", "'" + word + "' without a matching construct at this depth");
        }
    }
    else if (word == "each") {
        size_t in = t.arg.find(" in ");
        if (in == std::string::npos) {
            throw SyntaxError(t.pos, "'item in expression'");
        }
        Each* each = pool -> make<Each>(t.pos);
        std::string vars = t.arg.substr(0, in);
        each -> expr = trim(t.arg.substr(in + 4));
        size_t comma = vars.find(',');
        each -> itemVar = trim(vars.substr(0, comma));
        if (comma != std::string::npos) {
            each -> indexVar = trim(vars.substr(comma + 1));
        }
        for (std::string* name : { &each -> itemVar, &each -> indexVar }) {
            for (size_t i = 0; i < name -> size(); i ++) {
                if (!(i == 0 ? isIdentStart((*name)[i]) : isIdentChar((*name)[i]))) {
                    throw SyntaxError(t.pos, "a variable name", "'" + *name + "' isn't a valid loop variable name");
                }
            }
        }
        if (each -> itemVar.size() == 0 || each -> expr.size() == 0 || (comma != std::string::npos && each -> indexVar.size() == 0)) {
            throw SyntaxError(t.pos, "'item in expression'");
        }
        children -> push_back(each);
        expectNewline();
        open(Frame::Normal, &each -> body, each);
    }
    else if (word == "while") {
        While* loop = pool -> make<While>(t.arg, t.pos);
        children -> push_back(loop);
        expectNewline();
        open(Frame::Normal, &loop -> body, loop);
    }
    else if (word == "case") {
        Case* node = pool -> make<Case>(t.pos);
        node -> subject = t.arg;
        children -> push_back(node);
        expectNewline();
        open(Frame::CaseBody, NULL, node);
    }
    else if (word == "when" || word == "default") {
        Frame& frame = stack.back();
        if (frame.kind != Frame::CaseBody) {
            throw SyntaxError(t.pos, "a case around this " + word, "'" + word + "' outside of a case");
        }
        Case* node = (Case*)frame.owner;
        expectNewline();
        if (word == "when") {
            When when;
            when.values = splitArguments(t.arg, t.pos);
            when.pos = t.pos;
            node -> whens.push_back(when);
            open(Frame::Normal, &node -> whens.back().body, node);
        }
        else {
            if (node -> hasDefault) {
                throw SyntaxError(t.pos, "at most one default per case", "duplicate default");
            }
            node -> hasDefault = true;
            open(Frame::Normal, &node -> defaultBody, node);
        }
    }
    else if (word == "mixin") {
        MapView decl = MapView::fromString(t.arg);
        size_t n = 0;
        while (isNameChar(decl[n])) {
            n ++;
        }
        if (n == 0) {
            throw SyntaxError(t.pos, "a mixin name");
        }
        MixinDef* def = pool -> make<MixinDef>(decl.slice(0, n).toString(), t.pos);
        std::string params;
        if (decl[n] == '(') {
            size_t close = Tokenizer::scanBalanced(decl, n);
            if (close == std::string::npos) {
                throw SyntaxError(t.pos, "closing ')' for the mixin parameters", "unbalanced parenthesis in mixin declaration");
            }
            params = decl.slice(n + 1, close - n - 1).toString();
            n = close + 1;
        }
        if (trim((decl + n).toString()).size() > 0) {
            throw SyntaxError(t.pos, "end of line after the mixin parameters");
        }
        for (std::string& raw : splitArguments(params, t.pos)) {
            Param param;
            std::string p = raw;
            if (p.compare(0, 3, "...") == 0) {
                param.rest = true;
                p = trim(p.substr(3));
            }
            size_t eq = p.find('=');
            if (eq != std::string::npos) {
                param.hasDefault = true;
                param.defaultExpr = trim(p.substr(eq + 1));
                p = trim(p.substr(0, eq));
            }
            param.name = p;
            bool valid = p.size() > 0 && isIdentStart(p[0]) && !(param.rest && param.hasDefault);
            for (char c : p) {
                valid = valid && isIdentChar(c);
            }
            if (!valid) {
                throw SyntaxError(t.pos, "a parameter name", "bad mixin parameter '" + raw + "'");
            }
            if (def -> params.size() > 0 && def -> params.back().rest) {
                throw SyntaxError(t.pos, "the rest parameter last", "nothing can follow a ...rest parameter");
            }
            def -> params.push_back(param);
        }
        children -> push_back(def);
        expectNewline();
        open(Frame::Normal, &def -> body, def);
    }
    else if (word == "block") {
        Block::Mode mode = Block::Default;
        std::string name = t.arg;
        size_t space = name.find(' ');
        std::string first = name.substr(0, space);
        if (space != std::string::npos && (first == "append" || first == "prepend" || first == "replace")) {
            mode = first == "append" ? Block::Append : (first == "prepend" ? Block::Prepend : Block::Replace);
            name = trim(name.substr(space + 1));
        }
        for (char c : name) {
            if (!isNameChar(c)) {
                throw SyntaxError(t.pos, "a block name", "'" + name + "' isn't a valid block name");
            }
        }
        if (name.size() > 0) {
            for (std::string& seen : blockNames) {
                if (seen == name) {
                    throw SyntaxError(t.pos, "a unique block name", "block '" + name + "' is declared twice in this file");
                }
            }
            blockNames.push_back(name);
        }
        Block* block = pool -> make<Block>(name, mode, t.pos);
        children -> push_back(block);
        expectNewline();
        open(Frame::Normal, &block -> content, block);
    }
    else if (word == "extends") {
        bool first = stack.size() == 1 && tpl.extends == NULL;
        for (Node* node : tpl.nodes) {
            if (node -> type != Node::COMMENT || ((Comment*)node) -> visible) {
                first = false;
            }
        }
        if (!first) {
            throw SyntaxError(t.pos, "extends as the first thing in the file", "extends must come before everything else, at the top level");
        }
        tpl.extends = pool -> make<Extends>(t.arg, t.pos);
        expectNewline();
    }
    else if (word == "include") {
        children -> push_back(pool -> make<Include>(t.arg, t.filter, t.pos));
        expectNewline();
    }
    else {
        throw SyntaxError(t.pos, "a keyword", "unknown keyword '" + word + "'");
    }
}

std::vector<std::string> Parser::splitArguments(const std::string& list, const Position& at) {
    std::vector<std::string> ret;
    if (trim(list).size() == 0) {
        return ret;
    }
    std::string current;
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < list.size(); i ++) {
        char c = list[i];
        if (quote != 0) {
            current += c;
            if (c == '\\' && i + 1 < list.size()) {
                current += list[++ i];
            }
            else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
        }
        else if (c == '(' || c == '[' || c == '{') {
            depth ++;
        }
        else if (c == ')' || c == ']' || c == '}') {
            depth --;
        }
        else if (c == ',' && depth == 0) {
            ret.push_back(trim(current));
            current.clear();
            continue;
        }
        current += c;
    }
    ret.push_back(trim(current));
    for (std::string& arg : ret) {
        if (arg.size() == 0) {
            throw SyntaxError(at, "an expression between the commas", "empty argument");
        }
    }
    return ret;
}

static bool isOperatorChar(char c) {
    return c == '+' || c == '-' || c == '*' || c == '/' || c == '%' || c == '<' || c == '>' || c == '=' || c == '&' || c == '|' || c == '?' || c == '.';
}

static size_t scanAttributeValue(const std::string& s, size_t i) { // end of the expression starting at i
    int depth = 0;
    bool ternary = false; // a top-level ? is waiting for its :
    size_t n = s.size();
    while (i < n) {
        char c = s[i];
        if (c == '\'' || c == '"' || c == '`') {
            i ++;
            while (i < n && s[i] != c) {
                if (s[i] == '\\') {
                    i ++;
                }
                i ++;
            }
            i ++;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') {
            depth ++;
        }
        else if (c == ')' || c == ']' || c == '}') {
            depth --;
        }
        else if (depth == 0) {
            if (c == ',') {
                return i;
            }
            if (c == '?') {
                ternary = true;
            }
            if (c == ':') {
                ternary = false;
            }
            if (isWhitespace(c)) { // whitespace ends the value unless the expression obviously carries on
                size_t before = i;
                while (before > 0 && isWhitespace(s[before - 1])) {
                    before --;
                }
                size_t after = i;
                while (after < n && isWhitespace(s[after])) {
                    after ++;
                }
                if (after >= n) {
                    return after;
                }
                char prev = before > 0 ? s[before - 1] : 0;
                char nextChar = s[after];
                bool continues = isOperatorChar(prev) || prev == '!' || prev == ':' || isOperatorChar(nextChar) || (nextChar == '!' && after + 1 < n && s[after + 1] == '=') || (nextChar == ':' && ternary);
                if (!continues) {
                    return i;
                }
                i = after;
                continue;
            }
        }
        i ++;
    }
    return n;
}

void Parser::parseAttributes(const std::string& list, const Position& at, Element* element) {
    size_t n = list.size();
    size_t i = 0;
    while (true) {
        while (i < n && (isWhitespace(list[i]) || list[i] == ',')) {
            i ++;
        }
        if (i >= n) {
            break;
        }
        Attribute attr;
        attr.pos = shifted(at, i);
        if (list[i] == '\'' || list[i] == '"') { // quoted names, for things like '(click)'
            char quote = list[i];
            size_t close = list.find(quote, i + 1);
            if (close == std::string::npos) {
                throw SyntaxError(attr.pos, "a closing quote for the attribute name");
            }
            attr.name = list.substr(i + 1, close - i - 1);
            i = close + 1;
        }
        else {
            size_t start = i;
            while (i < n && !isWhitespace(list[i]) && list[i] != '=' && list[i] != ',' && !(list[i] == '!' && i + 1 < n && list[i + 1] == '=')) {
                i ++;
            }
            attr.name = list.substr(start, i - start);
        }
        if (attr.name.size() == 0) {
            throw SyntaxError(attr.pos, "an attribute name", std::string("unexpected '") + list[i] + "' in attribute list");
        }
        size_t look = i;
        while (look < n && isWhitespace(list[look])) {
            look ++;
        }
        if (look < n && (list[look] == '=' || (list[look] == '!' && look + 1 < n && list[look + 1] == '='))) {
            attr.escaped = list[look] == '=';
            i = look + (attr.escaped ? 1 : 2);
            while (i < n && isWhitespace(list[i])) {
                i ++;
            }
            size_t end = scanAttributeValue(list, i);
            attr.expr = trim(list.substr(i, end - i));
            if (attr.expr.size() == 0) {
                throw SyntaxError(shifted(at, i), "a value for attribute " + attr.name);
            }
            char q = attr.expr[0];
            bool quoted = false; // a single string literal, start to end
            if (q == '\'' || q == '"' || q == '`') {
                size_t j = 1;
                while (j < attr.expr.size() && attr.expr[j] != q) {
                    if (attr.expr[j] == '\\') {
                        j ++;
                    }
                    j ++;
                }
                quoted = j == attr.expr.size() - 1;
            }
            if (quoted && (attr.expr.find("#{") != std::string::npos || attr.expr.find("!{") != std::string::npos)) {
                std::vector<Token> spans;
                Tokenizer::scanText(MapView::fromString(attr.expr.substr(1, attr.expr.size() - 2)), shifted(at, i + 1), spans);
                attr.interpolated = true;
                for (Token& span : spans) {
                    Segment seg;
                    seg.isExpr = span.kind == Token::Interpolation;
                    seg.text = span.lexeme;
                    seg.escaped = !span.raw;
                    seg.pos = span.pos;
                    attr.segments.push_back(seg);
                }
            }
            i = end;
        }
        else {
            attr.boolean = true;
        }
        element -> attributes.push_back(attr);
    }
}
