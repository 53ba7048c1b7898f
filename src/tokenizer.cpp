#include <tokenizer.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <cstring>


static const char* keywords[] = { "if", "unless", "else", "each", "while", "case", "when", "default", "mixin", "block", "append", "prepend", "extends", "include" };


const char* Token::kindName() const {
    static const char* names[] = { "tag", "class shorthand", "id shorthand", "attribute list", "self-close", "block text", "text", "interpolation",
        "buffered code", "code", "keyword", "mixin call", "comment", "doctype", "piped text", "newline", "indent", "dedent", "end of file" };
    return names[kind];
}


Tokenizer::Tokenizer(MapView src, std::string filename) : source(src), file(filename), remaining(src) {}

void Tokenizer::emit(Token::Kind kind, std::string lexeme, Position p) {
    tokens.push_back(Token(kind, lexeme, p));
}

MapView Tokenizer::nextLine() {
    lineNumber ++;
    MapView ln = remaining.consume('\n', false, false); // no escaping: backslashes mean nothing at line level
    if (remaining.len() == 0) {
        finished = true;
    }
    else {
        remaining ++; // eat the newline
    }
    if (ln.len() > 0 && ln[-1] == '\r') {
        ln.popFront();
    }
    return ln;
}

std::vector<Token> Tokenizer::tokenize() {
    while (!finished) {
        MapView ln = nextLine();
        line(ln, lineNumber);
    }
    Position end(file, lineNumber + 1, 1);
    if (inRaw) {
        emit(Token::Dedent, "", end);
    }
    while (depth > 0) {
        emit(Token::Dedent, "", end);
        depth --;
    }
    emit(Token::Eof, "", end);
    return tokens;
}

void Tokenizer::openRaw(size_t ownerWidth, bool interpolates) {
    rawPending = true;
    rawInterpolates = interpolates;
    rawOwnerWidth = ownerWidth;
    blankRun = 0;
}

bool Tokenizer::rawLine(MapView& ln, size_t width, bool blank, int number) {
    if (blank) {
        if (inRaw) {
            blankRun ++;
        }
        return true; // blank lines never close a raw block on their own
    }
    if (width <= rawOwnerWidth) { // back out at (or above) the owner: the raw block is over
        if (inRaw) {
            emit(Token::Dedent, "", Position(file, number, 1));
        }
        inRaw = false;
        rawPending = false;
        blankRun = 0;
        return false;
    }
    if (!inRaw) {
        inRaw = true;
        rawPending = false;
        rawBase = width;
        emit(Token::Indent, "", Position(file, number, 1));
    }
    for (; blankRun > 0; blankRun --) {
        emit(Token::TextLiteral, "", Position(file, number, 1));
        emit(Token::Newline, "", Position(file, number, 1));
    }
    size_t strip = width < rawBase ? width : rawBase;
    MapView text = ln + strip;
    if (rawInterpolates) {
        scanText(text, Position(file, number, strip + 1), tokens);
    }
    else {
        emit(Token::TextLiteral, text.toString(), Position(file, number, strip + 1));
    }
    emit(Token::Newline, "", Position(file, number, ln.len() + 1));
    return true;
}

void Tokenizer::line(MapView ln, int number) {
    size_t width = 0;
    while ((int64_t)width < ln.len() && (ln[width] == ' ' || ln[width] == '\t')) {
        width ++;
    }
    bool blank = (int64_t)width == ln.len();
    if (rawPending || inRaw) {
        if (rawLine(ln, width, blank, number)) {
            return;
        }
    }
    if (blank) {
        return;
    }
    int level = measure(ln.slice(0, width), number);
    if (level > depth + 1) {
        throw IndentationError(Position(file, number, width + 1), "indentation jumps " + std::to_string(level - depth) + " levels at once; nest one level at a time");
    }
    if (level == depth + 1) {
        emit(Token::Indent, "", Position(file, number, 1));
    }
    for (int d = depth; d > level; d --) {
        emit(Token::Dedent, "", Position(file, number, 1));
    }
    depth = level;
    content(ln + width, number, width + 1);
    emit(Token::Newline, "", Position(file, number, ln.len() + 1));
}

int Tokenizer::measure(MapView ws, int number) {
    if (ws.len() == 0) {
        return 0;
    }
    char c = ws[0];
    for (int64_t i = 1; i < ws.len(); i ++) {
        if (ws[i] != c) {
            throw IndentationError(Position(file, number, i + 1), "tabs and spaces are mixed in this line's indentation");
        }
    }
    if (unit.size() == 0) { // first indented line in the file: this is the unit from now on
        unit = c == '\t' ? "\t" : ws.toString();
    }
    if (c != unit[0]) {
        throw IndentationError(Position(file, number, 1), unit[0] == '\t' ? "this file is indented with tabs, but this line uses spaces" : "this file is indented with spaces, but this line uses tabs");
    }
    if (ws.len() % unit.size() != 0) {
        throw IndentationError(Position(file, number, ws.len() + 1), "indentation of " + std::to_string(ws.len()) + " is not a multiple of the " + std::to_string(unit.size()) + "-space unit this file started with");
    }
    return ws.len() / unit.size();
}

void Tokenizer::content(MapView body, int number, size_t col) {
    Position p(file, number, col);
    if (body.cmp("//-")) {
        Token t(Token::Comment, (body + 3).toString(), p);
        t.raw = true;
        tokens.push_back(t);
        openRaw(col - 1, false);
        return;
    }
    if (body.cmp("//")) {
        emit(Token::Comment, (body + 2).toString(), p);
        openRaw(col - 1, false);
        return;
    }
    if (body[0] == '|') {
        emit(Token::Pipe, "", p);
        MapView text = body + 1;
        size_t skip = text[0] == ' ' ? 1 : 0;
        scanText(text + skip, Position(file, number, col + 1 + skip), tokens);
        return;
    }
    if (body[0] == '<') { // a line of literal html passes straight through
        emit(Token::Pipe, "", p);
        scanText(body, p, tokens);
        return;
    }
    if (body[0] == '=' || body.cmp("!=")) { // a line that's nothing but buffered code
        echo(body, 0, p);
        return;
    }
    if (body[0] == '-' && (body[1] == 0 || body[1] == ' ' || body[1] == '\t')) {
        code(body + 1, p);
        return;
    }
    if (body[0] == '+' && isIdentStart(body[1])) {
        mixinCall(body, p);
        return;
    }
    size_t n = 0;
    while (isIdentChar(body[n])) {
        n ++;
    }
    std::string word = body.slice(0, n).toString();
    char next = body[n];
    if (word == "doctype" && (next == 0 || next == ' ' || next == '\t')) {
        std::string kind = trim((body + n).toString());
        emit(Token::Doctype, kind.size() > 0 ? kind : "html", p);
        return;
    }
    for (const char* kw : keywords) {
        if (word == kw && (next == 0 || next == ' ' || next == '\t' || (word == "include" && next == ':'))) {
            keyword(word, body + n, p);
            return;
        }
    }
    tagLine(body, number, col);
}

void Tokenizer::keyword(std::string word, MapView rest, Position p) {
    std::string filter;
    if (word == "include" && rest[0] == ':') {
        rest ++;
        size_t f = 0;
        while (isNameChar(rest[f])) {
            f ++;
        }
        filter = rest.slice(0, f).toString();
        if (filter.size() == 0) {
            throw SyntaxError(p, "a filter name after 'include:'");
        }
        rest += f;
    }
    std::string arg = trim(rest.toString());
    std::string lexeme = word;
    if (word == "else") {
        if (arg == "if" || arg.compare(0, 3, "if ") == 0 || arg.compare(0, 3, "if\t") == 0) {
            lexeme = "else if";
            arg = trim(arg.substr(2));
            if (arg.size() == 0) {
                throw SyntaxError(p, "a condition after 'else if'");
            }
        }
        else if (arg.size() > 0) {
            throw SyntaxError(p, "end of line after 'else'", "unexpected '" + arg + "' after 'else'");
        }
    }
    else if (word == "append" || word == "prepend") { // `append name` is shorthand for `block append name`
        if (arg.size() == 0) {
            throw SyntaxError(p, "a block name after '" + word + "'");
        }
        lexeme = "block";
        arg = word + " " + arg;
    }
    else if (word == "default") {
        if (arg.size() > 0) {
            throw SyntaxError(p, "end of line after 'default'");
        }
    }
    else if (word != "block" && arg.size() == 0) {
        static const char* wants[][2] = { { "if", "a condition" }, { "unless", "a condition" }, { "each", "'item in expression'" }, { "case", "an expression" },
            { "when", "a value" }, { "while", "a condition" }, { "mixin", "a mixin name" }, { "extends", "a template path" }, { "include", "a file path" } };
        for (auto& want : wants) {
            if (word == want[0]) {
                throw SyntaxError(p, std::string(want[1]) + " after '" + word + "'");
            }
        }
    }
    Token t(Token::Keyword, lexeme, p);
    t.arg = arg;
    t.filter = filter;
    tokens.push_back(t);
}

void Tokenizer::echo(MapView body, size_t i, Position p) {
    bool raw = body[i] == '!';
    Position at(p.file, p.line, p.column + i);
    std::string expr = trim((body + i + (raw ? 2 : 1)).toString());
    if (expr.size() == 0) {
        throw SyntaxError(at, std::string("an expression after '") + (raw ? "!=" : "=") + "'");
    }
    Token t(Token::BufferedEcho, expr, at);
    t.raw = raw;
    tokens.push_back(t);
}

void Tokenizer::code(MapView rest, Position p) {
    std::string line = trim(rest.toString());
    for (const char* decl : { "var ", "let ", "const " }) { // `- var x = 1` reads the same as `- x = 1`
        if (line.compare(0, strlen(decl), decl) == 0) {
            line = trim(line.substr(strlen(decl)));
        }
    }
    size_t n = 0;
    while (n < line.size() && (n == 0 ? isIdentStart(line[n]) : isIdentChar(line[n]))) {
        n ++;
    }
    size_t eq = n;
    while (eq < line.size() && isWhitespace(line[eq])) {
        eq ++;
    }
    if (n == 0 || eq >= line.size() || line[eq] != '=' || (eq + 1 < line.size() && line[eq + 1] == '=')) {
        throw SyntaxError(p, "'- name = expression'", "unbuffered code can only assign a variable");
    }
    std::string expr = trim(line.substr(eq + 1));
    if (expr.size() == 0) {
        throw SyntaxError(p, "an expression after '" + line.substr(0, n) + " ='");
    }
    Token t(Token::Code, line.substr(0, n), p);
    t.arg = expr;
    tokens.push_back(t);
}

void Tokenizer::mixinCall(MapView body, Position p) {
    size_t n = 1;
    while (isNameChar(body[n])) {
        n ++;
    }
    Token t(Token::MixinCall, body.slice(1, n - 1).toString(), p);
    if (body[n] == '(') {
        size_t close = scanBalanced(body, n);
        if (close == std::string::npos) {
            throw SyntaxError(Position(p.file, p.line, p.column + n), "closing ')' for the mixin arguments", "unbalanced parenthesis in mixin call");
        }
        t.arg = trim(body.slice(n + 1, close - n - 1).toString());
        n = close + 1;
    }
    if (trim((body + n).toString()).size() > 0) {
        throw SyntaxError(Position(p.file, p.line, p.column + n), "end of line after the mixin call");
    }
    tokens.push_back(t);
}

void Tokenizer::tagLine(MapView body, int number, size_t col) {
    auto at = [&](size_t i) { return Position(file, number, col + i); };
    size_t i = 0;
    if ((body[0] >= 'a' && body[0] <= 'z') || (body[0] >= 'A' && body[0] <= 'Z')) {
        while (isNameChar(body[i])) {
            i ++;
        }
        emit(Token::TagHead, body.slice(0, i).toString(), at(0));
    }
    else if ((body[0] == '.' || body[0] == '#') && isNameChar(body[1])) {
        emit(Token::TagHead, "div", at(0));
    }
    else {
        throw SyntaxError(at(0), "a tag, keyword, comment or text", std::string("unexpected '") + body[0] + "' at the start of a line");
    }
    bool hadId = false;
    while (true) {
        char c = body[i];
        if ((c == '.' || c == '#') && isNameChar(body[i + 1])) {
            if (c == '#') {
                if (hadId) {
                    throw SyntaxError(at(i), "at most one #id per tag", "a tag can only have one #id shorthand");
                }
                hadId = true;
            }
            size_t j = i + 1;
            while (isNameChar(body[j])) {
                j ++;
            }
            emit(c == '.' ? Token::ClassShorthand : Token::IdShorthand, body.slice(i + 1, j - i - 1).toString(), at(i));
            i = j;
        }
        else if (c == '(') {
            size_t close = scanBalanced(body, i);
            while (close == std::string::npos && !finished) { // the list carries on over the following lines
                std::string more = trim(nextLine().toString());
                body = MapView::fromString(body.toString() + " " + more);
                close = scanBalanced(body, i);
            }
            if (close == std::string::npos) {
                throw SyntaxError(at(i), "closing ')' for the attribute list", "unbalanced parenthesis in attribute list");
            }
            emit(Token::AttrList, body.slice(i + 1, close - i - 1).toString(), at(i + 1));
            i = close + 1;
        }
        else {
            break;
        }
    }
    std::string rest = (body + i).toString();
    char c = body[i];
    if (c == '/' && trim(rest.substr(1)).size() == 0) {
        emit(Token::SelfClose, "", at(i));
    }
    else if (c == '.' && trim(rest.substr(1)).size() == 0) {
        emit(Token::BlockText, "", at(i));
        openRaw(col - 1, true);
    }
    else if (body.cmp("!=", i) || c == '=') {
        echo(body, i, at(0));
    }
    else if (c == ' ' || c == '\t') {
        scanText(body + i + 1, at(i + 1), tokens);
    }
    else if (c != 0) {
        throw SyntaxError(at(i), "text, '=', '.', '/', '(' or end of line after the tag", std::string("unexpected '") + c + "' after the tag");
    }
}

size_t Tokenizer::scanBalanced(MapView& text, size_t open) {
    std::string closers;
    size_t n = text.len();
    for (size_t i = open; i < n; i ++) {
        char c = text[i];
        if (c == '\'' || c == '"' || c == '`') {
            i ++;
            while (i < n && text[i] != c) {
                if (text[i] == '\\') {
                    i ++;
                }
                i ++;
            }
            if (i >= n) {
                return std::string::npos;
            }
        }
        else if (c == '(' || c == '[' || c == '{') {
            closers += c == '(' ? ')' : (c == '[' ? ']' : '}');
        }
        else if (c == ')' || c == ']' || c == '}') {
            if (closers.size() == 0 || closers.back() != c) {
                return std::string::npos;
            }
            closers.pop_back();
            if (closers.size() == 0) {
                return i;
            }
        }
    }
    return std::string::npos;
}

void Tokenizer::scanText(MapView text, Position start, std::vector<Token>& out) {
    std::string buf;
    Position litPos = start;
    size_t n = text.len();
    size_t i = 0;
    auto flush = [&]() {
        if (buf.size() > 0) {
            out.push_back(Token(Token::TextLiteral, buf, litPos));
            buf.clear();
        }
    };
    while (i < n) {
        char c = text[i];
        if (c == '\\' && (text[i + 1] == '#' || text[i + 1] == '!') && text[i + 2] == '{') { // \#{ is a literal #{
            if (buf.size() == 0) {
                litPos = Position(start.file, start.line, start.column + i);
            }
            buf += text[i + 1];
            buf += '{';
            i += 3;
            continue;
        }
        if ((c == '#' || c == '!') && text[i + 1] == '{') {
            Position spanPos(start.file, start.line, start.column + i);
            size_t close = scanBalanced(text, i + 1);
            if (close == std::string::npos) {
                throw SyntaxError(spanPos, "closing '}' for the interpolation", "unterminated interpolation");
            }
            std::string expr = trim(text.slice(i + 2, close - i - 2).toString());
            if (expr.size() == 0) {
                throw SyntaxError(spanPos, "an expression inside the interpolation");
            }
            flush();
            Token t(Token::Interpolation, expr, spanPos);
            t.raw = c == '!';
            out.push_back(t);
            i = close + 1;
            continue;
        }
        if (buf.size() == 0) {
            litPos = Position(start.file, start.line, start.column + i);
        }
        buf += c;
        i ++;
    }
    flush();
}
