// Tokenizer turns template source into a flat token stream. It owns all of the indentation bookkeeping:
// the parser never looks at whitespace, it only sees Indent and Dedent tokens.
#pragma once
#include <string>
#include <vector>
#include <defs.h>
#include <mapview.hpp>
#include <token.hpp>


struct Tokenizer {
    MapView source;
    std::string file;
    std::vector<Token> tokens;
    std::string unit; // the indentation unit (some spaces, or one tab); empty until the first indented line fixes it
    int depth = 0;

    Tokenizer(MapView src, std::string filename);

    std::vector<Token> tokenize(); // throws SyntaxError / IndentationError

    static size_t scanBalanced(MapView& text, size_t open); // index of the bracket closing the one at `open`, or npos
    // quotes, parens, braces and brackets all nest, so `#{ fn({a: ")"}) }` closes where you'd expect

    static void scanText(MapView text, Position start, std::vector<Token>& out); // split text into TextLiteral + Interpolation tokens

private:
    // raw blocks: the deeper lines under `tag.` or a `//` comment aren't tokenized as template lines
    bool rawPending = false; // the previous line opened a raw block
    bool inRaw = false; // we've emitted the raw block's Indent
    bool rawInterpolates = false; // block text interpolates, comment bodies don't
    size_t rawOwnerWidth = 0; // indentation width (in characters) of the line that opened the raw block
    size_t rawBase = 0; // indentation width of the first raw line, stripped from every raw line
    int blankRun = 0; // blank lines seen inside a raw block, only kept if more raw text follows

    MapView remaining; // source not yet split into lines
    int lineNumber = 0;
    bool finished = false; // the last line has been handed out

    MapView nextLine(); // the next line without its newline (or \r\n)

    void line(MapView ln, int number);

    bool rawLine(MapView& ln, size_t width, bool blank, int number); // returns true if the line was consumed as raw text

    int measure(MapView ws, int number);

    void content(MapView body, int number, size_t col);

    void keyword(std::string word, MapView rest, Position p);

    void mixinCall(MapView body, Position p);

    void echo(MapView body, size_t i, Position p); // = or != at body[i]; p is where body starts

    void code(MapView rest, Position p);

    void tagLine(MapView body, int number, size_t col);

    void openRaw(size_t ownerWidth, bool interpolates);

    void emit(Token::Kind kind, std::string lexeme, Position p);
};
