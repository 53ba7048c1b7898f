#pragma once
#include <string>


struct Position {
    std::string file;
    int line = 0; // 1-based, 0 means "no position"
    int column = 0; // 1-based

    Position() = default;

    Position(std::string f, int l, int c) : file(f), line(l), column(c) {}

    std::string toString() const; // file:line:column
};
