// ZpugWriter is the only thing the renderer writes through. It owns pretty-mode layout, so nodes never emit whitespace of their own.
#pragma once
#include <string>
#include <cstddef>


struct WriteOutput {
    virtual ~WriteOutput() = default;

    virtual void write(const char* data, size_t length) = 0;
};


struct StringWriteOutput : WriteOutput {
    std::string content;

    void write(const char* data, size_t length);
};


struct ZpugWriter {
    WriteOutput& output;
    bool pretty = false;
    std::string indentString = "  ";
    bool written = false; // has anything gone out yet? the first line of pretty output doesn't get a leading newline

    ZpugWriter(WriteOutput& out);

    void beginLine(int depth); // pretty mode: newline + indentation. compact mode: nothing.

    void write(const char* data, size_t length);

    void write(std::string data);
};
