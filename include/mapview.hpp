// MapView is a cheap, copyable window onto template bytes. The bytes are either an mmapped file or a heap copy of a string;
// every view onto the same bytes shares one Backing, and the last view to go away unmaps (or frees) it.
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>


class MapView {
    struct Backing {
        char* bytes = NULL;
        size_t size = 0;
        int fd = -1; // only for mmapped files
        bool heap = false;
        int refs = 1;
    };

    Backing* backing;
    size_t start; // this view is bytes[start, end) of the backing
    size_t end;

    MapView(Backing* b);

    void drop();
public:
    MapView(std::string filename); // memory map a file. check isValid()!

    static MapView fromString(const std::string& data); // heap copy, always valid

    MapView(const MapView& m);

    MapView& operator=(const MapView& m);

    ~MapView();

    bool isValid(); // false when the file couldn't be opened (or was empty, which can't be mapped)

    char operator[](int64_t n); // negative indices count back from the end; out of range reads give 0

    void operator++(int); // drop one byte off the front

    void operator+=(size_t n);

    MapView operator+(size_t shift);

    int64_t len();

    MapView slice(size_t from, size_t count);

    std::string toString(); // copies

    bool cmp(const char* text, size_t at = 0); // do the bytes at `at` start with text?

    MapView consume(char until, bool escapeState = false, bool doesEscape = true);
    // split off everything up to (not including) the first unescaped `until`; this view is left starting at it

    char popFront(); // drop a byte off the end
};
