#include <mapview.hpp>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/mman.h>
#include <unistd.h>
#include <cstring>


MapView::MapView(Backing* b) : backing(b), start(0), end(b -> size) {}

MapView::MapView(std::string filename) : MapView(new Backing) {
    backing -> fd = open(filename.c_str(), O_RDONLY);
    if (backing -> fd == -1) {
        return;
    }
    struct stat sb;
    if (fstat(backing -> fd, &sb) != 0 || sb.st_size == 0) {
        return;
    }
    void* mm = mmap(NULL, sb.st_size, PROT_READ, MAP_SHARED, backing -> fd, 0);
    if (mm == MAP_FAILED) {
        return;
    }
    backing -> bytes = (char*)mm;
    backing -> size = sb.st_size;
    end = backing -> size;
}

MapView MapView::fromString(const std::string& data) {
    Backing* b = new Backing;
    b -> bytes = new char[data.size() + 1];
    memcpy(b -> bytes, data.c_str(), data.size() + 1);
    b -> size = data.size();
    b -> heap = true;
    return MapView(b);
}

MapView::MapView(const MapView& m) : backing(m.backing), start(m.start), end(m.end) {
    backing -> refs ++;
}

MapView& MapView::operator=(const MapView& m) {
    m.backing -> refs ++; // before drop(), in case both views share a backing
    drop();
    backing = m.backing;
    start = m.start;
    end = m.end;
    return *this;
}

MapView::~MapView() {
    drop();
}

void MapView::drop() {
    if (-- backing -> refs > 0) {
        return;
    }
    if (backing -> bytes != NULL) {
        if (backing -> heap) {
            delete[] backing -> bytes;
        }
        else {
            munmap(backing -> bytes, backing -> size);
        }
    }
    if (backing -> fd != -1) {
        close(backing -> fd);
    }
    delete backing;
}

bool MapView::isValid() {
    return backing -> bytes != NULL;
}

char MapView::operator[](int64_t n) {
    int64_t length = len();
    if (n < 0) {
        n += length;
    }
    if (n < 0 || n >= length) {
        return 0;
    }
    return backing -> bytes[start + n];
}

void MapView::operator++(int) {
    *this += 1;
}

void MapView::operator+=(size_t n) {
    start = start + n > end ? end : start + n;
}

MapView MapView::operator+(size_t shift) {
    MapView ret(*this);
    ret += shift;
    return ret;
}

int64_t MapView::len() {
    return end - start;
}

MapView MapView::slice(size_t from, size_t count) {
    MapView ret(*this);
    ret += from;
    if (ret.start + count < ret.end) {
        ret.end = ret.start + count;
    }
    return ret;
}

std::string MapView::toString() {
    if (!isValid()) {
        return "";
    }
    return std::string(backing -> bytes + start, end - start);
}

bool MapView::cmp(const char* text, size_t at) {
    size_t n = strlen(text);
    if (at + n > (size_t)len()) {
        return false;
    }
    return memcmp(backing -> bytes + start + at, text, n) == 0;
}

MapView MapView::consume(char until, bool escapeState, bool doesEscape) {
    MapView ret(*this);
    while (start < end) {
        char c = backing -> bytes[start];
        if (escapeState) {
            escapeState = false;
        }
        else if (c == '\\' && doesEscape) {
            escapeState = true;
        }
        else if (c == until) {
            break;
        }
        start ++;
    }
    ret.end = start;
    return ret;
}

char MapView::popFront() {
    if (end == start) {
        return 0;
    }
    end --;
    return backing -> bytes[end];
}
