#include <util.hpp>
#include <vector>
#include <cmath>
#include <cstdlib>
// definitions for util functions

bool isWhitespace(char thing) {
    return thing == ' ' || thing == '\t' || thing == '\n' || thing == '\r';
}

bool isIdentStart(char thing) {
    return (thing >= 'a' && thing <= 'z') || (thing >= 'A' && thing <= 'Z') || thing == '_' || thing == '$';
}

bool isIdentChar(char thing) {
    return isIdentStart(thing) || (thing >= '0' && thing <= '9');
}

bool isNameChar(char thing) {
    return isIdentChar(thing) || thing == '-' || thing == ':';
}

std::string trim(std::string thing) {
    size_t start = 0;
    while (start < thing.size() && isWhitespace(thing[start])) {
        start ++;
    }
    size_t end = thing.size();
    while (end > start && isWhitespace(thing[end - 1])) {
        end --;
    }
    return thing.substr(start, end - start);
}

std::string escapeHtml(const std::string& thing) {
    std::string ret;
    ret.reserve(thing.size());
    for (char c : thing) {
        switch (c) {
            case '&':
                ret += "&amp;";
                break;
            case '<':
                ret += "&lt;";
                break;
            case '>':
                ret += "&gt;";
                break;
            case '"':
                ret += "&quot;";
                break;
            default:
                ret += c;
        }
    }
    return ret;
}

std::string numberToString(double number) {
    if (std::isnan(number)) {
        return "NaN";
    }
    if (std::isinf(number)) {
        return number > 0 ? "Infinity" : "-Infinity";
    }
    if (number == 0) {
        return "0"; // also catches -0
    }
    if (std::fabs(number) < 1e15 && number == std::floor(number)) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%.0f", number);
        return buf;
    }
    char buf[40];
    for (int precision = 1; precision <= 17; precision ++) { // shortest form that reads back to the same double
        snprintf(buf, sizeof(buf), "%.*g", precision, number);
        if (strtod(buf, NULL) == number) {
            break;
        }
    }
    return buf;
}

std::string fconcat(std::string one, std::string two) {
    if (one.size() == 0) {
        return two;
    }
    if (two.size() == 0) {
        return one;
    }
    if (one[one.size() - 1] == '/' && two[0] == '/') {
        return one.substr(0, one.size() - 1) + two;
    }
    else if (one[one.size() - 1] == '/' || two[0] == '/') {
        return one + two;
    }
    else {
        return one + '/' + two;
    }
}

std::string trim2dir(std::string file) {
    size_t slash = file.rfind('/');
    if (slash == std::string::npos) {
        return "";
    }
    return file.substr(0, slash + 1);
}

std::string normalizePath(std::string path) {
    bool absolute = path.size() > 0 && path[0] == '/';
    std::vector<std::string> segments;
    size_t i = 0;
    while (i <= path.size()) {
        size_t next = path.find('/', i);
        if (next == std::string::npos) {
            next = path.size();
        }
        std::string seg = path.substr(i, next - i);
        if (seg == "..") {
            if (segments.size() > 0) { // climbing past the template root just stays at the root
                segments.pop_back();
            }
        }
        else if (seg != "." && seg.size() > 0) {
            segments.push_back(seg);
        }
        i = next + 1;
    }
    std::string ret = absolute ? "/" : "";
    for (size_t s = 0; s < segments.size(); s ++) {
        if (s > 0) {
            ret += '/';
        }
        ret += segments[s];
    }
    return ret;
}

bool hasExtension(const std::string& path) {
    size_t slash = path.rfind('/');
    size_t dot = path.rfind('.');
    if (dot == std::string::npos) {
        return false;
    }
    return slash == std::string::npos || dot > slash + 1; // a dotfile like ".pug" alone has no extension
}

bool endsWith(const std::string& thing, const std::string& tail) {
    return thing.size() >= tail.size() && thing.compare(thing.size() - tail.size(), tail.size(), tail) == 0;
}
