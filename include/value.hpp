// Value is the only data type that crosses the evaluator boundary: template variables go in as Values, expression results come out as Values.
#pragma once
#include <string>
#include <vector>
#include <utility>
#include <defs.h>


struct Value {
    enum Type : int {
        Null    = 1,
        Boolean = 2,
        Number  = 4,
        String  = 8,
        List    = 16,
        Map     = 32
    } type = Null; // bitbangable, so callers can test against several types at once

    bool boolean = false;
    double number = 0;
    std::string string;
    std::vector<Value> list;
    std::vector<std::pair<std::string, Value>> map; // insertion order is iteration order

    Value() = default;

    Value(bool b);

    Value(int n);

    Value(double n);

    Value(const char* s);

    Value(std::string s);

    static Value makeList(std::vector<Value> items = {});

    static Value makeMap(std::vector<std::pair<std::string, Value>> entries = {});

    bool truthyness() const; // false, null, 0, NaN, "", [] and {} are falsey

    bool equals(const Value& other) const; // strict, structural equality

    bool stringify(std::string& out) const; // canonical text form; returns false for lists and maps, which have none

    const Value* get(const std::string& key) const; // map lookup, NULL if missing

    void set(const std::string& key, Value v); // map insert-or-replace (keeps the original position)

    void push(Value v); // list append

    size_t size() const; // length of a string, list or map

    const char* typeName() const;
};
