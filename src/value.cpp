#include <value.hpp>
#include <util.hpp>
#include <cmath>


Value::Value(bool b) : type(Boolean), boolean(b) {}

Value::Value(int n) : type(Number), number(n) {}

Value::Value(double n) : type(Number), number(n) {}

Value::Value(const char* s) : type(String), string(s) {}

Value::Value(std::string s) : type(String), string(s) {}

Value Value::makeList(std::vector<Value> items) {
    Value ret;
    ret.type = List;
    ret.list = items;
    return ret;
}

Value Value::makeMap(std::vector<std::pair<std::string, Value>> entries) {
    Value ret;
    ret.type = Map;
    for (auto& entry : entries) {
        ret.set(entry.first, entry.second); // duplicate keys collapse, last one wins
    }
    return ret;
}

bool Value::truthyness() const {
    switch (type) {
        case Null:
            return false;
        case Boolean:
            return boolean;
        case Number:
            return number != 0 && !std::isnan(number);
        case String:
            return string.size() > 0;
        case List:
            return list.size() > 0;
        case Map:
            return map.size() > 0;
    }
    return false;
}

bool Value::equals(const Value& other) const {
    if (other.type != type) {
        return false;
    }
    switch (type) {
        case Null:
            return true;
        case Boolean:
            return boolean == other.boolean;
        case Number:
            return number == other.number;
        case String:
            return string == other.string;
        case List:
            if (list.size() != other.list.size()) {
                return false;
            }
            for (size_t i = 0; i < list.size(); i ++) {
                if (!list[i].equals(other.list[i])) {
                    return false;
                }
            }
            return true;
        case Map:
            if (map.size() != other.map.size()) {
                return false;
            }
            for (auto& entry : map) {
                const Value* theirs = other.get(entry.first);
                if (theirs == NULL || !entry.second.equals(*theirs)) {
                    return false;
                }
            }
            return true;
    }
    return false;
}

bool Value::stringify(std::string& out) const {
    switch (type) {
        case Null:
            out = "";
            return true;
        case Boolean:
            out = boolean ? "true" : "false";
            return true;
        case Number:
            out = numberToString(number);
            return true;
        case String:
            out = string;
            return true;
        default:
            return false;
    }
}

const Value* Value::get(const std::string& key) const {
    for (auto& entry : map) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return NULL;
}

void Value::set(const std::string& key, Value v) {
    for (auto& entry : map) {
        if (entry.first == key) {
            entry.second = v;
            return;
        }
    }
    map.push_back({ key, v });
}

void Value::push(Value v) {
    list.push_back(v);
}

size_t Value::size() const {
    if (type == String) {
        return string.size();
    }
    if (type == List) {
        return list.size();
    }
    if (type == Map) {
        return map.size();
    }
    return 0;
}

const char* Value::typeName() const {
    switch (type) {
        case Null:
            return "null";
        case Boolean:
            return "boolean";
        case Number:
            return "number";
        case String:
            return "string";
        case List:
            return "list";
        case Map:
            return "map";
    }
    return "unknown";
}
