#include <evals/lua.hpp>
#include <errors.hpp>
#include <scope.hpp>
#include <util.hpp>
#include <cmath>


static int zpug_lookup(lua_State* L) { // __index on the expression environment: (table, key) -> the template variable, or else lua's own global
    LuaEvaluator* self = (LuaEvaluator*)lua_touserdata(L, lua_upvalueindex(1));
    if (self -> current != NULL && lua_type(L, 2) == LUA_TSTRING) {
        const Value* found = self -> current -> lookup(lua_tostring(L, 2));
        if (found != NULL) {
            LuaEvaluator::push(L, *found);
            return 1;
        }
    }
    lua_pushvalue(L, 2);
    lua_rawget(L, LUA_GLOBALSINDEX);
    return 1;
}


LuaEvaluator::LuaEvaluator() {
    lua = luaL_newstate();
    if (lua == NULL) {
        throw ZpugError("couldn't create a lua state");
    }
    luaL_openlibs(lua);
    lua_createtable(lua, 0, 0); // the environment every chunk runs in: template variables first, then _G
    lua_createtable(lua, 0, 1);
    lua_pushlightuserdata(lua, this);
    lua_pushcclosure(lua, zpug_lookup, 1);
    lua_setfield(lua, -2, "__index");
    lua_setmetatable(lua, -2);
    environment = luaL_ref(lua, LUA_REGISTRYINDEX);
}

LuaEvaluator::~LuaEvaluator() {
    lua_close(lua);
}

const char* LuaEvaluator::name() {
    return "lua";
}

Value LuaEvaluator::evaluate(const std::string& source, Scope* scope, const Position& at) {
    lua_settop(lua, 0);
    auto chunk = chunks.find(source);
    if (chunk == chunks.end()) {
        std::string toLua = "return " + source;
        if (luaL_loadbuffer(lua, toLua.c_str(), toLua.size(), "template expression") != 0) {
            std::string msg = lua_tostring(lua, -1);
            lua_settop(lua, 0);
            throw EvaluationError(at, "lua: " + msg, source);
        }
        lua_rawgeti(lua, LUA_REGISTRYINDEX, environment);
        lua_setfenv(lua, -2);
        chunks[source] = luaL_ref(lua, LUA_REGISTRYINDEX);
        chunk = chunks.find(source);
    }
    lua_rawgeti(lua, LUA_REGISTRYINDEX, chunk -> second);
    current = scope;
    int status = lua_pcall(lua, 0, 1, 0);
    current = NULL;
    if (status != 0) {
        std::string msg = lua_isstring(lua, -1) ? lua_tostring(lua, -1) : "error object isn't a string";
        lua_settop(lua, 0);
        throw EvaluationError(at, "lua: " + msg, source);
    }
    Value ret = pull(lua, -1, at, source);
    lua_settop(lua, 0);
    return ret;
}

void LuaEvaluator::push(lua_State* L, const Value& v) {
    switch (v.type) {
        case Value::Null:
            lua_pushnil(L);
            break;
        case Value::Boolean:
            lua_pushboolean(L, v.boolean);
            break;
        case Value::Number:
            lua_pushnumber(L, v.number);
            break;
        case Value::String:
            lua_pushlstring(L, v.string.c_str(), v.string.size());
            break;
        case Value::List:
            lua_createtable(L, v.list.size(), 0);
            for (size_t i = 0; i < v.list.size(); i ++) {
                push(L, v.list[i]);
                lua_rawseti(L, -2, i + 1); // lua counts from 1
            }
            break;
        case Value::Map:
            lua_createtable(L, 0, v.map.size());
            for (auto& entry : v.map) {
                push(L, entry.second);
                lua_setfield(L, -2, entry.first.c_str());
            }
            break;
    }
}

Value LuaEvaluator::pull(lua_State* L, int index, const Position& at, const std::string& source, int depth) {
    if (index < 0) {
        index = lua_gettop(L) + index + 1; // absolute, so pushing doesn't move it
    }
    switch (lua_type(L, index)) {
        case LUA_TNIL:
            return Value();
        case LUA_TBOOLEAN:
            return Value((bool)lua_toboolean(L, index));
        case LUA_TNUMBER:
            return Value((double)lua_tonumber(L, index));
        case LUA_TSTRING: {
            size_t len;
            const char* s = lua_tolstring(L, index, &len);
            return Value(std::string(s, len));
        }
        case LUA_TTABLE: {
            if (depth > 32) {
                throw EvaluationError(at, "lua table nests too deep (is it recursive?)", source);
            }
            size_t length = lua_objlen(L, index);
            size_t count = 0;
            lua_pushnil(L);
            while (lua_next(L, index) != 0) {
                count ++;
                lua_pop(L, 1);
            }
            if (count == length) { // a sequence: 1..n and nothing else
                Value ret = Value::makeList();
                for (size_t i = 1; i <= length; i ++) {
                    lua_rawgeti(L, index, i);
                    ret.push(pull(L, -1, at, source, depth + 1));
                    lua_pop(L, 1);
                }
                return ret;
            }
            Value ret = Value::makeMap(); // lua doesn't remember insertion order, so neither can this
            lua_pushnil(L);
            while (lua_next(L, index) != 0) {
                std::string key;
                if (lua_type(L, -2) == LUA_TNUMBER) {
                    key = numberToString(lua_tonumber(L, -2));
                }
                else if (lua_type(L, -2) == LUA_TSTRING) {
                    key = lua_tostring(L, -2); // only safe because the key really is a string: tostring on a number key would confuse lua_next
                }
                else {
                    lua_pop(L, 2);
                    throw EvaluationError(at, "lua table keys must be strings or numbers", source);
                }
                ret.set(key, pull(L, -1, at, source, depth + 1));
                lua_pop(L, 1);
            }
            return ret;
        }
        default:
            throw EvaluationError(at, std::string("lua returned a ") + lua_typename(L, lua_type(L, index)) + ", which templates can't use", source);
    }
}
