#pragma once
#include <vector>
#include <cstdio>

#define INFO      "\033[32m[   INFO   ]\033[0m "
#define ERROR     "\033[1;31m[   ERROR  ]\033[0m "
#define WARNING   "\033[33m[  WARNING ]\033[0m "

#define ZPUG_VERSION "1.0.0"

#define ZPUG_DEFAULT_MIXIN_DEPTH 64 // how many mixin calls may nest inside each other before expansion gives up
#define ZPUG_DEFAULT_LOOP_LIMIT 10000 // passes a while loop gets before rendering gives up on it


struct Node; // forward-declarations for everything, so headers don't have to drag each other in
struct NodePool;
struct Token;
struct Position;
struct Template;
struct Value;
struct Scope;
struct VariableEnvironment;
struct Evaluator;
struct ZpugWriter;
struct RenderContext;
struct FileLoader;
struct CompileOptions;
struct Session;
