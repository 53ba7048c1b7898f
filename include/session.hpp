// Session is what a host program holds on to: a FileLoader, the variables templates can see, and the compile options.
// Every compile builds its own tokenizer, parser, linker, expander, evaluator and node pool; nothing but the loader's cache outlives a call.
#pragma once
#include <defs.h>
#include <string>
#include <mutex>
#include <fileman.hpp>
#include <options.h>
#include <scope.hpp>


struct Session {
    std::mutex m_mutex; // one compile at a time: the loader caches what it reads
    FileLoader* loader;
    FileMan* ownedLoader = NULL; // set when the session made its own FileMan
    CompileOptions options;
    VariableEnvironment environment;

    Session(FileLoader* fileLoader, CompileOptions opts = CompileOptions());

    Session(std::string rootDir, CompileOptions opts = CompileOptions()); // serve templates off disk from rootDir

    Session(const Session&) = delete;

    Session& operator=(const Session&) = delete;

    ~Session();

    VariableEnvironment& env();

    void set(const std::string& name, Value v); // forwards to env()

    std::string compileFile(const std::string& path); // throws ZpugError (any of its kinds)

    std::string compileString(const std::string& source, const std::string& path = "<string>");

private:
    std::string run(MapView source, const std::string& path);
};
