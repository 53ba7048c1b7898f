#include <session.hpp>
#include <tokenizer.hpp>
#include <parser.hpp>
#include <linker.hpp>
#include <expander.hpp>
#include <renderer.hpp>
#include <errors.hpp>
#include <evals/core.hpp>


Session::Session(FileLoader* fileLoader, CompileOptions opts) : loader(fileLoader), options(opts) {}

Session::Session(std::string rootDir, CompileOptions opts) : options(opts) {
    ownedLoader = new FileMan(rootDir);
    loader = ownedLoader;
}

Session::~Session() {
    if (ownedLoader != NULL) {
        delete ownedLoader;
    }
}

VariableEnvironment& Session::env() {
    return environment;
}

void Session::set(const std::string& name, Value v) {
    environment.set(name, v);
}

std::string Session::compileFile(const std::string& path) {
    std::lock_guard<std::mutex> guard(m_mutex);
    std::string canonical = loader -> resolve(path, "");
    MapView source = loader -> read(canonical);
    if (!source.isValid()) {
        LinkError err(LinkError::MissingFile, Position(), "can't read " + canonical);
        if (options.verbose) {
            printf(ERROR "%s\n", err.describe().c_str());
        }
        throw err;
    }
    return run(source, canonical);
}

std::string Session::compileString(const std::string& source, const std::string& path) {
    std::lock_guard<std::mutex> guard(m_mutex);
    return run(MapView::fromString(source), path);
}

std::string Session::run(MapView source, const std::string& path) {
    NodePool pool;
    try {
        if (options.verbose) {
            printf(INFO "zpug " ZPUG_VERSION " compiling %s\n", path.c_str());
        }
        std::unique_ptr<Evaluator> evaluator = makeEvaluator(options.evaluator); // first, so a bad evaluator name fails before any work
        Tokenizer tokenizer(source, path);
        Parser parser(tokenizer.tokenize(), &pool, path);
        Template tpl = parser.parse();
        Linker linker(loader, &pool, &options);
        std::vector<Node*> linked = linker.link(tpl);
        Expander expander(&pool, &options);
        std::vector<Node*> expanded = expander.expand(linked);
        if (options.verbose) {
            pTreeList(expanded, 1);
        }
        Scope root(&environment);
        std::string html = render(expanded, evaluator.get(), &root, options);
        if (options.verbose) {
            printf(INFO "Rendered %s (%zu bytes, %zu nodes)\n", path.c_str(), html.size(), pool.nodes.size());
        }
        return html;
    }
    catch (ZpugError& e) {
        if (options.verbose) {
            printf(ERROR "%s\n", e.describe().c_str());
        }
        throw;
    }
}
