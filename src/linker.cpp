#include <linker.hpp>
#include <tokenizer.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <types/Text.hpp>
#include <types/Block.hpp>


static bool contains(const std::vector<std::string>& list, const std::string& item) {
    for (auto& thing : list) {
        if (thing == item) {
            return true;
        }
    }
    return false;
}

static std::string chainString(const std::vector<std::string>& list, const std::string& last) {
    std::string ret;
    for (auto& thing : list) {
        ret += thing + " -> ";
    }
    return ret + last;
}


Linker::Linker(FileLoader* fileLoader, NodePool* nodePool, const CompileOptions* opts) : loader(fileLoader), pool(nodePool), options(opts) {}

Template Linker::load(const std::string& path, const Position& from) {
    MapView source = loader -> read(path);
    if (!source.isValid()) {
        throw LinkError(LinkError::MissingFile, from, "can't read " + path);
    }
    if (options -> verbose) {
        printf(INFO "Loading %s\n", path.c_str());
    }
    Tokenizer tokenizer(source, path);
    Parser parser(tokenizer.tokenize(), pool, path);
    return parser.parse();
}

std::vector<Node*> Linker::link(Template root) {
    includeStack.clear();
    return flatten(root);
}

std::vector<Node*> Linker::flatten(Template tpl) {
    std::vector<Template> chain; // leaf first, root ancestor last
    std::vector<std::string> seen;
    chain.push_back(tpl);
    seen.push_back(tpl.path);
    while (chain.back().extends != NULL) {
        Extends* ext = chain.back().extends;
        std::string path = loader -> resolve(ext -> target, chain.back().path);
        if (contains(seen, path)) {
            throw LinkError(LinkError::ExtendsCycle, ext -> pos, "templates extend each other in a loop: " + chainString(seen, path));
        }
        seen.push_back(path);
        chain.push_back(load(path, ext -> pos));
    }
    for (Template& level : chain) {
        includeStack.push_back(level.path);
        resolveIncludes(level.nodes, level.path);
        includeStack.pop_back();
    }

    Slots slots;
    std::vector<std::string> active;
    if (chain.size() == 1) { // nothing to fold: every block is just its own content
        return substitute(chain[0].nodes, slots, active);
    }
    Template& root = chain.back();
    declareSlots(root.nodes, slots);
    std::vector<Node*> mixins;
    for (size_t level = chain.size() - 1; level -- > 0;) { // root-most override first, the leaf gets the last word
        for (Node* node : chain[level].nodes) {
            if (node -> type == Node::MIXINDEF) {
                mixins.push_back(node);
                continue;
            }
            if (node -> type != Node::BLOCK) { // silent comments
                continue;
            }
            Block* block = (Block*)node;
            auto slot = slots.find(block -> name);
            if (slot == slots.end()) {
                throw LinkError(LinkError::UnknownBlock, block -> pos, "block '" + block -> name + "' doesn't exist in any template " + chain[level].path + " extends");
            }
            std::vector<Node*>& content = slot -> second;
            if (block -> mode == Block::Append) {
                content.insert(content.end(), block -> content.begin(), block -> content.end());
            }
            else if (block -> mode == Block::Prepend) {
                content.insert(content.begin(), block -> content.begin(), block -> content.end());
            }
            else {
                content = block -> content;
            }
            declareSlots(block -> content, slots); // blocks declared inside an override can be overridden further down
        }
    }
    if (options -> verbose) {
        printf(INFO "Folded %zu block(s) across %zu templates\n", slots.size(), chain.size());
    }
    std::vector<Node*> ret = substitute(root.nodes, slots, active);
    ret.insert(ret.end(), mixins.begin(), mixins.end());
    return ret;
}

void Linker::resolveIncludes(std::vector<Node*>& nodes, const std::string& file) {
    for (size_t i = 0; i < nodes.size(); i ++) {
        Node* node = nodes[i];
        if (node -> type != Node::INCLUDE) {
            std::vector<std::vector<Node*>*> bodies;
            node -> bodies(bodies);
            for (auto body : bodies) {
                resolveIncludes(*body, file);
            }
            continue;
        }
        Include* inc = (Include*)node;
        std::string path = loader -> resolve(inc -> target, file);
        if (inc -> filter.size() > 0 || !endsWith(path, ".pug")) { // raw bytes, straight into the output
            MapView source = loader -> read(path);
            if (!source.isValid()) {
                throw LinkError(LinkError::MissingFile, inc -> pos, "can't read " + path);
            }
            Text* text = pool -> make<Text>(inc -> pos);
            text -> escaped = false;
            text -> appendLiteral(source.toString(), inc -> pos);
            nodes[i] = text;
            continue;
        }
        if (contains(includeStack, path)) {
            throw LinkError(LinkError::IncludeCycle, inc -> pos, "file includes itself: " + chainString(includeStack, path));
        }
        Template sub = load(path, inc -> pos);
        includeStack.push_back(path);
        std::vector<Node*> spliced;
        if (sub.extends != NULL) { // a partial with its own layout folds on its own first
            spliced = flatten(sub);
        }
        else { // otherwise its blocks stay in, they're part of whatever skeleton included it
            resolveIncludes(sub.nodes, path);
            spliced = sub.nodes;
        }
        includeStack.pop_back();
        nodes.erase(nodes.begin() + i);
        nodes.insert(nodes.begin() + i, spliced.begin(), spliced.end());
        i += spliced.size();
        i --; // the loop's ++ lands on the node right after the splice
    }
}

void Linker::declareSlots(std::vector<Node*>& nodes, Slots& slots) {
    for (Node* node : nodes) {
        if (node -> type == Node::BLOCK && ((Block*)node) -> name.size() > 0 && !slots.contains(((Block*)node) -> name)) {
            slots[((Block*)node) -> name] = ((Block*)node) -> content;
        }
        std::vector<std::vector<Node*>*> bodies;
        node -> bodies(bodies);
        for (auto body : bodies) {
            declareSlots(*body, slots);
        }
    }
}

std::vector<Node*> Linker::substitute(const std::vector<Node*>& nodes, Slots& slots, std::vector<std::string>& active) {
    std::vector<Node*> ret;
    for (Node* node : nodes) {
        if (node -> type == Node::BLOCK && ((Block*)node) -> name.size() > 0) {
            Block* block = (Block*)node;
            auto slot = slots.find(block -> name);
            std::vector<Node*> content = (slot == slots.end() || contains(active, block -> name)) ? block -> content : slot -> second;
            active.push_back(block -> name);
            std::vector<Node*> resolved = substitute(cloneList(content, pool), slots, active); // fresh copies, so no node ends up in the tree twice
            active.pop_back();
            ret.insert(ret.end(), resolved.begin(), resolved.end());
            continue;
        }
        std::vector<std::vector<Node*>*> bodies;
        node -> bodies(bodies);
        for (auto body : bodies) {
            *body = substitute(*body, slots, active);
        }
        ret.push_back(node);
    }
    return ret;
}
