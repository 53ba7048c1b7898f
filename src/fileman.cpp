// definitions for FileMan and MemoryLoader

#include <fileman.hpp>
#include <util.hpp>
#include <sys/stat.h>
#include <cerrno>


std::string resolveTemplatePath(const std::string& relative, const std::string& from) {
    std::string path;
    if (relative.size() > 0 && relative[0] == '/') { // "absolute" paths start at the template root
        path = relative.substr(1);
    }
    else {
        path = fconcat(trim2dir(from), relative);
    }
    path = normalizePath(path);
    if (!hasExtension(path)) {
        path += ".pug";
    }
    return path;
}


FileMan::FileMan(std::string rdir) : dir(rdir) {}

FileMan::PathState FileMan::checkPath(std::string path) {
    struct stat sb;
    if (stat(transmuted(path).c_str(), &sb) != 0) {
        return errno == ENOENT || errno == ENOTDIR ? CNEP : Error;
    }
    if (S_ISREG(sb.st_mode)) {
        return File;
    }
    return S_ISDIR(sb.st_mode) ? Directory : Other;
}

std::string FileMan::transmuted(std::string path) {
    return fconcat(dir, path);
}

std::string FileMan::resolve(const std::string& relative, const std::string& from) {
    return resolveTemplatePath(relative, from);
}

MapView FileMan::read(const std::string& path) {
    if (!maps.contains(path)) {
        if (checkPath(path) != File) {
            return MapView(""); // invalid
        }
        MapView m(transmuted(path));
        if (!m.isValid()) { // a regular file that won't map is an empty one, which is still a perfectly good template
            return MapView::fromString("");
        }
        maps.insert({ path, m });
    }
    return maps.at(path);
}

void FileMan::uncache(std::string path) {
    maps.erase(path);
}


void MemoryLoader::add(const std::string& path, const std::string& source) {
    files[resolveTemplatePath(path, "")] = source;
}

std::string MemoryLoader::resolve(const std::string& relative, const std::string& from) {
    return resolveTemplatePath(relative, from);
}

MapView MemoryLoader::read(const std::string& path) {
    if (!files.contains(path)) {
        return MapView("");
    }
    return MapView::fromString(files[path]);
}
