/* FileLoader is how the linker gets at other templates. FileMan serves them off disk, MemoryLoader out of a map
    (for hosts that keep their templates somewhere else, and for tests).
*/
#pragma once
#include <string>
#include <map>
#include <defs.h>
#include <mapview.hpp>


struct FileLoader {
    virtual ~FileLoader() = default;

    virtual std::string resolve(const std::string& relative, const std::string& from) = 0; // canonical path of `relative`, written inside file `from`

    virtual MapView read(const std::string& path) = 0; // returns an invalid mapview if it doesn't exist (you MUST always check isValid()!)
};


std::string resolveTemplatePath(const std::string& relative, const std::string& from); // the path rules both loaders share


class FileMan : public FileLoader {
    std::map<std::string, MapView> maps;

public:
    enum PathState {
        CNEP,      // nothing there
        Directory,
        File,      // the only state read() will map
        Other,     // a socket, fifo, device...
        Error      // stat failed for some other reason
    };

    std::string dir;

    FileMan(std::string rdir); // serve templates out of rdir

    PathState checkPath(std::string path);

    std::string transmuted(std::string path); // path on disk for a canonical path

    std::string resolve(const std::string& relative, const std::string& from);

    MapView read(const std::string& path);
    // read() recycles MapViews: a layout that every page extends only gets mapped once.

    void uncache(std::string path); // drop a path from the mmap cache, if the host knows it changed
};


class MemoryLoader : public FileLoader {
    std::map<std::string, std::string> files;

public:
    void add(const std::string& path, const std::string& source); // path is canonicalized the same way resolve() does it

    std::string resolve(const std::string& relative, const std::string& from);

    MapView read(const std::string& path);
};
