#pragma once

#include <cstdlib>
#include <string>
#include <dirent.h>
#include <unistd.h>

// Scratch directory removed (with its direct entries) on destruction.
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/kbd_bridge_test.XXXXXX";
        const char* dir = mkdtemp(tmpl);
        if (dir) path_ = dir;
    }

    ~TempDir() {
        if (path_.empty()) return;
        if (DIR* d = opendir(path_.c_str())) {
            while (dirent* e = readdir(d)) {
                std::string name = e->d_name;
                if (name == "." || name == "..") continue;
                unlink((path_ + "/" + name).c_str());
            }
            closedir(d);
        }
        rmdir(path_.c_str());
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};
