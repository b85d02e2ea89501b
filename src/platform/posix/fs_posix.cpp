#include "tvlink/fs/filesystem.h"
#include "tvlink/platform/posix/fs_factory.h"

#include "tvlink/core/logging.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace tvlink::platform::posix {

namespace {

static constexpr const char* TAG = "fs";

using tvlink::fs::IFile;
using tvlink::fs::IFileSystem;

// ----------------------
// PosixFile
// ----------------------

class PosixFile : public IFile {
public:
    explicit PosixFile(std::FILE* fp)
        : _fp(fp)
    {}

    ~PosixFile() override {
        if (_fp) {
            std::fclose(_fp);
        }
    }

    PosixFile(const PosixFile&) = delete;
    PosixFile& operator=(const PosixFile&) = delete;

    std::size_t read(void* dst, std::size_t maxBytes) override
    {
        if (!_fp || maxBytes == 0) {
            return 0;
        }
        return std::fread(dst, 1, maxBytes, _fp);
    }

    std::size_t write(const void* src, std::size_t bytes) override
    {
        if (!_fp || bytes == 0) {
            return 0;
        }
        return std::fwrite(src, 1, bytes, _fp);
    }

    bool flush() override
    {
        if (!_fp) {
            return false;
        }
        return std::fflush(_fp) == 0;
    }

private:
    std::FILE* _fp{nullptr};
};

// ----------------------
// PosixFileSystem
// ----------------------

class PosixFileSystem : public IFileSystem {
public:
    PosixFileSystem(std::string root, std::string name)
        : _root(std::move(root))
        , _name(std::move(name))
    {
        // Normalize root: remove trailing slash if present.
        if (_root.size() > 1 && _root.back() == '/') {
            _root.pop_back();
        }

        struct stat st{};
        if (::stat(_root.c_str(), &st) != 0) {
            // mkdir -p equivalent (single level)
            if (::mkdir(_root.c_str(), 0775) != 0) {
                TL_LOGE(TAG, "Cannot create data directory '%s': %s",
                        _root.c_str(), std::strerror(errno));
            }
        }
    }

    std::string name() const override {
        return _name;
    }

    bool exists(const std::string& path) override
    {
        struct stat st{};
        return ::stat(toFullPath(path).c_str(), &st) == 0;
    }

    bool removeFile(const std::string& path) override
    {
        auto full = toFullPath(path);
        return ::unlink(full.c_str()) == 0;
    }

    bool rename(const std::string& from, const std::string& to) override
    {
        auto src = toFullPath(from);
        auto dst = toFullPath(to);
        return ::rename(src.c_str(), dst.c_str()) == 0;
    }

    std::unique_ptr<IFile> open(const std::string& path, const char* mode) override
    {
        if (!mode) {
            return nullptr;
        }
        auto full = toFullPath(path);
        std::FILE* fp = std::fopen(full.c_str(), mode);
        if (!fp) {
            return nullptr;
        }
        return std::make_unique<PosixFile>(fp);
    }

private:
    std::string toFullPath(const std::string& path) const
    {
        if (path.empty() || path == ".") {
            return _root;
        }

        if (path.front() == '/') {
            // Already absolute within FS; append to root
            if (_root.empty()) {
                return path;
            }
            return _root + path;
        }

        if (_root.empty()) {
            return path;
        }
        return _root + "/" + path;
    }

    std::string _root;  // host directory for this volume, e.g. "./tvlink-data"
    std::string _name;  // logical name, e.g. "host"
};

} // namespace

std::unique_ptr<fs::IFileSystem>
create_host_filesystem(const std::string& rootDir, const std::string& name)
{
    return std::make_unique<PosixFileSystem>(rootDir, name);
}

} // namespace tvlink::platform::posix
