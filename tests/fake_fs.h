#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "tvlink/fs/filesystem.h"

namespace tvlink::tests {

class MemoryFile final : public tvlink::fs::IFile {
public:
    MemoryFile(std::vector<std::uint8_t>& bytes, bool readOnly)
        : _bytes(bytes), _readOnly(readOnly) {}

    std::size_t read(void* dst, std::size_t maxBytes) override
    {
        if (!dst) return 0;
        if (_pos >= _bytes.size()) return 0;
        const std::size_t n = std::min<std::size_t>(maxBytes, _bytes.size() - _pos);
        std::memcpy(dst, _bytes.data() + _pos, n);
        _pos += n;
        return n;
    }

    std::size_t write(const void* src, std::size_t bytes) override
    {
        if (_readOnly || !src) return 0;
        if (_pos + bytes > _bytes.size()) {
            _bytes.resize(_pos + bytes);
        }
        std::memcpy(_bytes.data() + _pos, src, bytes);
        _pos += bytes;
        return bytes;
    }

    bool flush() override { return true; }

private:
    std::vector<std::uint8_t>& _bytes;
    bool _readOnly{true};
    std::size_t _pos{0};
};

// Flat in-memory filesystem; paths are normalised to a leading '/'.
class MemoryFileSystem final : public tvlink::fs::IFileSystem {
public:
    explicit MemoryFileSystem(std::string name)
        : _name(std::move(name))
    {}

    // When set, every open for writing fails.
    bool readOnly{false};

    std::string name() const override { return _name; }

    bool exists(const std::string& path) override
    {
        return _files.find(norm(path)) != _files.end();
    }

    bool removeFile(const std::string& path) override
    {
        return _files.erase(norm(path)) > 0;
    }

    bool rename(const std::string& from, const std::string& to) override
    {
        auto it = _files.find(norm(from));
        if (it == _files.end()) return false;
        std::vector<std::uint8_t> bytes = std::move(it->second);
        _files.erase(it);
        _files[norm(to)] = std::move(bytes);
        return true;
    }

    std::unique_ptr<tvlink::fs::IFile> open(const std::string& path, const char* mode) override
    {
        const std::string m = mode ? std::string(mode) : std::string();
        const bool wantWrite = m.find('w') != std::string::npos;

        const std::string p = norm(path);
        auto it = _files.find(p);
        if (wantWrite) {
            if (readOnly) return nullptr;
            // "w" truncates.
            it = _files.insert_or_assign(p, std::vector<std::uint8_t>{}).first;
        } else if (it == _files.end()) {
            return nullptr;
        }

        return std::make_unique<MemoryFile>(it->second, !wantWrite);
    }

    void create_file(const std::string& path, const std::string& content)
    {
        _files[norm(path)] = std::vector<std::uint8_t>(content.begin(), content.end());
    }

    std::string file_text(const std::string& path) const
    {
        auto it = _files.find(norm(path));
        if (it == _files.end()) return {};
        return std::string(it->second.begin(), it->second.end());
    }

private:
    static std::string norm(const std::string& in)
    {
        if (in.empty()) return "/";
        if (in[0] != '/') return "/" + in;
        return in;
    }

    std::string _name;
    std::unordered_map<std::string, std::vector<std::uint8_t>> _files;
};

} // namespace tvlink::tests
