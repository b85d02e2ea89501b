#include "tvlink/fs/filesystem.h"

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace tvlink::fs {

std::string read_all(IFile& file)
{
    std::string out;
    std::vector<std::uint8_t> buf(1024);

    for (;;) {
        std::size_t n = file.read(buf.data(), buf.size());
        if (n == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buf.data()), n);
    }
    return out;
}

void write_all(IFile& file, const std::string& data)
{
    const auto* ptr = reinterpret_cast<const std::uint8_t*>(data.data());
    std::size_t remaining = data.size();

    while (remaining > 0) {
        std::size_t written = file.write(ptr, remaining);
        if (written == 0) {
            throw std::runtime_error("short write");
        }
        remaining -= written;
        ptr       += written;
    }
    if (!file.flush()) {
        throw std::runtime_error("flush failed");
    }
}

void write_file_atomic(IFileSystem& fs, const std::string& path, const std::string& data)
{
    const std::string tmp = path + ".tmp";
    {
        auto file = fs.open(tmp, "wb");
        if (!file) {
            throw std::runtime_error("open for write failed: " + tmp);
        }
        write_all(*file, data);
    }
    if (!fs.rename(tmp, path)) {
        (void)fs.removeFile(tmp);
        throw std::runtime_error("rename failed: " + tmp + " -> " + path);
    }
}

} // namespace tvlink::fs
