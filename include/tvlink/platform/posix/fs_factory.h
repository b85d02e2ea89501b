#pragma once

#include <memory>
#include <string>

#include "tvlink/fs/filesystem.h"

namespace tvlink::platform::posix {

// Create a POSIX-backed filesystem rooted at `rootDir` (host path),
// exposed under logical name `name` (e.g. "host"). The root directory
// is created if it does not exist.
std::unique_ptr<fs::IFileSystem>
create_host_filesystem(const std::string& rootDir, const std::string& name);

} // namespace tvlink::platform::posix
