#pragma once

#include <string>

#include "tvlink/config/tvlink_config.h"
#include "tvlink/fs/filesystem.h"

namespace tvlink::config {

class YamlTvlinkConfigStoreFs : public TvlinkConfigStore {
public:
    // fs can be null (no data directory) - load() then returns defaults.
    YamlTvlinkConfigStoreFs(fs::IFileSystem* fs, std::string relativePath);

    TvlinkConfig load() override;
    void save(const TvlinkConfig& cfg) override;

private:
    fs::IFileSystem* _fs;
    std::string      _relPath; // e.g. "tvlink.yaml"

    TvlinkConfig loadFromFs(fs::IFileSystem& fs);
};

} // namespace tvlink::config
