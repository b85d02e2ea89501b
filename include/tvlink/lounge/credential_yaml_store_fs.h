#pragma once

#include <map>
#include <mutex>
#include <string>

#include "tvlink/fs/filesystem.h"
#include "tvlink/lounge/credential_store.h"

namespace tvlink::lounge {

// ICredentialStore persisted as a YAML file:
//
//   sessions:
//     <key>:
//       screen_id: ...
//       lounge_token: ...
//       screen_name: ...
//
// fs may be null, in which case credentials live in memory only.
class YamlCredentialStoreFs : public ICredentialStore {
public:
    YamlCredentialStoreFs(fs::IFileSystem* fs, std::string relativePath);

    bool save(const std::string& key, const ScreenCredentials& creds) override;
    bool clear(const std::string& key) override;
    bool load(const std::string& key, ScreenCredentials& out) override;

private:
    // Both expect _mutex to be held.
    void ensureLoaded();
    bool flush();

    fs::IFileSystem* _fs;
    std::string      _relPath;

    std::mutex _mutex;
    bool _loaded{false};
    std::map<std::string, ScreenCredentials> _entries;
};

} // namespace tvlink::lounge
