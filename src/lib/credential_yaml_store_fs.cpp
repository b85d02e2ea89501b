#include "tvlink/lounge/credential_yaml_store_fs.h"
#include "tvlink/core/logging.h"

#include <exception>
#include <string>

#include <yaml-cpp/yaml.h>

namespace tvlink::lounge {

static constexpr const char* TAG = "creds";

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

static void from_yaml(const YAML::Node& root, std::map<std::string, ScreenCredentials>& out)
{
    out.clear();

    auto sessions = root["sessions"];
    if (!sessions || !sessions.IsMap()) {
        return;
    }

    for (const auto& kv : sessions) {
        ScreenCredentials c{};
        c.screenId    = get_or<std::string>(kv.second, "screen_id", "");
        c.loungeToken = get_or<std::string>(kv.second, "lounge_token", "");
        c.screenName  = get_or<std::string>(kv.second, "screen_name", "");
        out.emplace(kv.first.as<std::string>(), std::move(c));
    }
}

static void to_yaml(YAML::Emitter& out, const std::map<std::string, ScreenCredentials>& entries)
{
    out << YAML::BeginMap;
    out << YAML::Key << "sessions" << YAML::Value << YAML::BeginMap;
    for (const auto& kv : entries) {
        out << YAML::Key << kv.first << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "screen_id"    << YAML::Value << kv.second.screenId;
        out << YAML::Key << "lounge_token" << YAML::Value << kv.second.loungeToken;
        out << YAML::Key << "screen_name"  << YAML::Value << kv.second.screenName;
        out << YAML::EndMap;
    }
    out << YAML::EndMap; // sessions
    out << YAML::EndMap; // root
}

YamlCredentialStoreFs::YamlCredentialStoreFs(fs::IFileSystem* fs, std::string relativePath)
    : _fs(fs)
    , _relPath(std::move(relativePath))
{
}

void YamlCredentialStoreFs::ensureLoaded()
{
    if (_loaded) {
        return;
    }
    _loaded = true;

    if (!_fs || !_fs->exists(_relPath)) {
        return;
    }

    try {
        auto file = _fs->open(_relPath, "rb");
        if (!file) {
            TL_LOGE(TAG, "Cannot open '%s' on '%s'", _relPath.c_str(), _fs->name().c_str());
            return;
        }
        const std::string text = fs::read_all(*file);
        if (text.empty()) {
            return;
        }
        from_yaml(YAML::Load(text), _entries);
        TL_LOGI(TAG, "Loaded %u saved pairing(s) from '%s'",
                static_cast<unsigned>(_entries.size()), _relPath.c_str());
    } catch (const std::exception& ex) {
        TL_LOGE(TAG, "Failed to load '%s' on '%s': %s",
                _relPath.c_str(), _fs->name().c_str(), ex.what());
        _entries.clear();
    }
}

bool YamlCredentialStoreFs::flush()
{
    if (!_fs) {
        return true;
    }

    try {
        YAML::Emitter out;
        to_yaml(out, _entries);
        fs::write_file_atomic(*_fs, _relPath, out.c_str());
        return true;
    } catch (const std::exception& ex) {
        TL_LOGE(TAG, "Failed to save '%s' on '%s': %s",
                _relPath.c_str(), _fs->name().c_str(), ex.what());
        return false;
    }
}

bool YamlCredentialStoreFs::save(const std::string& key, const ScreenCredentials& creds)
{
    std::lock_guard<std::mutex> lock(_mutex);
    ensureLoaded();

    // Roll back on a failed write so memory never reports what is not on disk.
    auto it = _entries.find(key);
    const bool had = it != _entries.end();
    const ScreenCredentials previous = had ? it->second : ScreenCredentials{};

    _entries[key] = creds;
    if (flush()) {
        return true;
    }
    if (had) {
        _entries[key] = previous;
    } else {
        _entries.erase(key);
    }
    return false;
}

bool YamlCredentialStoreFs::clear(const std::string& key)
{
    std::lock_guard<std::mutex> lock(_mutex);
    ensureLoaded();
    auto it = _entries.find(key);
    if (it == _entries.end()) {
        return true;
    }
    const ScreenCredentials previous = it->second;
    _entries.erase(it);
    if (flush()) {
        return true;
    }
    _entries.emplace(key, previous);
    return false;
}

bool YamlCredentialStoreFs::load(const std::string& key, ScreenCredentials& out)
{
    std::lock_guard<std::mutex> lock(_mutex);
    ensureLoaded();

    auto it = _entries.find(key);
    if (it == _entries.end() || !it->second.complete()) {
        return false;
    }
    out = it->second;
    return true;
}

} // namespace tvlink::lounge
