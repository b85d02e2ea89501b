#include "tvlink/config/tvlink_config_yaml_store_fs.h"
#include "tvlink/core/logging.h"

#include <chrono>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace tvlink::config {

static constexpr const char* TAG = "config";

// ---------- tiny helpers ----------

template<typename T>
static T get_or(const YAML::Node& obj, const char* key, T def)
{
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

static std::chrono::milliseconds get_ms_or(const YAML::Node& obj, const char* key,
                                           std::chrono::milliseconds def)
{
    return std::chrono::milliseconds(get_or<std::int64_t>(obj, key, def.count()));
}

// ---------- from_yaml helpers ----------

static void from_yaml(const YAML::Node& node, LoungeConfig& out)
{
    out.baseUrl    = get_or<std::string>(node, "base_url", out.baseUrl);
    out.clientName = get_or<std::string>(node, "client_name", out.clientName);

    out.requestTimeout = get_ms_or(node, "request_timeout_ms", out.requestTimeout);
    out.pollTimeout    = get_ms_or(node, "poll_timeout_ms", out.pollTimeout);
    out.retryBaseDelay = get_ms_or(node, "retry_base_delay_ms", out.retryBaseDelay);

    const auto inactivityS = std::chrono::duration_cast<std::chrono::seconds>(out.inactivityTimeout);
    out.inactivityTimeout = std::chrono::seconds(
        get_or<std::int64_t>(node, "inactivity_timeout_s", inactivityS.count()));

    out.maxPollRetries = get_or<std::uint32_t>(node, "max_poll_retries", out.maxPollRetries);
    if (out.maxPollRetries == 0) {
        out.maxPollRetries = 1;
    }
}

static void from_yaml(const YAML::Node& node, CredentialsConfig& out)
{
    out.file = get_or<std::string>(node, "file", out.file);
}

static void from_yaml(const YAML::Node& node, LogConfig& out)
{
    out.level = get_or<std::string>(node, "level", out.level);
}

// Top-level TvlinkConfig mapper.
static void from_yaml(const YAML::Node& root, TvlinkConfig& cfg)
{
    if (auto n = root["lounge"]) {
        from_yaml(n, cfg.lounge);
    }
    if (auto n = root["credentials"]) {
        from_yaml(n, cfg.credentials);
    }
    if (auto n = root["log"]) {
        from_yaml(n, cfg.log);
    }
}

static void to_yaml(YAML::Emitter& out, const TvlinkConfig& cfg)
{
    using std::chrono::duration_cast;
    using std::chrono::seconds;

    out << YAML::BeginMap;

    // lounge:
    out << YAML::Key << "lounge" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "base_url"             << YAML::Value << cfg.lounge.baseUrl;
    out << YAML::Key << "client_name"          << YAML::Value << cfg.lounge.clientName;
    out << YAML::Key << "request_timeout_ms"   << YAML::Value << static_cast<std::int64_t>(cfg.lounge.requestTimeout.count());
    out << YAML::Key << "poll_timeout_ms"      << YAML::Value << static_cast<std::int64_t>(cfg.lounge.pollTimeout.count());
    out << YAML::Key << "inactivity_timeout_s" << YAML::Value
        << static_cast<std::int64_t>(duration_cast<seconds>(cfg.lounge.inactivityTimeout).count());
    out << YAML::Key << "max_poll_retries"     << YAML::Value << cfg.lounge.maxPollRetries;
    out << YAML::Key << "retry_base_delay_ms"  << YAML::Value << static_cast<std::int64_t>(cfg.lounge.retryBaseDelay.count());
    out << YAML::EndMap;

    // credentials:
    out << YAML::Key << "credentials" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "file" << YAML::Value << cfg.credentials.file;
    out << YAML::EndMap;

    // log:
    out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << cfg.log.level;
    out << YAML::EndMap;

    out << YAML::EndMap; // root
}

// ---------- YamlTvlinkConfigStoreFs methods ----------

YamlTvlinkConfigStoreFs::YamlTvlinkConfigStoreFs(fs::IFileSystem* fs, std::string relativePath)
    : _fs(fs)
    , _relPath(std::move(relativePath))
{
}

TvlinkConfig YamlTvlinkConfigStoreFs::load()
{
    TvlinkConfig cfg{}; // defaults

    if (!_fs) {
        TL_LOGW(TAG, "No data directory; using default config");
        return cfg;
    }

    if (_fs->exists(_relPath)) {
        try {
            return loadFromFs(*_fs);
        } catch (const std::exception& ex) {
            TL_LOGE(TAG,
                    "Failed to load config '%s' on '%s': %s; using defaults",
                    _relPath.c_str(),
                    _fs->name().c_str(),
                    ex.what());
            return cfg;
        }
    }

    // Nothing found: write defaults so the file exists for next start.
    TL_LOGW(TAG,
            "Config '%s' not found; writing defaults",
            _relPath.c_str());

    try {
        save(cfg);
    } catch (const std::exception& ex) {
        TL_LOGE(TAG,
                "Failed to write default config '%s': %s",
                _relPath.c_str(),
                ex.what());
    }

    return cfg;
}

void YamlTvlinkConfigStoreFs::save(const TvlinkConfig& cfg)
{
    if (!_fs) {
        throw std::runtime_error("no filesystem to save config to");
    }

    YAML::Emitter out;
    to_yaml(out, cfg);
    fs::write_file_atomic(*_fs, _relPath, out.c_str());

    TL_LOGI(TAG,
            "Saved config to '%s' on '%s'",
            _relPath.c_str(), _fs->name().c_str());
}

TvlinkConfig YamlTvlinkConfigStoreFs::loadFromFs(fs::IFileSystem& fs)
{
    auto file = fs.open(_relPath, "rb");
    if (!file) {
        throw std::runtime_error("open for read failed");
    }

    std::string yamlText = fs::read_all(*file);
    if (yamlText.empty()) {
        TL_LOGW(TAG,
                "Config '%s' on '%s' is empty; using defaults",
                _relPath.c_str(), fs.name().c_str());
        return TvlinkConfig{};
    }

    YAML::Node root = YAML::Load(yamlText);

    TvlinkConfig cfg{};
    from_yaml(root, cfg);

    TL_LOGI(TAG,
            "Loaded config from '%s' on '%s'",
            _relPath.c_str(), fs.name().c_str());
    return cfg;
}

} // namespace tvlink::config
