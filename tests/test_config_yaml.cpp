#include "doctest.h"

#include "fake_fs.h"

#include "tvlink/config/tvlink_config.h"
#include "tvlink/config/tvlink_config_yaml_store_fs.h"

#include <chrono>
#include <string>

using tvlink::config::TvlinkConfig;
using tvlink::config::YamlTvlinkConfigStoreFs;
using tvlink::tests::MemoryFileSystem;

using namespace std::chrono_literals;

TEST_CASE("YamlTvlinkConfigStoreFs: missing file yields defaults and writes them")
{
    MemoryFileSystem fs("host");
    YamlTvlinkConfigStoreFs store(&fs, "tvlink.yaml");

    TvlinkConfig cfg = store.load();

    CHECK(cfg.lounge.baseUrl == "https://www.youtube.com/api/lounge");
    CHECK(cfg.lounge.requestTimeout == 30s);
    CHECK(cfg.lounge.pollTimeout == 3min);
    CHECK(cfg.lounge.inactivityTimeout == 30min);
    CHECK(cfg.lounge.maxPollRetries == 3);
    CHECK(cfg.lounge.retryBaseDelay == 2s);
    CHECK(cfg.credentials.file == "lounge_credentials.yaml");
    CHECK(cfg.log.level == "info");

    CHECK(fs.exists("tvlink.yaml"));
    CHECK_FALSE(fs.exists("tvlink.yaml.tmp"));
    CHECK(fs.file_text("tvlink.yaml").find("max_poll_retries: 3") != std::string::npos);
}

TEST_CASE("YamlTvlinkConfigStoreFs: partial file overrides only what it names")
{
    MemoryFileSystem fs("host");
    fs.create_file("tvlink.yaml", R"(
lounge:
  client_name: "living-room-remote"
  inactivity_timeout_s: 600
  max_poll_retries: 5
log:
  level: debug
)");

    YamlTvlinkConfigStoreFs store(&fs, "tvlink.yaml");
    TvlinkConfig cfg = store.load();

    CHECK(cfg.lounge.clientName == "living-room-remote");
    CHECK(cfg.lounge.inactivityTimeout == 10min);
    CHECK(cfg.lounge.maxPollRetries == 5);
    CHECK(cfg.lounge.pollTimeout == 3min);
    CHECK(cfg.log.level == "debug");
    CHECK(cfg.credentials.file == "lounge_credentials.yaml");
}

TEST_CASE("YamlTvlinkConfigStoreFs: zero retries is clamped to one")
{
    MemoryFileSystem fs("host");
    fs.create_file("tvlink.yaml", "lounge:\n  max_poll_retries: 0\n");

    YamlTvlinkConfigStoreFs store(&fs, "tvlink.yaml");
    CHECK(store.load().lounge.maxPollRetries == 1);
}

TEST_CASE("YamlTvlinkConfigStoreFs: malformed file falls back to defaults")
{
    MemoryFileSystem fs("host");
    fs.create_file("tvlink.yaml", "lounge: [unterminated\n");

    YamlTvlinkConfigStoreFs store(&fs, "tvlink.yaml");
    TvlinkConfig cfg = store.load();

    CHECK(cfg.lounge.maxPollRetries == 3);
    // The broken file is left for the user to fix.
    CHECK(fs.file_text("tvlink.yaml") == "lounge: [unterminated\n");
}

TEST_CASE("YamlTvlinkConfigStoreFs: save then load round-trips")
{
    MemoryFileSystem fs("host");
    YamlTvlinkConfigStoreFs store(&fs, "tvlink.yaml");

    TvlinkConfig cfg;
    cfg.lounge.baseUrl = "http://127.0.0.1:8080/api/lounge";
    cfg.lounge.retryBaseDelay = 250ms;
    cfg.credentials.file = "creds.yaml";
    cfg.log.level = "warn";
    store.save(cfg);

    TvlinkConfig back = store.load();
    CHECK(back.lounge.baseUrl == cfg.lounge.baseUrl);
    CHECK(back.lounge.retryBaseDelay == 250ms);
    CHECK(back.credentials.file == "creds.yaml");
    CHECK(back.log.level == "warn");
}

TEST_CASE("YamlTvlinkConfigStoreFs: no filesystem")
{
    YamlTvlinkConfigStoreFs store(nullptr, "tvlink.yaml");
    CHECK(store.load().lounge.maxPollRetries == 3);
    CHECK_THROWS(store.save(TvlinkConfig{}));
}
