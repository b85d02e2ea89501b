#include <memory>
#include <string>
#include <string_view>

#include "tvlink/config/tvlink_config_yaml_store_fs.h"
#include "tvlink/console/console_commands.h"
#include "tvlink/console/console_engine.h"
#include "tvlink/console/lounge_commands.h"
#include "tvlink/core/logging.h"
#include "tvlink/fs/filesystem.h"
#include "tvlink/lounge/credential_yaml_store_fs.h"
#include "tvlink/lounge/lounge_manager.h"
#include "tvlink/platform/posix/fs_factory.h"
#include "tvlink/platform/posix/http_client_curl.h"

using namespace tvlink;

static const char* TAG = "main";

#ifndef TVLINK_VERSION
#define TVLINK_VERSION "dev"
#endif

static bool parse_log_level(std::string_view s, log::Level& out)
{
    if (s == "error")   { out = log::Level::Error;   return true; }
    if (s == "warn")    { out = log::Level::Warn;    return true; }
    if (s == "info")    { out = log::Level::Info;    return true; }
    if (s == "debug")   { out = log::Level::Debug;   return true; }
    if (s == "verbose") { out = log::Level::Verbose; return true; }
    return false;
}

int main(int argc, char** argv)
{
    const std::string dataDir = (argc > 1) ? argv[1] : "./tvlink-data";

    TL_LOGI(TAG, "tvlink %s starting, data directory '%s'", TVLINK_VERSION, dataDir.c_str());

    auto hostFs = platform::posix::create_host_filesystem(dataDir, "host");
    if (!hostFs) {
        TL_LOGE(TAG, "Failed to open data directory '%s'", dataDir.c_str());
        return 1;
    }

    config::YamlTvlinkConfigStoreFs configStore(hostFs.get(), "tvlink.yaml");
    const config::TvlinkConfig cfg = configStore.load();

    log::Level level = log::Level::Info;
    if (parse_log_level(cfg.log.level, level)) {
        log::set_level(level);
    } else {
        TL_LOGW(TAG, "Unknown log level '%s'; keeping info", cfg.log.level.c_str());
    }

    lounge::YamlCredentialStoreFs credentials(hostFs.get(), cfg.credentials.file);
    platform::posix::HttpClientCurl http;
    lounge::LoungeManager manager(http, credentials, cfg.lounge);

    auto io = console::create_default_console_transport();

    auto sub = manager.events().subscribe([&io](const lounge::LoungeStatusEvent& ev) {
        std::string line = "* " + ev.key + ": " + lounge::to_string(ev.status);
        if (!ev.errorMessage.empty()) {
            line += " (" + ev.errorMessage + ")";
        }
        io->write_line(line);
    });

    console::ConsoleCommandRegistry commands;
    console::register_lounge_commands(commands, manager, *io);

    console::ConsoleEngine engine(commands, *io);
    engine.run_loop();

    manager.events().unsubscribe(sub);
    manager.shutdown();

    TL_LOGI(TAG, "tvlink exiting");
    return 0;
}
