#include "tvlink/console/lounge_commands.h"

#include <string>

namespace tvlink::console {

namespace {

void print_result(IConsoleTransport& io, const Result& r)
{
    if (r.ok()) {
        io.write_line("ok");
        return;
    }
    std::string msg = "error (";
    msg += to_string(r.status);
    msg += "): ";
    msg += r.message;
    io.write_line(msg);
}

std::string describe(const lounge::LoungeStatusInfo& info)
{
    std::string out = lounge::to_string(info.status);
    if (!info.screenName.empty()) {
        out += " screen='" + info.screenName + "'";
    }
    if (!info.errorMessage.empty()) {
        out += " error='" + info.errorMessage + "'";
    }
    return out;
}

} // namespace

void register_lounge_commands(ConsoleCommandRegistry& registry,
                              lounge::LoungeManager& lounge,
                              IConsoleTransport& io)
{
    ConsoleCommandRegistry* reg = &registry;

    registry.register_command(
        {"pair", "pair with a TV using the code shown on screen", "pair <key> <code>"},
        [&lounge, &io, reg](const ConsoleArgs& argv) {
            if (argv.size() != 3) {
                reg->print_usage(io, argv[0]);
                return true;
            }
            print_result(io, lounge.pair(std::string(argv[1]), std::string(argv[2])));
            return true;
        });

    registry.register_command(
        {"status", "show connection status", "status <key>"},
        [&lounge, &io, reg](const ConsoleArgs& argv) {
            if (argv.size() != 2) {
                reg->print_usage(io, argv[0]);
                return true;
            }
            io.write_line(describe(lounge.status(std::string(argv[1]))));
            return true;
        });

    registry.register_command(
        {"add", "append a video to the TV queue", "add <key> <videoId>"},
        [&lounge, &io, reg](const ConsoleArgs& argv) {
            if (argv.size() != 3) {
                reg->print_usage(io, argv[0]);
                return true;
            }
            print_result(io, lounge.send_add_video(std::string(argv[1]), std::string(argv[2])));
            return true;
        });

    registry.register_command(
        {"play", "play a video now", "play <key> <videoId>"},
        [&lounge, &io, reg](const ConsoleArgs& argv) {
            if (argv.size() != 3) {
                reg->print_usage(io, argv[0]);
                return true;
            }
            print_result(io, lounge.send_play_now(std::string(argv[1]), std::string(argv[2])));
            return true;
        });

    registry.register_command(
        {"reconnect", "bind a new channel with saved credentials", "reconnect <key>"},
        [&lounge, &io, reg](const ConsoleArgs& argv) {
            if (argv.size() != 2) {
                reg->print_usage(io, argv[0]);
                return true;
            }
            print_result(io, lounge.reconnect(std::string(argv[1])));
            return true;
        });

    registry.register_command(
        {"disconnect", "unpair and forget saved credentials", "disconnect <key>"},
        [&lounge, &io, reg](const ConsoleArgs& argv) {
            if (argv.size() != 2) {
                reg->print_usage(io, argv[0]);
                return true;
            }
            lounge.disconnect(std::string(argv[1]));
            io.write_line("ok");
            return true;
        });
}

} // namespace tvlink::console
