#include "doctest.h"

#include "tvlink/console/console_commands.h"
#include "tvlink/console/console_engine.h"
#include "tvlink/console/console_parse.h"
#include "tvlink/console/lounge_commands.h"
#include "tvlink/lounge/credential_yaml_store_fs.h"
#include "tvlink/lounge/lounge_manager.h"

#include "fake_lounge_server.h"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace tvlink::tests {
namespace {

class FakeConsoleTransport final : public tvlink::console::IConsoleTransport {
public:
    std::deque<std::uint8_t> in;
    std::string out;

    bool read_byte(std::uint8_t& outb, int /*timeout_ms*/) override
    {
        if (in.empty()) return false;
        outb = in.front();
        in.pop_front();
        return true;
    }

    void write(std::string_view s) override { out.append(s.data(), s.size()); }

    void write_line(std::string_view s) override
    {
        out.append(s.data(), s.size());
        out.push_back('\n');
    }

    void push_line(std::string_view s)
    {
        for (char c : s) in.push_back(static_cast<std::uint8_t>(c));
        in.push_back(static_cast<std::uint8_t>('\r'));
    }
};

bool has(std::string_view hay, std::string_view needle)
{
    return hay.find(needle) != std::string_view::npos;
}

// Wires a console to a LoungeManager backed by the fake lounge server.
struct ConsoleRig {
    FakeLoungeServer server;
    lounge::YamlCredentialStoreFs store{nullptr, "creds.yaml"};
    lounge::LoungeManager manager{server, store};
    FakeConsoleTransport io;
    console::ConsoleCommandRegistry commands;
    console::ConsoleEngine engine{commands, io};

    ConsoleRig() { console::register_lounge_commands(commands, manager, io); }

    // Feed one line and run the engine until it has been handled.
    bool run(std::string_view line)
    {
        io.out.clear();
        io.push_line(line);
        bool keepGoing = true;
        while (!io.in.empty() && keepGoing) {
            keepGoing = engine.step(0);
        }
        return keepGoing;
    }
};

} // namespace
} // namespace tvlink::tests

using tvlink::tests::ConsoleRig;
using tvlink::tests::has;

TEST_CASE("split_ws splits on any whitespace")
{
    using tvlink::console::split_ws;
    auto argv = split_ws("  pair \t room1   123456 ");
    REQUIRE(argv.size() == 3);
    CHECK(argv[0] == "pair");
    CHECK(argv[1] == "room1");
    CHECK(argv[2] == "123456");
    CHECK(split_ws("   ").empty());
}

TEST_CASE("ConsoleCommandRegistry rejects duplicates and empty names")
{
    tvlink::console::ConsoleCommandRegistry reg;
    auto fn = [](const std::vector<std::string_view>&) { return true; };
    CHECK(reg.register_command({"x", "", ""}, fn));
    CHECK_FALSE(reg.register_command({"x", "", ""}, fn));
    CHECK_FALSE(reg.register_command({"", "", ""}, fn));
    CHECK(reg.find("x") != nullptr);
    CHECK(reg.find("y") == nullptr);

    bool keepGoing = false;
    CHECK(reg.dispatch({"x"}, keepGoing));
    CHECK(keepGoing);
    CHECK_FALSE(reg.dispatch({"y"}, keepGoing));
    CHECK_FALSE(reg.dispatch({}, keepGoing));
}

TEST_CASE("ConsoleCommandRegistry help keeps registration order")
{
    tvlink::console::ConsoleCommandRegistry reg;
    auto fn = [](const tvlink::console::ConsoleArgs&) { return true; };
    REQUIRE(reg.register_command({"zeta", "last letter", "zeta <n>"}, fn));
    REQUIRE(reg.register_command({"alpha", "first letter", ""}, fn));

    tvlink::tests::FakeConsoleTransport io;
    reg.print_help(io);
    const auto zeta = io.out.find("zeta <n>");
    const auto alpha = io.out.find("alpha");
    REQUIRE(zeta != std::string::npos);
    REQUIRE(alpha != std::string::npos);
    CHECK(zeta < alpha);

    io.out.clear();
    reg.print_usage(io, "alpha");
    CHECK(io.out == "usage: alpha\n");
}

TEST_CASE("trim_ws strips both ends only")
{
    using tvlink::console::trim_ws;
    CHECK(trim_ws(" \t a b \r\n") == "a b");
    CHECK(trim_ws(" \t ").empty());
    CHECK(trim_ws("").empty());
}

TEST_CASE("Console: help lists lounge commands")
{
    ConsoleRig rig;
    CHECK(rig.run("help"));
    CHECK(has(rig.io.out, "pair <key> <code>"));
    CHECK(has(rig.io.out, "status <key>"));
    CHECK(has(rig.io.out, "add <key> <videoId>"));
    CHECK(has(rig.io.out, "play <key> <videoId>"));
    CHECK(has(rig.io.out, "reconnect <key>"));
    CHECK(has(rig.io.out, "disconnect <key>"));
    CHECK(has(rig.io.out, "quit"));
}

TEST_CASE("Console: unknown command and bad arguments")
{
    ConsoleRig rig;
    CHECK(rig.run("frobnicate"));
    CHECK(has(rig.io.out, "unknown command 'frobnicate'"));

    CHECK(rig.run("pair room1"));
    CHECK(has(rig.io.out, "usage: pair <key> <code>"));
}

TEST_CASE("Console: pair, send, status and disconnect")
{
    ConsoleRig rig;

    CHECK(rig.run("status room1"));
    CHECK(has(rig.io.out, "disconnected"));

    CHECK(rig.run("pair room1 123456"));
    CHECK(has(rig.io.out, "ok"));

    CHECK(rig.run("status room1"));
    CHECK(has(rig.io.out, "connected screen='Living Room'"));

    CHECK(rig.run("play room1 dQw4w9WgXcQ"));
    CHECK(has(rig.io.out, "ok"));
    CHECK(rig.server.count(tvlink::tests::Kind::Command) == 1);

    CHECK(rig.run("disconnect room1"));
    CHECK(rig.run("reconnect room1"));
    CHECK(has(rig.io.out, "error (no_credentials)"));
}

TEST_CASE("Console: quit stops the loop")
{
    ConsoleRig rig;
    CHECK_FALSE(rig.run("quit"));
    CHECK(has(rig.io.out, "bye"));
}

TEST_CASE("Console: backspace edits the pending line")
{
    ConsoleRig rig;
    rig.io.in.push_back('h');
    rig.io.in.push_back('x');
    rig.io.in.push_back(0x7f);
    CHECK(rig.run("elp"));
    CHECK(has(rig.io.out, "commands:"));
}
