#include "tvlink/console/console_commands.h"

#include "tvlink/console/console_engine.h" // IConsoleTransport

#include <algorithm>
#include <cstddef>

namespace tvlink::console {

bool ConsoleCommandRegistry::register_command(ConsoleCommandSpec spec, ConsoleHandler handler)
{
    if (spec.name.empty() || !handler || lookup(spec.name) != nullptr) {
        return false;
    }
    _commands.push_back(Command{std::move(spec), std::move(handler)});
    return true;
}

const ConsoleCommandRegistry::Command* ConsoleCommandRegistry::lookup(std::string_view name) const
{
    for (const auto& c : _commands) {
        if (c.spec.name == name) {
            return &c;
        }
    }
    return nullptr;
}

const ConsoleCommandSpec* ConsoleCommandRegistry::find(std::string_view name) const
{
    const Command* c = lookup(name);
    return c ? &c->spec : nullptr;
}

bool ConsoleCommandRegistry::dispatch(const ConsoleArgs& argv, bool& keepGoing) const
{
    const Command* c = argv.empty() ? nullptr : lookup(argv[0]);
    if (!c) {
        return false;
    }
    keepGoing = c->handler(argv);
    return true;
}

void ConsoleCommandRegistry::print_usage(IConsoleTransport& io, std::string_view name) const
{
    const ConsoleCommandSpec* spec = find(name);
    std::string msg = "usage: ";
    if (spec && !spec->usage.empty()) {
        msg += spec->usage;
    } else {
        msg.append(name.data(), name.size());
    }
    io.write_line(msg);
}

void ConsoleCommandRegistry::print_help(IConsoleTransport& io) const
{
    auto left = [](const ConsoleCommandSpec& s) -> const std::string& {
        return s.usage.empty() ? s.name : s.usage;
    };

    std::size_t width = 0;
    for (const auto& c : _commands) {
        width = std::max(width, left(c.spec).size());
    }

    io.write_line("commands:");
    for (const auto& c : _commands) {
        std::string line = "  " + left(c.spec);
        if (!c.spec.summary.empty()) {
            line.append(width - left(c.spec).size() + 2, ' ');
            line += c.spec.summary;
        }
        io.write_line(line);
    }
    io.write_line("  quit");
}

} // namespace tvlink::console
