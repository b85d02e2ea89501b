#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tvlink::console {

class IConsoleTransport;

using ConsoleArgs = std::vector<std::string_view>;

struct ConsoleCommandSpec {
    std::string name;
    std::string summary;
    std::string usage;   // e.g. "pair <key> <code>"; printed on bad arguments
};

// Handlers return false to leave the console loop.
using ConsoleHandler = std::function<bool(const ConsoleArgs& argv)>;

// Commands in registration order; help lists them the same way.
class ConsoleCommandRegistry {
public:
    // False when the name is empty, taken, or the handler is empty.
    bool register_command(ConsoleCommandSpec spec, ConsoleHandler handler);

    const ConsoleCommandSpec* find(std::string_view name) const;

    // Runs the handler named by argv[0]. Sets `keepGoing` from the handler and
    // returns true, or returns false when no command matches.
    bool dispatch(const ConsoleArgs& argv, bool& keepGoing) const;

    void print_usage(IConsoleTransport& io, std::string_view name) const;
    void print_help(IConsoleTransport& io) const;

private:
    struct Command {
        ConsoleCommandSpec spec;
        ConsoleHandler handler;
    };

    const Command* lookup(std::string_view name) const;

    std::vector<Command> _commands;
};

} // namespace tvlink::console
