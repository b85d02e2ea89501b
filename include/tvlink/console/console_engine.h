#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace tvlink::console {

class ConsoleCommandRegistry;

class IConsoleTransport {
public:
    virtual ~IConsoleTransport() = default;

    // Reads a single input byte.
    // Returns false on timeout or when input is unavailable.
    virtual bool read_byte(std::uint8_t& out, int timeout_ms) = 0;

    // True until the input side has been closed (EOF on stdin).
    virtual bool is_connected() const { return true; }

    // May be called from several threads (status events arrive on poll workers).
    virtual void write(std::string_view s) = 0;
    virtual void write_line(std::string_view s) = 0;
};

// POSIX: process stdin/stdout.
std::unique_ptr<IConsoleTransport> create_default_console_transport();

// Line-oriented command loop on top of a byte transport. "help" and
// "quit"/"exit" are built in; everything else goes to the registry.
class ConsoleEngine {
public:
    ConsoleEngine(ConsoleCommandRegistry& commands, IConsoleTransport& io);

    // Blocking loop; returns on quit or when the transport disconnects.
    void run_loop();

    // One cooperative iteration. Returns false to stop the console.
    // `timeout_ms` is passed to the transport.
    bool step(int timeout_ms);

    // Execute one already-assembled line. Returns false to stop the console.
    bool handle_line(std::string_view line);

private:
    // Returns true and sets out_line when a full line is committed.
    bool read_line_edit(std::string& out_line, int timeout_ms);
    bool process_byte(std::uint8_t b, std::string& out_line);

    ConsoleCommandRegistry& _commands;
    IConsoleTransport& _io;

    std::string _prompt{"tvlink> "};
    bool _prompted{false};

    std::string _edit;
    char _pending_eol{0}; // swallow CRLF/LFCR as a single line commit
    bool _in_escape{false};
};

} // namespace tvlink::console
