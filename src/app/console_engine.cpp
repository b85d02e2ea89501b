#include "tvlink/console/console_engine.h"

#include "tvlink/console/console_commands.h"
#include "tvlink/console/console_parse.h"

#include <string>
#include <vector>

namespace tvlink::console {

ConsoleEngine::ConsoleEngine(ConsoleCommandRegistry& commands, IConsoleTransport& io)
    : _commands(commands)
    , _io(io)
{}

void ConsoleEngine::run_loop()
{
    while (_io.is_connected() && step(-1)) {
        // loop
    }
}

bool ConsoleEngine::step(int timeout_ms)
{
    std::string line;
    if (!read_line_edit(line, timeout_ms)) {
        return true; // no input / timeout
    }
    return handle_line(line);
}

bool ConsoleEngine::process_byte(std::uint8_t b, std::string& out_line)
{
    // Swallow CRLF/LFCR pairs as a single "enter".
    if (_pending_eol != 0) {
        const bool is_pair = (_pending_eol == '\r' && b == '\n') || (_pending_eol == '\n' && b == '\r');
        _pending_eol = 0;
        if (is_pair) {
            return false;
        }
    }

    // Escape sequences (arrow keys etc.) are dropped: ESC, then up to the final alpha or '~'.
    if (_in_escape) {
        if (b == '~' || (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z')) {
            _in_escape = false;
        }
        return false;
    }
    if (b == 0x1b) {
        _in_escape = true;
        return false;
    }

    if (b == '\r' || b == '\n') {
        _pending_eol = static_cast<char>(b);
        _io.write("\r\n");
        out_line = std::string(trim_ws(_edit));
        _edit.clear();
        _prompted = false;
        return true;
    }

    // Backspace / DEL
    if (b == 0x08 || b == 0x7f) {
        if (!_edit.empty()) {
            _edit.pop_back();
            _io.write("\b \b");
        }
        return false;
    }

    // Ctrl-U: kill line
    if (b == 0x15) {
        while (!_edit.empty()) {
            _edit.pop_back();
            _io.write("\b \b");
        }
        return false;
    }

    if (b >= 0x20 && b < 0x7f) {
        const char ch = static_cast<char>(b);
        _edit.push_back(ch);
        _io.write(std::string_view(&ch, 1));
    }
    return false;
}

bool ConsoleEngine::read_line_edit(std::string& out_line, int timeout_ms)
{
    out_line.clear();

    if (!_prompted) {
        _io.write(_prompt);
        _prompted = true;
    }

    std::uint8_t b = 0;
    if (!_io.read_byte(b, timeout_ms)) {
        return false;
    }
    if (process_byte(b, out_line)) {
        return true;
    }

    // Drain whatever is immediately available (pasted lines, escape sequences).
    while (_io.read_byte(b, 0)) {
        if (process_byte(b, out_line)) {
            return true;
        }
    }
    return false;
}

bool ConsoleEngine::handle_line(std::string_view line)
{
    line = trim_ws(line);
    if (line.empty()) {
        return true;
    }

    const auto argv = split_ws(line);

    const std::string_view cmd0 = argv[0];
    if (cmd0 == "exit" || cmd0 == "quit") {
        _io.write_line("bye");
        return false;
    }

    if (cmd0 == "help") {
        _commands.print_help(_io);
        return true;
    }

    bool keepGoing = true;
    if (_commands.dispatch(argv, keepGoing)) {
        return keepGoing;
    }

    std::string msg = "error: unknown command '";
    msg.append(cmd0.data(), cmd0.size());
    msg += "' (try: help)";
    _io.write_line(msg);
    return true;
}

} // namespace tvlink::console
