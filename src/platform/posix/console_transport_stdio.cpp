#include "tvlink/console/console_engine.h"

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace tvlink::console {

namespace {

class StdioConsoleTransport final : public IConsoleTransport {
public:
    StdioConsoleTransport()
    {
        if (::isatty(STDIN_FILENO)) {
            if (::tcgetattr(STDIN_FILENO, &_orig) == 0) {
                termios t = _orig;
                // The engine echoes; switch off line buffering and local echo.
                t.c_lflag &= static_cast<tcflag_t>(~(ECHO | ICANON));
                t.c_iflag &= static_cast<tcflag_t>(~(IXON | ICRNL));
                t.c_oflag |= OPOST;
                t.c_cc[VMIN] = 0;
                t.c_cc[VTIME] = 0;
                if (::tcsetattr(STDIN_FILENO, TCSANOW, &t) == 0) {
                    _hasTermios = true;
                }
            }
        }
    }

    ~StdioConsoleTransport() override
    {
        if (_hasTermios) {
            (void)::tcsetattr(STDIN_FILENO, TCSANOW, &_orig);
        }
    }

    bool is_connected() const override { return !_eof.load(); }

    bool read_byte(std::uint8_t& out, int timeout_ms) override
    {
        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        const int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret <= 0) {
            return false; // timeout or EINTR
        }
        if ((pfd.revents & (POLLIN | POLLHUP)) == 0) {
            _eof = true;
            return false;
        }

        unsigned char ch = 0;
        const ssize_t n = ::read(STDIN_FILENO, &ch, 1);
        if (n == 0) {
            _eof = true;
            return false;
        }
        if (n != 1) {
            return false;
        }
        out = static_cast<std::uint8_t>(ch);
        return true;
    }

    void write(std::string_view s) override
    {
        std::lock_guard<std::mutex> g(_outMutex);
        std::cout.write(s.data(), static_cast<std::streamsize>(s.size()));
        std::cout.flush();
    }

    void write_line(std::string_view s) override
    {
        std::lock_guard<std::mutex> g(_outMutex);
        std::cout.write(s.data(), static_cast<std::streamsize>(s.size()));
        std::cout.put('\n');
        std::cout.flush();
    }

private:
    bool _hasTermios{false};
    termios _orig{};
    std::atomic<bool> _eof{false};
    std::mutex _outMutex;
};

} // namespace

std::unique_ptr<IConsoleTransport> create_default_console_transport()
{
    return std::make_unique<StdioConsoleTransport>();
}

} // namespace tvlink::console
