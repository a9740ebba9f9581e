/// @file terminal.cpp
/// @brief POSIX terminal output.

#include "core/terminal.hpp"

#include "core/logger.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace cadence::core
{

namespace
{

constexpr std::string_view kEnterSequence = "\x1b[?1049h\x1b[2J\x1b[?25l";
constexpr std::string_view kLeaveSequence = "\x1b[0m\x1b[?25h\x1b[?1049l";
constexpr i32 kFallbackColumns = 80;
constexpr i32 kFallbackRows = 24;

} // anonymous namespace

Terminal::Terminal(int fd)
    : m_fd{fd}
{
}

Terminal::Terminal()
    : Terminal(STDOUT_FILENO)
{
}

Terminal::~Terminal()
{
    leave();
}

void Terminal::enter()
{
    if (m_entered)
    {
        return;
    }
    if (write(kEnterSequence))
    {
        m_entered = true;
        CDN_CORE_DEBUG("Terminal: alternate screen entered");
    }
}

void Terminal::leave()
{
    if (!m_entered)
    {
        return;
    }
    m_entered = false;
    if (!write(kLeaveSequence))
    {
        CDN_CORE_WARN("Terminal: failed to restore screen state");
    }
}

bool Terminal::write(std::string_view bytes)
{
    while (!bytes.empty())
    {
        const ssize_t n = ::write(m_fd, bytes.data(), bytes.size());
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            CDN_CORE_ERROR("Terminal: write failed: {}", std::strerror(errno));
            return false;
        }
        bytes.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

Vec2i Terminal::size() const
{
    winsize ws{};
    if (ioctl(m_fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
    {
        return Vec2i{ws.ws_col, ws.ws_row};
    }
    return Vec2i{kFallbackColumns, kFallbackRows};
}

} // namespace cadence::core
