#pragma once

/// @file terminal.hpp
/// @brief Output side of the controlling terminal: screen mode and frame writes.

#include "core/types.hpp"

#include <string_view>

namespace cadence::core
{
    /// @brief Writes whole frames to a file descriptor (stdout by default).
    ///
    /// enter() switches to the alternate screen, clears it and hides the cursor;
    /// leave() restores all three. The destructor calls leave(), so the shell is
    /// restored on every exit path that unwinds.
    /// Non-copyable: exactly one instance should own the tty at a time.
    class Terminal
    {
    public:
        explicit Terminal(int fd);
        Terminal();
        ~Terminal();

        Terminal(const Terminal&) = delete;
        Terminal& operator=(const Terminal&) = delete;
        Terminal(Terminal&&) = delete;
        Terminal& operator=(Terminal&&) = delete;

        void enter();
        void leave();

        [[nodiscard]] bool is_entered() const { return m_entered; }

        /// @brief Write all bytes, retrying on partial writes and EINTR.
        /// @return false on an unrecoverable write error.
        bool write(std::string_view bytes);

        /// @brief Terminal size in character cells; 80x24 if it cannot be queried.
        [[nodiscard]] Vec2i size() const;

    private:
        int m_fd;
        bool m_entered = false;
    };

} // namespace cadence::core
