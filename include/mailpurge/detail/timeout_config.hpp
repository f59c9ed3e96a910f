/**
 * @file timeout_config.hpp
 * @brief Configurable per-phase timeouts for HTTPS requests.
 * @author mailpurge contributors
 *
 * If a specific timeout is not set, default_timeout is used.
 *
 * Example:
 * @code
 * timeout_config timeouts;
 * timeouts.connect = seconds(10);
 * timeouts.read = seconds(120);   // $batch responses can be slow
 * @endcode
 */

#ifndef MAILPURGE_DETAIL_TIMEOUT_CONFIG_HPP
#define MAILPURGE_DETAIL_TIMEOUT_CONFIG_HPP

#include <chrono>
#include <optional>

namespace mailpurge {

/**
 * Per-phase timeout configuration.
 */
struct timeout_config
{
    /// Default timeout used when specific timeout is not set
    std::chrono::steady_clock::duration default_timeout{std::chrono::seconds(60)};

    /// TCP connection establishment
    std::optional<std::chrono::steady_clock::duration> connect;

    /// TLS handshake
    std::optional<std::chrono::steady_clock::duration> handshake;

    /// Sending a request
    std::optional<std::chrono::steady_clock::duration> write;

    /// Waiting for and reading a response
    std::optional<std::chrono::steady_clock::duration> read;

    std::chrono::steady_clock::duration get_connect() const
    { return connect.value_or(default_timeout); }

    std::chrono::steady_clock::duration get_handshake() const
    { return handshake.value_or(default_timeout); }

    std::chrono::steady_clock::duration get_write() const
    { return write.value_or(default_timeout); }

    std::chrono::steady_clock::duration get_read() const
    { return read.value_or(default_timeout); }

    /**
     * Timeouts tuned for Microsoft Graph: quick connects, generous reads.
     */
    static timeout_config graph()
    {
        timeout_config cfg;
        cfg.connect = std::chrono::seconds(15);
        cfg.handshake = std::chrono::seconds(15);
        cfg.read = std::chrono::seconds(120);
        return cfg;
    }
};

} // namespace mailpurge

#endif // MAILPURGE_DETAIL_TIMEOUT_CONFIG_HPP
