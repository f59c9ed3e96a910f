/*

token_source.hpp
----------------

Access token holder with a refresh callback (no HTTP dependency).

*/

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

#include <mailpurge/detail/result.hpp>

namespace mailpurge::oauth2
{

struct token
{
    std::string access_token;
    std::string refresh_token;
    std::chrono::system_clock::time_point expires_at{};

    [[nodiscard]] bool expired(std::chrono::system_clock::time_point now,
        std::chrono::seconds skew = std::chrono::seconds{30}) const noexcept
    {
        return expires_at <= now + skew;
    }
};

class token_source
{
public:
    using refresh_fn = std::function<mailpurge::result<token>(const token& current)>;

    token_source(token initial, refresh_fn fn)
        : current_(std::move(initial)),
          refresh_(std::move(fn))
    {
    }

    /// Token handed in from outside, e.g. the environment. It cannot be renewed.
    static token_source fixed(std::string access_token, std::chrono::system_clock::time_point expires_at)
    {
        return token_source(token{std::move(access_token), {}, expires_at},
            [](const token&) -> mailpurge::result<token>
            {
                return mailpurge::fail<token>(errc::auth_failed,
                    "Access token expired or was rejected; acquire a new token and rerun.");
            });
    }

    mailpurge::result<std::string> get_access_token()
    {
        return get_access_token(false);
    }

    mailpurge::result<std::string> refresh_access_token()
    {
        return get_access_token(true);
    }

private:
    mailpurge::result<std::string> get_access_token(bool force_refresh)
    {
        token snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = std::chrono::system_clock::now();
            if (!force_refresh && !current_.expired(now, skew_))
                return mailpurge::ok(current_.access_token);
            snapshot = current_;
        }

        if (!refresh_)
            return mailpurge::fail<std::string>(errc::auth_failed, "OAuth2 refresh function missing.");

        auto refreshed = refresh_(snapshot);
        if (!refreshed)
            return mailpurge::fail<std::string>(std::move(refreshed).error());

        {
            std::lock_guard<std::mutex> lock(mutex_);
            current_ = std::move(refreshed).value();
            return mailpurge::ok(current_.access_token);
        }
    }

    std::mutex mutex_;
    token current_;
    refresh_fn refresh_;
    std::chrono::seconds skew_{30};
};

} // namespace mailpurge::oauth2
