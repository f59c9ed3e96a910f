/*

audit_log.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Append-only audit trail of every decision, prompt and remote call outcome.

*/

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

#include <mailpurge/detail/log.hpp>
#include <mailpurge/detail/result.hpp>

namespace mailpurge
{

class audit_log
{
public:
    [[nodiscard]] static result<std::unique_ptr<audit_log>> open(const std::filesystem::path& path)
    {
        std::unique_ptr<audit_log> audit(new audit_log(path));
        if (!audit->out_.is_open())
            return fail<std::unique_ptr<audit_log>>(errc::io_error,
                "Cannot open audit log '" + path.string() + "' for appending.");
        return audit;
    }

    audit_log(const audit_log&) = delete;
    audit_log& operator=(const audit_log&) = delete;

    ~audit_log()
    {
        detach();
    }

    /// "2025-03-01 14:02:11 [SUCCESS] message"
    [[nodiscard]] static std::string format_entry(std::chrono::system_clock::time_point ts,
        log::level lvl, std::string_view message)
    {
        const std::tm tm_buf = log::local_time(ts);
        std::ostringstream line;
        line << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
             << " [" << log::level_to_string(lvl) << "] " << message;
        return line.str();
    }

    void append(std::chrono::system_clock::time_point ts, log::level lvl, std::string_view message)
    {
        std::lock_guard lock(mutex_);
        if (write_failed_)
            return;
        out_ << format_entry(ts, lvl, message) << '\n';
        out_.flush();
        if (!out_)
        {
            write_failed_ = true;
            std::cerr << "Audit log '" << path_.string() << "' is no longer writable; entries are lost.\n";
        }
    }

    /// Route every logger entry at info level or above into this file, keeping console output.
    void attach()
    {
        log::logger::instance().set_callback([this](const log::entry& e)
        {
            log::logger::print(e);
            if (!e.trace_info && e.lvl >= log::level::info && e.lvl < log::level::off)
                append(e.timestamp, e.lvl, e.message);
        });
        attached_ = true;
    }

    void detach()
    {
        if (!attached_)
            return;
        log::logger::instance().clear_callback();
        attached_ = false;
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return path_;
    }

    [[nodiscard]] bool healthy() const
    {
        std::lock_guard lock(mutex_);
        return !write_failed_;
    }

private:
    explicit audit_log(std::filesystem::path path)
        : path_(std::move(path)),
          out_(path_, std::ios::out | std::ios::app)
    {
    }

    std::filesystem::path path_;
    std::ofstream out_;
    mutable std::mutex mutex_;
    bool write_failed_ = false;
    bool attached_ = false;
};

} // namespace mailpurge
