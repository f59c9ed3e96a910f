/*

types.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mailpurge
{

/// Hard per-request ceiling of the multi-operation delete call.
inline constexpr std::size_t max_batch_size = 20;

/// Largest id page the list call may return.
inline constexpr std::size_t max_page_size = 200;

/// Fetch pages are this multiple of the caller supplied base size.
inline constexpr std::size_t page_size_multiplier = 4;

[[nodiscard]] constexpr std::size_t fetch_page_size(std::size_t base) noexcept
{
    return std::clamp<std::size_t>(base * page_size_multiplier, 1, max_page_size);
}

using message_id = std::string;
using message_batch = std::vector<message_id>;

/**
Split ids into consecutive delete batches of at most `batch_size` (capped at 20) ids.
Order is preserved and every id lands in exactly one batch.
**/
[[nodiscard]] inline std::vector<message_batch> partition_batches(std::span<const message_id> ids,
    std::size_t batch_size = max_batch_size)
{
    batch_size = std::clamp<std::size_t>(batch_size, 1, max_batch_size);
    std::vector<message_batch> batches;
    batches.reserve((ids.size() + batch_size - 1) / batch_size);
    for (std::size_t offset = 0; offset < ids.size(); offset += batch_size)
    {
        const auto count = std::min(batch_size, ids.size() - offset);
        batches.emplace_back(ids.begin() + static_cast<std::ptrdiff_t>(offset),
            ids.begin() + static_cast<std::ptrdiff_t>(offset + count));
    }
    return batches;
}

/// Result of one multi-operation delete request.
struct batch_outcome
{
    std::size_t succeeded = 0;
    /// Includes throttled items.
    std::size_t failed = 0;
    bool throttled = false;
    /// Authorization or quota rejection; retrying the batch cannot help.
    bool forbidden = false;
    /// Items rejected with 429/503, eligible for another attempt.
    std::vector<message_id> throttled_ids;
};

struct deletion_tally
{
    std::uint64_t deleted = 0;
    std::uint64_t failed = 0;

    [[nodiscard]] std::uint64_t processed() const noexcept
    {
        return deleted + failed;
    }

    deletion_tally& operator+=(const deletion_tally& other) noexcept
    {
        deleted += other.deleted;
        failed += other.failed;
        return *this;
    }

    friend bool operator==(const deletion_tally&, const deletion_tally&) = default;
};

enum class job_status
{
    pending,
    running,
    completed,
    failed
};

[[nodiscard]] constexpr std::string_view to_string(job_status status) noexcept
{
    switch (status)
    {
        case job_status::pending: return "Pending";
        case job_status::running: return "Running";
        case job_status::completed: return "Completed";
        case job_status::failed: return "Failed";
    }
    return "Unknown";
}

/// Server-side search-then-purge unit of work.
struct bulk_search_job
{
    std::string id;
    std::string name;
    std::string mailbox;
    std::string query;
    job_status status = job_status::pending;
    std::uint64_t item_count = 0;
    std::uint64_t total_size_bytes = 0;
};

struct folder_info
{
    std::string id;
    std::string display_name;
    std::uint64_t total_items = 0;
    std::optional<std::uint64_t> size_bytes;
};

/// One folder of one mailbox, the unit the delete loop works on.
struct mail_target
{
    std::string mailbox;
    std::string folder_id;
    std::string folder_name;

    [[nodiscard]] std::string label() const
    {
        return mailbox + "/" + (folder_name.empty() ? folder_id : folder_name);
    }
};

enum class run_mode
{
    check_only,
    dry_run,
    execute
};

[[nodiscard]] constexpr std::string_view to_string(run_mode mode) noexcept
{
    switch (mode)
    {
        case run_mode::check_only: return "check-only";
        case run_mode::dry_run: return "dry-run";
        case run_mode::execute: return "execute";
    }
    return "unknown";
}

enum class backend_kind
{
    remote_mail,
    bulk_search
};

[[nodiscard]] constexpr std::string_view to_string(backend_kind kind) noexcept
{
    switch (kind)
    {
        case backend_kind::remote_mail: return "graph";
        case backend_kind::bulk_search: return "bulk-search";
    }
    return "unknown";
}

} // namespace mailpurge
