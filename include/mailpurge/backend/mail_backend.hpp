/*

mail_backend.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mailpurge/detail/asio_decl.hpp>
#include <mailpurge/detail/redact.hpp>
#include <mailpurge/detail/result.hpp>
#include <mailpurge/purge/date_filter.hpp>
#include <mailpurge/purge/types.hpp>

namespace mailpurge::backend
{

/// Folder names the mail API accepts in place of a folder id.
inline constexpr std::array<std::string_view, 8> well_known_folders = {
    "inbox", "sentitems", "deleteditems", "drafts",
    "junkemail", "archive", "outbox", "recoverableitemsdeletions"};

[[nodiscard]] inline bool is_well_known_folder(std::string_view name) noexcept
{
    for (auto known : well_known_folders)
    {
        if (detail::iequals_ascii(known, name))
            return true;
    }
    return false;
}

/**
Per-message mail API: count, list ids and delete in batches.

Implementations hold no per-target state. Listing the same filter again after deletions
returns the next remaining ids, so the delete loop simply re-fetches the first page.
**/
class mail_backend
{
public:
    virtual ~mail_backend() = default;

    virtual mailpurge::asio::awaitable<result<std::vector<folder_info>>> list_folders(
        const std::string& mailbox) = 0;

    virtual mailpurge::asio::awaitable<result<std::uint64_t>> count_matching(
        const mail_target& target, const date_filter& filter) = 0;

    /// Up to fetch_page_size(page_size) ids, bodies are never requested.
    virtual mailpurge::asio::awaitable<result<std::vector<message_id>>> fetch_id_page(
        const mail_target& target, const date_filter& filter, std::size_t page_size) = 0;

    /// One multi-operation request for at most max_batch_size ids.
    virtual mailpurge::asio::awaitable<result<batch_outcome>> delete_batch(
        const std::string& mailbox, const message_batch& ids) = 0;
};

} // namespace mailpurge::backend
