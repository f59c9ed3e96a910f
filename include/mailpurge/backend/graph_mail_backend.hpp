/*

graph_mail_backend.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Mail backend over Microsoft Graph: $count, id listing and JSON $batch deletes.

*/

#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <json/json.h>

#include <mailpurge/backend/json.hpp>
#include <mailpurge/backend/mail_backend.hpp>
#include <mailpurge/backend/query.hpp>
#include <mailpurge/detail/asio_decl.hpp>
#include <mailpurge/detail/log.hpp>
#include <mailpurge/detail/result.hpp>
#include <mailpurge/net/error_mapping.hpp>
#include <mailpurge/net/http.hpp>
#include <mailpurge/net/url.hpp>
#include <mailpurge/oauth2/bearer_retry.hpp>
#include <mailpurge/oauth2/token_source.hpp>

namespace mailpurge::backend
{

struct graph_options
{
    std::string host = "graph.microsoft.com";
    std::string api_root = "/v1.0";
    /// Page size for folder listing and client-side counting.
    std::size_t list_page_size = 200;
};

class graph_mail_backend : public mail_backend
{
public:
    graph_mail_backend(net::http_transport& transport, oauth2::token_source& tokens, graph_options options = {})
        : transport_(transport), tokens_(tokens), options_(std::move(options))
    {
    }

    mailpurge::asio::awaitable<result<std::vector<folder_info>>> list_folders(const std::string& mailbox) override
    {
        std::vector<folder_info> folders;
        std::string target = user_root(mailbox) + "/mailFolders?$top=" + std::to_string(options_.list_page_size);
        while (!target.empty())
        {
            auto page = co_await get_json(target);
            if (!page)
                co_return fail<std::vector<folder_info>>(std::move(page).error());

            for (const auto& item : (*page)["value"])
            {
                folder_info folder;
                folder.id = get_string(item, "id").value_or(std::string{});
                folder.display_name = get_string(item, "displayName").value_or(folder.id);
                folder.total_items = get_uint64(item, "totalItemCount").value_or(0);
                folder.size_bytes = get_uint64(item, "sizeInBytes");
                if (!folder.id.empty())
                    folders.push_back(std::move(folder));
            }
            target = next_link(*page);
        }
        MAILPURGE_INFO("Listed " + std::to_string(folders.size()) + " folders of " + mailbox + ".");
        co_return folders;
    }

    /**
    Exact count via `$count`; when that call fails for any reason other than authorization the
    matching ids are paged through and counted locally.
    **/
    mailpurge::asio::awaitable<result<std::uint64_t>> count_matching(
        const mail_target& target, const date_filter& filter) override
    {
        const std::string filter_query = "$filter=" + net::encode_query_value(mail_filter_expression(filter));

        net::http_request request;
        request.target = messages_root(target) + "/$count?" + filter_query;
        net::set_header(request.headers, "ConsistencyLevel", "eventual");
        net::set_header(request.headers, "Accept", "text/plain");

        auto resp = co_await send(std::move(request));
        if (!resp && is_auth_error(resp.error().code))
            co_return fail<std::uint64_t>(std::move(resp).error());
        if (resp)
        {
            if (auto count = parse_count(resp->body))
                co_return *count;
            MAILPURGE_WARN("Unexpected $count response for " + target.label() + "; counting page by page.");
        }
        else
        {
            MAILPURGE_WARN("Count query failed for " + target.label() + " (" + resp.error().to_string()
                + "); counting page by page.");
        }

        std::uint64_t total = 0;
        std::string page_target = messages_root(target) + "?$select=id&$top="
            + std::to_string(options_.list_page_size) + "&" + filter_query;
        while (!page_target.empty())
        {
            auto page = co_await get_json(page_target);
            if (!page)
                co_return fail<std::uint64_t>(std::move(page).error());
            total += (*page)["value"].size();
            page_target = next_link(*page);
        }
        co_return total;
    }

    mailpurge::asio::awaitable<result<std::vector<message_id>>> fetch_id_page(
        const mail_target& target, const date_filter& filter, std::size_t page_size) override
    {
        const std::string page_target = messages_root(target) + "?$select=id&$top="
            + std::to_string(fetch_page_size(page_size))
            + "&$filter=" + net::encode_query_value(mail_filter_expression(filter));

        auto page = co_await get_json(page_target);
        if (!page)
            co_return fail<std::vector<message_id>>(std::move(page).error());

        std::vector<message_id> ids;
        for (const auto& item : (*page)["value"])
        {
            if (auto id = get_string(item, "id"))
                ids.push_back(std::move(*id));
        }
        co_return ids;
    }

    /**
    Submit one `$batch` of DELETE sub-requests and classify every sub-response.

    A request-level 403 or quota rejection marks the whole batch failed and forbidden; a
    request-level 429/503 marks every item throttled. Sub-responses are judged one by one.
    **/
    mailpurge::asio::awaitable<result<batch_outcome>> delete_batch(
        const std::string& mailbox, const message_batch& ids) override
    {
        if (ids.size() > max_batch_size)
            co_return fail<batch_outcome>(errc::invalid_argument,
                "Delete batch of " + std::to_string(ids.size()) + " exceeds the limit of "
                + std::to_string(max_batch_size) + ".");

        batch_outcome outcome;
        if (ids.empty())
            co_return outcome;

        Json::Value requests(Json::arrayValue);
        for (std::size_t i = 0; i < ids.size(); ++i)
        {
            Json::Value sub;
            sub["id"] = std::to_string(i + 1);
            sub["method"] = "DELETE";
            sub["url"] = "/users/" + net::encode_path_segment(mailbox) + "/messages/"
                + net::encode_path_segment(ids[i]);
            requests.append(std::move(sub));
        }
        Json::Value payload;
        payload["requests"] = std::move(requests);

        net::http_request request;
        request.verb = net::http_verb::post;
        request.target = options_.api_root + "/$batch";
        request.body = to_json(payload);

        auto resp = co_await send(std::move(request));
        if (!resp)
            co_return fail<batch_outcome>(std::move(resp).error());

        if (!resp->ok())
        {
            const errc code = net::map_http_status(resp->status, resp->body);
            if (is_quota_or_permission_error(code))
            {
                outcome.failed = ids.size();
                outcome.forbidden = true;
                co_return outcome;
            }
            if (code == errc::throttled)
            {
                outcome.failed = ids.size();
                outcome.throttled = true;
                outcome.throttled_ids = ids;
                co_return outcome;
            }
            co_return fail<batch_outcome>(http_error("POST", options_.api_root + "/$batch", *resp));
        }

        auto root = parse_json(resp->body);
        if (!root)
            co_return fail<batch_outcome>(std::move(root).error());

        std::vector<bool> answered(ids.size(), false);
        for (const auto& sub : (*root)["responses"])
        {
            const auto index = sub_request_index(sub, ids.size());
            if (!index || answered[*index])
                continue;
            answered[*index] = true;

            const auto status = static_cast<unsigned int>(get_uint64(sub, "status").value_or(0));
            if (net::is_success_status(status))
            {
                ++outcome.succeeded;
                continue;
            }

            ++outcome.failed;
            const std::string sub_body = sub.isMember("body") ? to_json(sub["body"]) : std::string{};
            const errc code = net::map_http_status(status, sub_body);
            if (code == errc::throttled)
            {
                outcome.throttled = true;
                outcome.throttled_ids.push_back(ids[*index]);
            }
            else if (is_quota_or_permission_error(code))
            {
                outcome.forbidden = true;
            }
            else
            {
                MAILPURGE_WARN("Delete of message " + ids[*index] + " returned " + std::to_string(status) + ".");
            }
        }

        for (bool seen : answered)
        {
            if (!seen)
                ++outcome.failed;
        }
        co_return outcome;
    }

private:
    [[nodiscard]] std::string user_root(const std::string& mailbox) const
    {
        return options_.api_root + "/users/" + net::encode_path_segment(mailbox);
    }

    [[nodiscard]] std::string messages_root(const mail_target& target) const
    {
        return user_root(target.mailbox) + "/mailFolders/" + net::encode_path_segment(target.folder_id) + "/messages";
    }

    [[nodiscard]] std::string next_link(const Json::Value& page) const
    {
        auto link = get_string(page, "@odata.nextLink");
        if (!link)
            return {};
        std::string target = net::relative_target(*link, options_.host);
        if (target.empty())
            MAILPURGE_WARN("Ignoring paging link outside " + options_.host);
        return target;
    }

    /// `$count` answers with a bare number as text/plain, sometimes behind a UTF-8 BOM.
    [[nodiscard]] static std::optional<std::uint64_t> parse_count(std::string_view body)
    {
        constexpr std::string_view bom = "\xEF\xBB\xBF";
        if (body.substr(0, bom.size()) == bom)
            body.remove_prefix(bom.size());
        while (!body.empty() && std::isspace(static_cast<unsigned char>(body.front())))
            body.remove_prefix(1);
        while (!body.empty() && std::isspace(static_cast<unsigned char>(body.back())))
            body.remove_suffix(1);

        std::uint64_t value = 0;
        const char* first = body.data();
        const char* last = body.data() + body.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last || first == last)
            return std::nullopt;
        return value;
    }

    [[nodiscard]] static std::optional<std::size_t> sub_request_index(const Json::Value& sub, std::size_t count)
    {
        auto id = get_uint64(sub, "id");
        if (!id || *id == 0 || *id > count)
            return std::nullopt;
        return static_cast<std::size_t>(*id - 1);
    }

    [[nodiscard]] static error_info http_error(std::string_view method, const std::string& target,
        const net::http_response& resp)
    {
        std::string message = "Graph request failed with HTTP " + std::to_string(resp.status);
        const std::string reason = error_message_of(resp.body);
        if (!reason.empty())
            message += " (" + reason + ")";
        return make_error(net::map_http_status(resp.status, resp.body), std::move(message),
            net::make_http_detail(method, target, resp.status, resp.body).str());
    }

    mailpurge::asio::awaitable<result<net::http_response>> send(net::http_request request)
    {
        co_return co_await oauth2::send_with_bearer(tokens_, transport_, std::move(request));
    }

    mailpurge::asio::awaitable<result<Json::Value>> get_json(const std::string& target)
    {
        net::http_request request;
        request.target = target;
        auto resp = co_await send(std::move(request));
        if (!resp)
            co_return fail<Json::Value>(std::move(resp).error());
        if (!resp->ok())
            co_return fail<Json::Value>(http_error("GET", target, *resp));
        co_return parse_json(resp->body);
    }

    net::http_transport& transport_;
    oauth2::token_source& tokens_;
    graph_options options_;
};

} // namespace mailpurge::backend
