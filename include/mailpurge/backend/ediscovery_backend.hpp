/*

ediscovery_backend.hpp
----------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Bulk search backend over Microsoft Graph eDiscovery searches of an existing case.

*/

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <json/json.h>

#include <mailpurge/backend/bulk_search_backend.hpp>
#include <mailpurge/backend/json.hpp>
#include <mailpurge/backend/query.hpp>
#include <mailpurge/detail/asio_decl.hpp>
#include <mailpurge/detail/log.hpp>
#include <mailpurge/detail/result.hpp>
#include <mailpurge/net/error_mapping.hpp>
#include <mailpurge/net/http.hpp>
#include <mailpurge/net/url.hpp>
#include <mailpurge/oauth2/bearer_retry.hpp>
#include <mailpurge/oauth2/token_source.hpp>
#include <mailpurge/purge/size_parser.hpp>

namespace mailpurge::backend
{

struct ediscovery_options
{
    /// Case that owns the searches; it must exist already.
    std::string case_id;
    std::string api_root = "/v1.0";
};

/// Map a Graph operation status onto the job lifecycle; unknown values count as still running.
[[nodiscard]] inline job_status parse_operation_status(std::string_view status) noexcept
{
    if (status == "notStarted" || status == "submissionSucceeded")
        return job_status::pending;
    if (status == "succeeded" || status == "partiallySucceeded")
        return job_status::completed;
    if (status == "failed")
        return job_status::failed;
    return job_status::running;
}

class ediscovery_backend : public bulk_search_backend
{
public:
    ediscovery_backend(net::http_transport& transport, oauth2::token_source& tokens, ediscovery_options options)
        : transport_(transport), tokens_(tokens), options_(std::move(options))
    {
    }

    /**
    Create the search, attach the mailbox as its source and start the estimate.

    When a step after creation fails the half-built search is deleted before the error is
    returned.
    **/
    mailpurge::asio::awaitable<result<bulk_search_job>> create_and_run(
        const std::string& mailbox, const date_filter& filter) override
    {
        if (options_.case_id.empty())
            co_return fail<bulk_search_job>(errc::invalid_argument, "Bulk search needs an eDiscovery case id.");

        bulk_search_job job;
        job.mailbox = mailbox;
        job.name = search_job_name(mailbox, std::chrono::system_clock::now());
        job.query = search_query(filter);

        Json::Value search;
        search["displayName"] = job.name;
        search["contentQuery"] = job.query;
        search["description"] = "Created by mailpurge for " + mailbox;

        auto created = co_await post_json(searches_root(), search);
        if (!created)
            co_return fail<bulk_search_job>(std::move(created).error());
        auto root = parse_json(created->body);
        if (!root)
            co_return fail<bulk_search_job>(std::move(root).error());
        job.id = get_string(*root, "id").value_or(std::string{});
        if (job.id.empty())
            co_return fail<bulk_search_job>(errc::invalid_response, "Search created without an id.");
        MAILPURGE_INFO("Created search " + job.name + " (" + job.id + "): " + job.query);

        Json::Value source;
        source["@odata.type"] = "microsoft.graph.security.userSource";
        source["email"] = mailbox;
        source["includedSources"] = "mailbox";

        auto added = co_await post_json(search_root(job) + "/additionalSources", source);
        if (!added)
            co_return co_await abandon(job, std::move(added).error());

        auto started = co_await post_json(search_root(job) + "/estimateStatistics", Json::Value(Json::objectValue));
        if (!started)
            co_return co_await abandon(job, std::move(started).error());

        job.status = job_status::pending;
        co_return job;
    }

    mailpurge::asio::awaitable<result<bulk_search_job>> refresh_status(const bulk_search_job& job) override
    {
        const std::string target = search_root(job) + "/lastEstimateStatisticsOperation";
        net::http_request request;
        request.target = target;
        auto resp = co_await send(std::move(request));
        if (!resp)
            co_return fail<bulk_search_job>(std::move(resp).error());

        bulk_search_job updated = job;
        if (resp->status == 404)
        {
            // No estimate operation recorded yet.
            updated.status = job_status::pending;
            co_return updated;
        }
        if (!resp->ok())
            co_return fail<bulk_search_job>(http_error("GET", target, *resp));

        auto root = parse_json(resp->body);
        if (!root)
            co_return fail<bulk_search_job>(std::move(root).error());

        updated.status = parse_operation_status(get_string(*root, "status").value_or(std::string{}));
        if (auto count = get_uint64(*root, "indexedItemCount"))
            updated.item_count = *count;

        if (auto size_text = get_string(*root, "indexedItemsSize"))
        {
            const parsed_size size = parse_size(*size_text);
            if (auto bytes = bytes_of(size))
                updated.total_size_bytes = *bytes;
            else
                MAILPURGE_WARN("Unrecognized search size \"" + *size_text + "\"; keeping "
                    + format_size(updated.total_size_bytes));
        }
        co_return updated;
    }

    mailpurge::asio::awaitable<result<std::uint64_t>> purge(const bulk_search_job& job) override
    {
        if (job.status != job_status::completed)
            co_return fail<std::uint64_t>(errc::invalid_argument,
                "Search " + job.name + " has not completed; refusing to purge.");

        Json::Value body;
        body["purgeType"] = "permanentlyDelete";
        body["purgeAreas"] = "mailboxes";

        auto resp = co_await post_json(search_root(job) + "/purgeData", body);
        if (!resp)
            co_return fail<std::uint64_t>(std::move(resp).error());
        MAILPURGE_INFO("Purge submitted for search " + job.name + " (" + std::to_string(job.item_count) + " items).");
        co_return job.item_count;
    }

    /// A search that is already gone counts as discarded.
    mailpurge::asio::awaitable<result_void> discard(const bulk_search_job& job) override
    {
        if (job.id.empty())
            co_return ok();

        const std::string target = search_root(job);
        net::http_request request;
        request.verb = net::http_verb::del;
        request.target = target;
        auto resp = co_await send(std::move(request));
        if (!resp)
            co_return fail<void>(std::move(resp).error());
        if (!resp->ok() && resp->status != 404)
            co_return fail<void>(http_error("DELETE", target, *resp));
        MAILPURGE_DEBUG("Discarded search " + job.name);
        co_return ok();
    }

private:
    [[nodiscard]] std::string searches_root() const
    {
        return options_.api_root + "/security/cases/ediscoveryCases/"
            + net::encode_path_segment(options_.case_id) + "/searches";
    }

    [[nodiscard]] std::string search_root(const bulk_search_job& job) const
    {
        return searches_root() + "/" + net::encode_path_segment(job.id);
    }

    [[nodiscard]] static error_info http_error(std::string_view method, const std::string& target,
        const net::http_response& resp)
    {
        std::string message = "eDiscovery request failed with HTTP " + std::to_string(resp.status);
        const std::string reason = error_message_of(resp.body);
        if (!reason.empty())
            message += " (" + reason + ")";
        return make_error(net::map_http_status(resp.status, resp.body), std::move(message),
            net::make_http_detail(method, target, resp.status, resp.body).str());
    }

    mailpurge::asio::awaitable<result<bulk_search_job>> abandon(const bulk_search_job& job, error_info cause)
    {
        MAILPURGE_WARN("Setting up search " + job.name + " failed; deleting it.");
        auto discarded = co_await discard(job);
        if (!discarded)
            MAILPURGE_ERROR("Could not delete search " + job.name + ": " + discarded.error().to_string());
        co_return fail<bulk_search_job>(std::move(cause));
    }

    mailpurge::asio::awaitable<result<net::http_response>> send(net::http_request request)
    {
        co_return co_await oauth2::send_with_bearer(tokens_, transport_, std::move(request));
    }

    mailpurge::asio::awaitable<result<net::http_response>> post_json(const std::string& target, const Json::Value& body)
    {
        net::http_request request;
        request.verb = net::http_verb::post;
        request.target = target;
        request.body = to_json(body);
        auto resp = co_await send(std::move(request));
        if (!resp)
            co_return resp;
        if (!resp->ok())
            co_return fail<net::http_response>(http_error("POST", target, *resp));
        co_return resp;
    }

    net::http_transport& transport_;
    oauth2::token_source& tokens_;
    ediscovery_options options_;
};

} // namespace mailpurge::backend
