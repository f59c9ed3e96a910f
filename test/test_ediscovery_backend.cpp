/*

test_ediscovery_backend.cpp
---------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

eDiscovery search lifecycle requests over a fake transport.

*/


#define BOOST_TEST_MODULE ediscovery_backend_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <cstdint>
#include <string>

#include <mailpurge/backend/ediscovery_backend.hpp>
#include <mailpurge/backend/json.hpp>
#include <mailpurge/backend/query.hpp>
#include "test_support.hpp"


using namespace mailpurge;
using mailpurge::backend::ediscovery_backend;
using mailpurge::backend::ediscovery_options;
using mailpurge::test::fake_transport;
using mailpurge::test::make_response;
using mailpurge::test::run_task;


namespace
{

const std::string searches = "/v1.0/security/cases/ediscoveryCases/case-42/searches";

date_filter year_2023()
{
    return date_filter::from_request(
        filter_request{std::nullopt, std::nullopt, "2023-01-01", "2023-12-31"},
        std::chrono::system_clock::now()).value();
}

bool ends_with(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bulk_search_job completed_job(std::uint64_t items)
{
    bulk_search_job job;
    job.id = "s1";
    job.name = "MailPurge_user_example_com_20250101_000000";
    job.mailbox = "user@example.com";
    job.status = job_status::completed;
    job.item_count = items;
    return job;
}

} // namespace


BOOST_AUTO_TEST_CASE(search_queries)
{
    BOOST_TEST(backend::search_query(year_2023()) == "kind:email AND received>=2023-01-01 AND received<=2023-12-31");

    auto cutoff = date_filter::before(parse_date("2024-06-30").value()).value();
    BOOST_TEST(backend::search_query(cutoff) == "kind:email AND received<2024-06-30");
}

BOOST_AUTO_TEST_CASE(job_name_is_derived_from_mailbox_and_time)
{
    const auto name = backend::search_job_name("first.last@example.com", std::chrono::system_clock::now());
    BOOST_TEST(name.rfind("MailPurge_first_last_example_com_", 0) == 0u);
    BOOST_TEST(name.size() == std::string("MailPurge_first_last_example_com_").size() + 15);
}

BOOST_AUTO_TEST_CASE(operation_status_mapping)
{
    BOOST_TEST((backend::parse_operation_status("notStarted") == job_status::pending));
    BOOST_TEST((backend::parse_operation_status("submissionSucceeded") == job_status::pending));
    BOOST_TEST((backend::parse_operation_status("running") == job_status::running));
    BOOST_TEST((backend::parse_operation_status("succeeded") == job_status::completed));
    BOOST_TEST((backend::parse_operation_status("partiallySucceeded") == job_status::completed));
    BOOST_TEST((backend::parse_operation_status("failed") == job_status::failed));
}

BOOST_AUTO_TEST_CASE(create_adds_source_and_starts_estimate)
{
    fake_transport transport([](const net::http_request& request) -> result<net::http_response>
    {
        if (request.target == searches)
            return make_response(201, R"({"id":"s1","displayName":"x"})");
        return make_response(202);
    });
    auto tokens = test::test_tokens();
    ediscovery_backend bulk(transport, tokens, ediscovery_options{"case-42"});

    auto job = run_task(bulk.create_and_run("user@example.com", year_2023()));

    BOOST_TEST(job.has_value());
    BOOST_TEST(job->id == "s1");
    BOOST_TEST(job->name.rfind("MailPurge_user_example_com_", 0) == 0u);
    BOOST_TEST((job->status == job_status::pending));
    BOOST_TEST(transport.requests.size() == 3u);

    auto created = backend::parse_json(transport.requests[0].body);
    BOOST_TEST((*created)["contentQuery"].asString() == "kind:email AND received>=2023-01-01 AND received<=2023-12-31");
    BOOST_TEST(transport.requests[1].target == searches + "/s1/additionalSources");
    auto source = backend::parse_json(transport.requests[1].body);
    BOOST_TEST((*source)["email"].asString() == "user@example.com");
    BOOST_TEST(transport.requests[2].target == searches + "/s1/estimateStatistics");
}

BOOST_AUTO_TEST_CASE(partial_creation_deletes_the_search)
{
    fake_transport transport([](const net::http_request& request) -> result<net::http_response>
    {
        if (request.target == searches)
            return make_response(201, R"({"id":"s1"})");
        if (ends_with(request.target, "/additionalSources"))
            return make_response(400, R"({"error":{"code":"BadRequest","message":"unknown mailbox"}})");
        return make_response(204);
    });
    auto tokens = test::test_tokens();
    ediscovery_backend bulk(transport, tokens, ediscovery_options{"case-42"});

    auto job = run_task(bulk.create_and_run("nobody@example.com", year_2023()));

    BOOST_TEST(!job.has_value());
    BOOST_TEST((job.error().code == errc::http_status));
    BOOST_TEST(transport.requests.size() == 3u);
    BOOST_TEST((transport.requests[2].verb == net::http_verb::del));
    BOOST_TEST(transport.requests[2].target == searches + "/s1");
}

BOOST_AUTO_TEST_CASE(missing_case_id_is_rejected_before_any_request)
{
    fake_transport transport;
    auto tokens = test::test_tokens();
    ediscovery_backend bulk(transport, tokens, ediscovery_options{});

    auto job = run_task(bulk.create_and_run("user@example.com", year_2023()));

    BOOST_TEST(!job.has_value());
    BOOST_TEST((job.error().code == errc::invalid_argument));
    BOOST_TEST(transport.requests.empty());
}

BOOST_AUTO_TEST_CASE(status_reads_count_and_size)
{
    fake_transport transport([](const net::http_request&)
    {
        return mailpurge::ok(make_response(200,
            R"json({"status":"succeeded","indexedItemCount":1520,"indexedItemsSize":"1.2 GB (1,288,490,189 bytes)"})json"));
    });
    auto tokens = test::test_tokens();
    ediscovery_backend bulk(transport, tokens, ediscovery_options{"case-42"});

    bulk_search_job job = completed_job(0);
    job.status = job_status::running;
    auto updated = run_task(bulk.refresh_status(job));

    BOOST_TEST(updated.has_value());
    BOOST_TEST((updated->status == job_status::completed));
    BOOST_TEST(updated->item_count == 1520u);
    BOOST_TEST(updated->total_size_bytes == 1288490189u);
    BOOST_TEST(transport.requests.front().target == searches + "/s1/lastEstimateStatisticsOperation");
}

BOOST_AUTO_TEST_CASE(unparseable_size_keeps_last_value)
{
    test::log_capture logs;
    fake_transport transport([](const net::http_request&)
    {
        return mailpurge::ok(make_response(200,
            R"({"status":"running","indexedItemCount":10,"indexedItemsSize":"lots"})"));
    });
    auto tokens = test::test_tokens();
    ediscovery_backend bulk(transport, tokens, ediscovery_options{"case-42"});

    bulk_search_job job = completed_job(0);
    job.total_size_bytes = 4096;
    auto updated = run_task(bulk.refresh_status(job));

    BOOST_TEST(updated.has_value());
    BOOST_TEST(updated->total_size_bytes == 4096u);
    BOOST_TEST(logs.contains(log::level::warn, "Unrecognized search size"));
}

BOOST_AUTO_TEST_CASE(status_not_yet_available_is_pending)
{
    fake_transport transport([](const net::http_request&) { return mailpurge::ok(make_response(404)); });
    auto tokens = test::test_tokens();
    ediscovery_backend bulk(transport, tokens, ediscovery_options{"case-42"});

    auto updated = run_task(bulk.refresh_status(completed_job(0)));

    BOOST_TEST(updated.has_value());
    BOOST_TEST((updated->status == job_status::pending));
}

BOOST_AUTO_TEST_CASE(purge_requests_permanent_delete)
{
    fake_transport transport([](const net::http_request&) { return mailpurge::ok(make_response(202)); });
    auto tokens = test::test_tokens();
    ediscovery_backend bulk(transport, tokens, ediscovery_options{"case-42"});

    auto accepted = run_task(bulk.purge(completed_job(75)));

    BOOST_TEST(accepted.has_value());
    BOOST_TEST(*accepted == 75u);
    BOOST_TEST(transport.requests.front().target == searches + "/s1/purgeData");
    auto body = backend::parse_json(transport.requests.front().body);
    BOOST_TEST((*body)["purgeType"].asString() == "permanentlyDelete");
    BOOST_TEST((*body)["purgeAreas"].asString() == "mailboxes");
}

BOOST_AUTO_TEST_CASE(purge_refuses_incomplete_search)
{
    fake_transport transport;
    auto tokens = test::test_tokens();
    ediscovery_backend bulk(transport, tokens, ediscovery_options{"case-42"});

    bulk_search_job job = completed_job(5);
    job.status = job_status::running;
    auto accepted = run_task(bulk.purge(job));

    BOOST_TEST(!accepted.has_value());
    BOOST_TEST(transport.requests.empty());
}

BOOST_AUTO_TEST_CASE(discard_treats_missing_search_as_gone)
{
    fake_transport transport([](const net::http_request&) { return mailpurge::ok(make_response(404)); });
    auto tokens = test::test_tokens();
    ediscovery_backend bulk(transport, tokens, ediscovery_options{"case-42"});

    auto discarded = run_task(bulk.discard(completed_job(0)));

    BOOST_TEST(discarded.has_value());
    BOOST_TEST((transport.requests.front().verb == net::http_verb::del));
}

BOOST_AUTO_TEST_CASE(discard_reports_server_errors)
{
    fake_transport transport([](const net::http_request&) { return mailpurge::ok(make_response(403)); });
    auto tokens = test::test_tokens();
    ediscovery_backend bulk(transport, tokens, ediscovery_options{"case-42"});

    auto discarded = run_task(bulk.discard(completed_job(0)));

    BOOST_TEST(!discarded.has_value());
    BOOST_TEST((discarded.error().code == errc::permission_denied));
}
