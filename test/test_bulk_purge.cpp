/*

test_bulk_purge.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Search, poll, confirm and purge through the bulk search backend; the search is always discarded.

*/


#define BOOST_TEST_MODULE bulk_purge_test

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <mailpurge/backend/bulk_search_backend.hpp>
#include <mailpurge/purge/deletion_engine.hpp>
#include "test_support.hpp"


using namespace mailpurge;
using mailpurge::test::fake_bulk_backend;
using mailpurge::test::recording_waiter;
using mailpurge::test::run_task;
using mailpurge::test::scripted_gate;


namespace
{

const std::string mailbox = "user@example.com";

date_filter older_than_a_year()
{
    return date_filter::older_than(365, std::chrono::system_clock::now()).value();
}

} // namespace


BOOST_AUTO_TEST_CASE(scenario_zero_matches_discards_without_prompt)
{
    fake_bulk_backend bulk;
    bulk.statuses = {job_status::running, job_status::completed};
    bulk.item_count = 0;
    scripted_gate gate({"DELETE"});
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::execute, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    auto report = run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year()));

    BOOST_TEST((report.status == target_status::nothing_to_delete));
    BOOST_TEST(report.accepted_for_purge == 0u);
    BOOST_TEST(bulk.purge_calls == 0u);
    BOOST_TEST(bulk.discard_calls == 1u);
    BOOST_TEST(gate.prompts.empty());
}

BOOST_AUTO_TEST_CASE(completed_search_is_purged_after_delete_token)
{
    fake_bulk_backend bulk;
    bulk.statuses = {job_status::pending, job_status::running, job_status::running, job_status::completed};
    bulk.item_count = 120;
    bulk.size_bytes = 5 * 1024 * 1024;
    scripted_gate gate({"DELETE"});
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::execute, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    auto report = run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year()));

    BOOST_TEST((report.status == target_status::completed));
    BOOST_TEST(report.match_count == 120u);
    BOOST_TEST(report.accepted_for_purge == 120u);
    BOOST_TEST(report.tally.processed() == 0u);
    BOOST_TEST(bulk.refresh_calls == 4u);
    BOOST_TEST(waiter.waits->size() == 3u);
    BOOST_TEST(waiter.waits->front().count() == 30000);
    BOOST_TEST(gate.prompts.size() == 1u);
    BOOST_TEST(gate.prompts.front().find("Type DELETE") != std::string::npos);
    BOOST_TEST(bulk.purge_calls == 1u);
    BOOST_TEST(bulk.discard_calls == 1u);
    BOOST_TEST(bulk.discarded_ids.front() == "search-1");
}

BOOST_AUTO_TEST_CASE(yes_does_not_confirm_a_purge)
{
    fake_bulk_backend bulk;
    bulk.item_count = 7;
    scripted_gate gate({"YES"});
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::execute, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    auto report = run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year()));

    BOOST_TEST((report.status == target_status::declined));
    BOOST_TEST(bulk.purge_calls == 0u);
    BOOST_TEST(bulk.discard_calls == 1u);
}

BOOST_AUTO_TEST_CASE(dry_run_discards_without_prompt)
{
    fake_bulk_backend bulk;
    bulk.item_count = 7;
    scripted_gate gate;
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::dry_run, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    auto report = run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year()));

    BOOST_TEST((report.status == target_status::dry_run));
    BOOST_TEST(report.match_count == 7u);
    BOOST_TEST(gate.prompts.empty());
    BOOST_TEST(bulk.purge_calls == 0u);
    BOOST_TEST(bulk.discard_calls == 1u);
}

BOOST_AUTO_TEST_CASE(wait_ceiling_leaves_search_incomplete)
{
    fake_bulk_backend bulk;
    bulk.statuses = {job_status::running};
    bulk.item_count = 10;
    scripted_gate gate({"DELETE"});
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::execute, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    auto report = run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year()));

    BOOST_TEST((report.status == target_status::incomplete));
    BOOST_TEST(waiter.waits->size() == 20u);
    BOOST_TEST(bulk.refresh_calls == 21u);
    BOOST_TEST(gate.prompts.empty());
    BOOST_TEST(bulk.purge_calls == 0u);
    BOOST_TEST(bulk.discard_calls == 1u);
    BOOST_TEST(report.has_problem());
}

BOOST_AUTO_TEST_CASE(extended_wait_polls_for_two_hours)
{
    fake_bulk_backend bulk;
    bulk.statuses = {job_status::running};
    scripted_gate gate;
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::execute, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::extended_wait(), waiter.fn());

    auto report = run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year()));

    BOOST_TEST((report.status == target_status::incomplete));
    BOOST_TEST(waiter.waits->size() == 240u);
    BOOST_TEST(bulk.discard_calls == 1u);
}

BOOST_AUTO_TEST_CASE(failed_search_is_reported_and_discarded)
{
    fake_bulk_backend bulk;
    bulk.statuses = {job_status::running, job_status::failed};
    scripted_gate gate;
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::execute, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    auto report = run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year()));

    BOOST_TEST((report.status == target_status::failed));
    BOOST_TEST((report.error->code == errc::job_failed));
    BOOST_TEST(bulk.discard_calls == 1u);
}

BOOST_AUTO_TEST_CASE(transient_status_error_is_polled_again)
{
    fake_bulk_backend bulk;
    bulk.refresh_error = make_error(errc::net_timeout, "timed out");
    bulk.statuses = {job_status::completed};
    bulk.item_count = 3;
    scripted_gate gate;
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::check_only, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    auto report = run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year()));

    BOOST_TEST((report.status == target_status::checked));
    BOOST_TEST(report.match_count == 3u);
    BOOST_TEST(bulk.refresh_calls == 2u);
    BOOST_TEST(waiter.waits->size() == 1u);
    BOOST_TEST(bulk.discard_calls == 1u);
}

BOOST_AUTO_TEST_CASE(authorization_error_while_polling_still_discards)
{
    fake_bulk_backend bulk;
    bulk.refresh_error = make_error(errc::auth_failed, "401");
    scripted_gate gate;
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::execute, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    auto outcome = run_task(engine.run(backend_ref{std::ref<backend::bulk_search_backend>(bulk)},
        purge_request{mailbox, {}}, older_than_a_year()));

    BOOST_TEST(!outcome.has_value());
    BOOST_TEST((outcome.error().code == errc::auth_failed));
    BOOST_TEST(bulk.discard_calls == 1u);
    BOOST_TEST(ctx.reports().size() == 1u);
}

BOOST_AUTO_TEST_CASE(purge_error_is_reported_and_discarded)
{
    fake_bulk_backend bulk;
    bulk.item_count = 4;
    bulk.purge_error = make_error(errc::permission_denied, "403");
    scripted_gate gate({"DELETE"});
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::execute, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    auto report = run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year()));

    BOOST_TEST((report.status == target_status::failed));
    BOOST_TEST(report.accepted_for_purge == 0u);
    BOOST_TEST(bulk.discard_calls == 1u);
}

BOOST_AUTO_TEST_CASE(exception_after_creation_still_discards)
{
    fake_bulk_backend bulk;
    bulk.item_count = 4;
    bulk.throw_on_purge = true;
    scripted_gate gate({"DELETE"});
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::execute, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    BOOST_CHECK_THROW(run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year())), std::runtime_error);
    BOOST_TEST(bulk.discard_calls == 1u);
}

BOOST_AUTO_TEST_CASE(creation_failure_has_nothing_to_discard)
{
    fake_bulk_backend bulk;
    bulk.create_error = make_error(errc::permission_denied, "not a case member");
    scripted_gate gate;
    auto tokens = test::test_tokens();
    run_context ctx(run_mode::execute, backend_kind::bulk_search, tokens);
    recording_waiter waiter;
    deletion_engine engine(ctx, gate, engine_config::defaults(), waiter.fn());

    auto report = run_task(engine.purge_mailbox(bulk, mailbox, older_than_a_year()));

    BOOST_TEST((report.status == target_status::failed));
    BOOST_TEST(bulk.refresh_calls == 0u);
    BOOST_TEST(bulk.discard_calls == 0u);
}

BOOST_AUTO_TEST_CASE(poll_returns_last_status_on_timeout)
{
    fake_bulk_backend bulk;
    bulk.statuses = {job_status::pending, job_status::running};
    recording_waiter waiter;

    bulk_search_job job;
    job.id = "search-1";
    job.name = "MailPurge_test";
    auto polled = run_task(backend::poll_until_done(bulk, job, std::chrono::seconds{60},
        std::chrono::minutes{3}, waiter.fn()));

    BOOST_TEST(polled.has_value());
    BOOST_TEST((polled->status == job_status::running));
    BOOST_TEST(waiter.waits->size() == 3u);
    BOOST_TEST(bulk.refresh_calls == 4u);
}
