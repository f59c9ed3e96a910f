/*

mailpurge.cpp
-------------

Counts and purges old messages of a hosted mailbox through Microsoft Graph, either with
per-message batch deletes or with an eDiscovery search and purge.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <mailpurge/cli/options.hpp>
#include <mailpurge/detail/exception_bridge.hpp>
#include <mailpurge/mailpurge.hpp>


using namespace mailpurge;


namespace
{

void log_summary(const run_context& ctx)
{
    for (const auto& report : ctx.reports())
    {
        std::string line = report.target + ": " + std::string(to_string(report.status))
            + ", matched " + std::to_string(report.match_count);
        if (ctx.backend() == backend_kind::bulk_search)
            line += ", accepted for purge " + std::to_string(report.accepted_for_purge);
        else
            line += ", deleted " + std::to_string(report.tally.deleted) + ", failed " + std::to_string(report.tally.failed);
        if (report.error)
            line += " (" + report.error->to_string() + ")";

        if (report.has_problem())
            MAILPURGE_WARN(line);
        else
            MAILPURGE_INFO(line);
    }

    const run_totals& totals = ctx.totals();
    std::string summary = "Summary: " + std::to_string(totals.targets) + " targets, "
        + std::to_string(totals.matched) + " matched, ";
    if (ctx.backend() == backend_kind::bulk_search)
        summary += std::to_string(totals.accepted_for_purge) + " accepted for purge, ";
    else
        summary += std::to_string(totals.deleted) + " deleted, " + std::to_string(totals.failed) + " failed, ";
    summary += std::to_string(totals.problems) + " with errors, " + std::to_string(ctx.elapsed().count()) + "s elapsed.";

    if (totals.problems == 0)
        MAILPURGE_SUCCESS(summary);
    else
        MAILPURGE_WARN(summary);
}

} // namespace


int main(int argc, char* argv[])
{
    const std::string program = argc > 0 ? argv[0] : "mailpurge";

    auto parsed = cli::parse_args(argc, argv);
    if (!parsed)
    {
        std::cerr << "error: " << parsed.error().message << "\n\n" << cli::usage(program);
        return cli::exit_usage;
    }
    const cli::options& opts = *parsed;
    if (opts.help)
    {
        std::cout << cli::usage(program);
        return cli::exit_ok;
    }

    if (opts.verbose)
    {
        log::logger::instance().set_level(log::level::debug);
        log::logger::instance().set_trace_enabled(true);
    }

    const auto now = std::chrono::system_clock::now();
    auto filter = date_filter::from_request(opts.filter, now);
    if (!filter)
    {
        std::cerr << "error: " << filter.error().message << '\n'
                  << "Dates are YYYY-MM-DD (optionally with THH:MM:SS); a range needs --start-date and --end-date "
                     "at most 365 days apart and cannot be mixed with --older-than-days or --before.\n\n"
                  << cli::usage(program);
        return cli::exit_usage;
    }

    auto creds = cli::load_credentials(now);
    if (!creds)
    {
        std::cerr << "error: " << creds.error().message << "\n\n" << cli::usage(program);
        return cli::exit_usage;
    }

    std::unique_ptr<audit_log> audit;
    if (opts.audit_log)
    {
        auto opened = audit_log::open(*opts.audit_log);
        if (!opened)
        {
            std::cerr << "error: " << opened.error().message << '\n';
            return cli::exit_usage;
        }
        audit = std::move(*opened);
        audit->attach();
    }

    if (!opts.mode_given)
        MAILPURGE_WARN("No mode given, running as --dry-run. Nothing will be deleted; add --confirm to delete.");

    auto tokens = oauth2::token_source::fixed(creds->access_token, creds->expires_at);
    run_context ctx(opts.mode, opts.backend, tokens, now);

    engine_config config = opts.extended_wait ? engine_config::extended_wait() : engine_config::defaults();
    config.page_size = opts.page_size;

    console_confirmation_gate gate;
    deletion_engine engine(ctx, gate, config);

    boost::asio::io_context io_ctx;
    boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);

    backend::graph_options graph;
    net::tls_options tls;
    tls.verify = net::verify_mode::peer;
    tls.verify_host = true;
    tls.use_default_verify_paths = true;
    net::https_transport transport(io_ctx.get_executor(), ssl_ctx, graph.host, "443", tls);

    backend::graph_mail_backend mail(transport, tokens, graph);
    backend::ediscovery_backend bulk(transport, tokens, backend::ediscovery_options{opts.case_id});
    const backend_ref selected = opts.backend == backend_kind::bulk_search
        ? backend_ref{std::reference_wrapper<backend::bulk_search_backend>(bulk)}
        : backend_ref{std::reference_wrapper<backend::mail_backend>(mail)};

    const purge_request request{opts.mailbox, opts.folders};
    bool aborted = false;

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            auto outcome = co_await engine.run(selected, request, *filter);
            if (!outcome)
            {
                MAILPURGE_ERROR("Run aborted: " + outcome.error().to_string());
                aborted = true;
            }
            transport.close();
        },
        [&](std::exception_ptr eptr)
        {
            if (!eptr)
                return;
            MAILPURGE_ERROR("Run aborted: " + from_exception(eptr, errc::internal_error).to_string());
            aborted = true;
        });

    io_ctx.run();

    log_summary(ctx);
    if (audit)
        audit->detach();
    return aborted || ctx.exit_code() != 0 ? cli::exit_failure : cli::exit_ok;
}
