/*

options.hpp
-----------

Command line and environment of the mailpurge tool.

*/

#pragma once

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include <mailpurge/detail/exception_bridge.hpp>
#include <mailpurge/detail/result.hpp>
#include <mailpurge/purge/date_filter.hpp>
#include <mailpurge/purge/types.hpp>

namespace mailpurge::cli
{

inline constexpr int exit_ok = 0;
inline constexpr int exit_failure = 1;
inline constexpr int exit_usage = 2;

struct options
{
    std::string mailbox;
    std::vector<std::string> folders;
    filter_request filter;
    backend_kind backend = backend_kind::remote_mail;
    run_mode mode = run_mode::dry_run;
    /// False when no mode flag was given and the dry-run default applies.
    bool mode_given = false;
    bool extended_wait = false;
    std::size_t page_size = 50;
    std::string case_id;
    std::optional<std::filesystem::path> audit_log;
    bool verbose = false;
    bool help = false;
};

[[nodiscard]] inline std::string usage(std::string_view program)
{
    std::string text = "Usage: ";
    text += program;
    text += R"( --mailbox <user@domain> [--folder <name>]...
       (--older-than-days <N> | --before <YYYY-MM-DD> | --start-date <YYYY-MM-DD> --end-date <YYYY-MM-DD>)
       [--backend graph|bulk-search] [--check-only | --dry-run | --confirm]
       [--extended-wait] [--page-size <N>] [--case-id <id>] [--audit-log <path>] [--verbose]

  --mailbox          mailbox to purge (user principal name)
  --folder           folder display name or well-known name (inbox, deleteditems, ...);
                     repeatable, default is every folder (graph backend only)
  --older-than-days  delete items received more than N days ago
  --before           delete items received before this date
  --start-date       first day of an inclusive range of at most 365 days
  --end-date         last day of the range
  --backend          graph (per-message deletes, default) or bulk-search (eDiscovery purge)
  --check-only       count matching items and stop
  --dry-run          report what would be deleted (default)
  --confirm          delete after typing the confirmation word
  --extended-wait    wait up to 120 minutes for a bulk search instead of 10
  --page-size        base page size, ids are fetched 4x this, at most 200 (default 50)
  --case-id          eDiscovery case that owns bulk searches (bulk-search only)
  --audit-log        append a timestamped audit trail to this file
  --verbose          debug logging and HTTP tracing

Environment:
  MAILPURGE_ACCESS_TOKEN       bearer token for Microsoft Graph (required)
  MAILPURGE_TOKEN_EXPIRES_IN   token lifetime in seconds (optional)
)";
    return text;
}

namespace detail
{

template<typename T>
[[nodiscard]] inline std::optional<T> parse_number(std::string_view text)
{
    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || first == last)
        return std::nullopt;
    return value;
}

} // namespace detail

/**
Parse and validate the command line. Filter dates are checked later by date_filter; everything
else that can be rejected without a remote call is rejected here.
**/
[[nodiscard]] inline result<options> parse_args(int argc, char* argv[])
{
    namespace po = boost::program_options;

    po::options_description desc("mailpurge options");
    desc.add_options()
        ("mailbox", po::value<std::string>(), "mailbox to purge")
        ("folder", po::value<std::vector<std::string>>()->composing(), "folder name, repeatable")
        ("older-than-days", po::value<int>(), "age cutoff in days")
        ("before", po::value<std::string>(), "cutoff date")
        ("start-date", po::value<std::string>(), "first day of the range")
        ("end-date", po::value<std::string>(), "last day of the range")
        ("backend", po::value<std::string>(), "graph or bulk-search")
        ("check-only", "count only")
        ("dry-run", "report only")
        ("confirm", "delete after confirmation")
        ("extended-wait", "wait up to 120 minutes for a bulk search")
        ("page-size", po::value<std::string>(), "base page size")
        ("case-id", po::value<std::string>(), "eDiscovery case id")
        ("audit-log", po::value<std::string>(), "audit trail file")
        ("verbose", "debug logging and HTTP tracing")
        ("help,h", "show usage");
    const po::positional_options_description no_positional;

    // Unknown options, stray positional arguments, repeated single-valued options and
    // malformed numbers all surface as po::error.
    auto parsed = protect([&]
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(no_positional).run(), vm);
        po::notify(vm);
        return vm;
    }, errc::invalid_argument);
    if (!parsed)
        return fail<options>(errc::invalid_argument, "Invalid command line: " + parsed.error().message);
    const po::variables_map& vm = *parsed;

    options opts;
    if (vm.count("help"))
    {
        opts.help = true;
        return opts;
    }

    if (vm.count("mailbox"))
        opts.mailbox = vm["mailbox"].as<std::string>();
    if (vm.count("folder"))
        opts.folders = vm["folder"].as<std::vector<std::string>>();
    if (vm.count("older-than-days"))
        opts.filter.older_than_days = vm["older-than-days"].as<int>();
    if (vm.count("before"))
        opts.filter.before = vm["before"].as<std::string>();
    if (vm.count("start-date"))
        opts.filter.start_date = vm["start-date"].as<std::string>();
    if (vm.count("end-date"))
        opts.filter.end_date = vm["end-date"].as<std::string>();

    if (vm.count("backend"))
    {
        const std::string& name = vm["backend"].as<std::string>();
        if (name == "graph")
            opts.backend = backend_kind::remote_mail;
        else if (name == "bulk-search")
            opts.backend = backend_kind::bulk_search;
        else
            return fail<options>(errc::invalid_argument,
                "--backend must be graph or bulk-search, got \"" + name + "\".");
    }

    const auto modes = vm.count("check-only") + vm.count("dry-run") + vm.count("confirm");
    if (modes > 1)
        return fail<options>(errc::invalid_argument, "Use only one of --check-only, --dry-run and --confirm.");
    opts.mode_given = modes == 1;
    if (vm.count("check-only"))
        opts.mode = run_mode::check_only;
    else if (vm.count("confirm"))
        opts.mode = run_mode::execute;

    if (vm.count("page-size"))
    {
        // Parsed by hand: lexical_cast accepts "-5" for an unsigned target.
        auto size = detail::parse_number<std::size_t>(vm["page-size"].as<std::string>());
        if (!size || *size == 0 || *size > max_page_size)
            return fail<options>(errc::invalid_argument,
                "--page-size expects a number from 1 to " + std::to_string(max_page_size) + ".");
        opts.page_size = *size;
    }

    opts.extended_wait = vm.count("extended-wait") > 0;
    opts.verbose = vm.count("verbose") > 0;
    if (vm.count("case-id"))
        opts.case_id = vm["case-id"].as<std::string>();
    if (vm.count("audit-log"))
        opts.audit_log = std::filesystem::path(vm["audit-log"].as<std::string>());

    if (opts.mailbox.empty())
        return fail<options>(errc::invalid_argument, "--mailbox is required.");

    if (opts.backend == backend_kind::bulk_search)
    {
        if (opts.case_id.empty())
            return fail<options>(errc::invalid_argument, "--backend bulk-search needs --case-id.");
        if (!opts.folders.empty())
            return fail<options>(errc::invalid_argument,
                "--folder applies to the graph backend; bulk search covers the whole mailbox.");
    }
    return opts;
}

struct credentials
{
    std::string access_token;
    std::chrono::system_clock::time_point expires_at;
};

using env_lookup = std::function<const char*(const char*)>;

/// Bearer token from MAILPURGE_ACCESS_TOKEN; without MAILPURGE_TOKEN_EXPIRES_IN it is assumed valid for an hour.
[[nodiscard]] inline result<credentials> load_credentials(std::chrono::system_clock::time_point now,
    const env_lookup& lookup = [](const char* name) -> const char* { return std::getenv(name); })
{
    const char* token = lookup("MAILPURGE_ACCESS_TOKEN");
    if (token == nullptr || *token == '\0')
        return fail<credentials>(errc::missing_credentials,
            "MAILPURGE_ACCESS_TOKEN is not set; export a Microsoft Graph access token first.");

    std::chrono::seconds lifetime{3600};
    if (const char* expires = lookup("MAILPURGE_TOKEN_EXPIRES_IN"); expires != nullptr && *expires != '\0')
    {
        auto secs = detail::parse_number<long long>(expires);
        if (!secs || *secs <= 0)
            return fail<credentials>(errc::invalid_argument,
                "MAILPURGE_TOKEN_EXPIRES_IN must be a positive number of seconds.");
        lifetime = std::chrono::seconds{*secs};
    }
    return credentials{token, now + lifetime};
}

} // namespace mailpurge::cli
