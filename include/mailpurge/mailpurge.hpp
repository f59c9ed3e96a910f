#pragma once

#include <mailpurge/detail/result.hpp>
#include <mailpurge/detail/log.hpp>
#include <mailpurge/detail/retry_policy.hpp>
#include <mailpurge/detail/timeout_config.hpp>

#include <mailpurge/net/http.hpp>
#include <mailpurge/net/https_transport.hpp>
#include <mailpurge/net/tls_options.hpp>

#include <mailpurge/oauth2/token_source.hpp>
#include <mailpurge/oauth2/bearer_retry.hpp>

#include <mailpurge/purge/types.hpp>
#include <mailpurge/purge/date_filter.hpp>
#include <mailpurge/purge/size_parser.hpp>
#include <mailpurge/purge/confirmation.hpp>
#include <mailpurge/purge/audit_log.hpp>
#include <mailpurge/purge/engine_config.hpp>
#include <mailpurge/purge/run_context.hpp>
#include <mailpurge/purge/deletion_engine.hpp>

// Backends
#include <mailpurge/backend/mail_backend.hpp>
#include <mailpurge/backend/graph_mail_backend.hpp>
#include <mailpurge/backend/bulk_search_backend.hpp>
#include <mailpurge/backend/ediscovery_backend.hpp>
