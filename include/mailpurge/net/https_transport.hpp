/*

https_transport.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

HTTP/1.1 over TLS with Boost.Beast, one keep-alive connection per host.

*/


#pragma once

#include <memory>
#include <string>
#include <utility>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <mailpurge/detail/asio_decl.hpp>
#include <mailpurge/detail/log.hpp>
#include <mailpurge/detail/redact.hpp>
#include <mailpurge/detail/result.hpp>
#include <mailpurge/detail/timeout_config.hpp>
#include <mailpurge/net/error_mapping.hpp>
#include <mailpurge/net/http.hpp>
#include <mailpurge/net/tls_options.hpp>
#include <mailpurge/net/tls_trust_store.hpp>

namespace mailpurge::net
{

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

using mailpurge::asio::awaitable;
using mailpurge::asio::redirect_error;
using mailpurge::asio::use_awaitable;

/**
Blocking-in-coroutine HTTPS client for a single host.

Requests are strictly sequential; a stale keep-alive connection is reopened once.
**/
class https_transport : public http_transport
{
public:
    using stream_type = beast::ssl_stream<beast::tcp_stream>;

    https_transport(mailpurge::asio::any_io_executor executor, mailpurge::asio::ssl::context& ssl_ctx,
        std::string host, std::string service = "443", tls_options tls = {},
        timeout_config timeouts = timeout_config::graph())
        : executor_(std::move(executor)),
          ssl_ctx_(ssl_ctx),
          host_(std::move(host)),
          service_(std::move(service)),
          tls_(std::move(tls)),
          timeouts_(std::move(timeouts))
    {
    }

    https_transport(const https_transport&) = delete;
    https_transport& operator=(const https_transport&) = delete;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }

    awaitable<result<http_response>> send(http_request request) override
    {
        const bool reused = stream_ != nullptr;
        if (!stream_)
        {
            auto conn = co_await connect();
            if (!conn)
                co_return fail<http_response>(std::move(conn).error());
        }

        auto res = co_await exchange(request);
        if (!res && reused && is_stale_connection(res.error().code))
        {
            MAILPURGE_DEBUG("Keep-alive connection to " + host_ + " went stale, reconnecting.");
            close();
            auto conn = co_await connect();
            if (!conn)
                co_return fail<http_response>(std::move(conn).error());
            res = co_await exchange(request);
        }
        co_return res;
    }

    void close() noexcept
    {
        stream_.reset();
    }

private:
    [[nodiscard]] static bool is_stale_connection(errc code) noexcept
    {
        return code == errc::net_eof || code == errc::net_connection_reset;
    }

    [[nodiscard]] static bhttp::verb to_beast(http_verb verb) noexcept
    {
        switch (verb)
        {
            case http_verb::get: return bhttp::verb::get;
            case http_verb::post: return bhttp::verb::post;
            case http_verb::del: return bhttp::verb::delete_;
        }
        return bhttp::verb::get;
    }

    result<void> prepare_context()
    {
        if (context_ready_)
            return ok();
        auto trust_res = configure_trust_store(ssl_ctx_, tls_);
        if (!trust_res)
            return trust_res;
        auto harden_res = apply_tls_hardening(ssl_ctx_, tls_);
        if (!harden_res)
            return harden_res;
        context_ready_ = true;
        return ok();
    }

    awaitable<result_void> connect()
    {
        auto ctx_res = prepare_context();
        if (!ctx_res)
            co_return ctx_res;

        mailpurge::asio::error_code ec;
        mailpurge::asio::tcp::resolver resolver(executor_);
        auto endpoints = co_await resolver.async_resolve(host_, service_, redirect_error(use_awaitable, ec));
        if (ec)
            co_return net_failure(io_stage::resolve, ec, "async_resolve");

        auto stream = std::make_unique<stream_type>(executor_, ssl_ctx_);
        beast::get_lowest_layer(*stream).expires_after(timeouts_.get_connect());
        co_await beast::get_lowest_layer(*stream).async_connect(endpoints, redirect_error(use_awaitable, ec));
        if (ec)
            co_return net_failure(io_stage::connect, ec, "async_connect");

        if (SSL_set_tlsext_host_name(stream->native_handle(), host_.c_str()) != 1)
        {
            co_return fail<void>(errc::tls_handshake_failed, "TLS SNI configuration failed.",
                openssl_error_message());
        }

        if (tls_.verify == verify_mode::peer)
        {
            stream->set_verify_mode(mailpurge::asio::ssl::verify_peer);
            if (tls_.verify_host)
            {
                stream->set_verify_callback([hostname = host_](bool preverified, mailpurge::asio::ssl::verify_context& ctx)
                {
                    if (!preverified)
                        return false;
                    X509_STORE_CTX* store_ctx = ctx.native_handle();
                    if (store_ctx == nullptr)
                        return false;
                    if (X509_STORE_CTX_get_error_depth(store_ctx) != 0)
                        return true;
                    X509* cert = X509_STORE_CTX_get_current_cert(store_ctx);
                    if (cert == nullptr)
                        return false;
                    return X509_check_host(cert, hostname.c_str(), hostname.size(), 0, nullptr) == 1;
                });
            }
        }
        else
        {
            stream->set_verify_mode(mailpurge::asio::ssl::verify_none);
        }

        beast::get_lowest_layer(*stream).expires_after(timeouts_.get_handshake());
        co_await stream->async_handshake(mailpurge::asio::ssl::stream_base::client, redirect_error(use_awaitable, ec));
        if (ec)
            co_return net_failure(io_stage::handshake, ec, "async_handshake");

        stream_ = std::move(stream);
        co_return ok();
    }

    awaitable<result<http_response>> exchange(const http_request& request)
    {
        bhttp::request<bhttp::string_body> req{to_beast(request.verb), request.target, 11};
        req.set(bhttp::field::host, host_);
        req.set(bhttp::field::user_agent, "mailpurge/1.0");
        req.set(bhttp::field::accept, "application/json");
        for (const auto& [name, value] : request.headers)
            req.set(name, value);
        if (!request.body.empty())
        {
            if (!request.header("Content-Type"))
                req.set(bhttp::field::content_type, "application/json");
            req.body() = request.body;
        }
        req.keep_alive(true);
        req.prepare_payload();

        if (log::logger::instance().is_trace_enabled())
            MAILPURGE_TRACE_SEND(std::string(to_string(request.verb)) + " " + detail::redact_line(request.target));

        mailpurge::asio::error_code ec;
        beast::get_lowest_layer(*stream_).expires_after(timeouts_.get_write());
        co_await bhttp::async_write(*stream_, req, redirect_error(use_awaitable, ec));
        if (ec)
        {
            close();
            co_return fail<http_response>(net_failure(io_stage::write, ec, "http_write").error());
        }

        beast::flat_buffer buffer;
        bhttp::response<bhttp::string_body> res;
        beast::get_lowest_layer(*stream_).expires_after(timeouts_.get_read());
        co_await bhttp::async_read(*stream_, buffer, res, redirect_error(use_awaitable, ec));
        if (ec)
        {
            close();
            co_return fail<http_response>(net_failure(io_stage::read, ec, "http_read").error());
        }

        http_response out;
        out.status = res.result_int();
        for (const auto& field : res)
            out.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
        out.body = std::move(res.body());

        if (log::logger::instance().is_trace_enabled())
            MAILPURGE_TRACE_RECV(std::to_string(out.status) + " " + detail::redact_line(out.body));

        if (!res.keep_alive())
            close();
        co_return out;
    }

    [[nodiscard]] result_void net_failure(io_stage stage, mailpurge::asio::error_code ec, std::string_view op) const
    {
        const errc code = map_net_error(stage, ec, false);
        return fail<void>(code, "HTTPS " + std::string(stage_name(stage)) + " failed for " + host_ + ".",
            make_net_detail(host_, service_, stage, op).add_ec("sys", ec).str(), ec);
    }

    mailpurge::asio::any_io_executor executor_;
    mailpurge::asio::ssl::context& ssl_ctx_;
    std::string host_;
    std::string service_;
    tls_options tls_;
    timeout_config timeouts_;
    std::unique_ptr<stream_type> stream_;
    bool context_ready_ = false;
};

} // namespace mailpurge::net
