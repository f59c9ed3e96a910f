#pragma once

#include <string>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <mailpurge/detail/asio_decl.hpp>
#include <mailpurge/detail/result.hpp>
#include <mailpurge/net/tls_options.hpp>

namespace mailpurge::net
{

[[nodiscard]] inline std::string openssl_error_message()
{
    const unsigned long err = ERR_get_error();
    if (err == 0)
        return {};
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

/**
Configure the TLS trust store for a context.
**/
inline result<void> configure_trust_store(mailpurge::asio::ssl::context& ctx, const tls_options& options)
{
    mailpurge::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
    }

    for (const auto& file : options.ca_files)
    {
        if (!file.empty())
        {
            ctx.load_verify_file(file, ec);
            if (ec)
                return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
        }
    }

    for (const auto& path : options.ca_paths)
    {
        if (!path.empty())
        {
            ctx.add_verify_path(path, ec);
            if (ec)
                return fail<void>(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
        }
    }
    return ok();
}

/**
Apply the minimum protocol version and cipher list; keeps an already configured minimum.
**/
inline result<void> apply_tls_hardening(mailpurge::asio::ssl::context& ctx, const tls_options& options)
{
    if (options.min_tls_version.has_value())
    {
        const int current = SSL_CTX_get_min_proto_version(ctx.native_handle());
        if (current == 0)
        {
            if (SSL_CTX_set_min_proto_version(ctx.native_handle(), options.min_tls_version.value()) != 1)
            {
                return fail<void>(errc::tls_handshake_failed,
                    "TLS min version configuration failed.", openssl_error_message());
            }
        }
    }

    if (!options.cipher_list.empty())
    {
        if (SSL_CTX_set_cipher_list(ctx.native_handle(), options.cipher_list.c_str()) != 1)
        {
            return fail<void>(errc::tls_handshake_failed,
                "TLS cipher list configuration failed.", openssl_error_message());
        }
    }
    return ok();
}

} // namespace mailpurge::net
