/*

json.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

jsoncpp helpers for REST bodies.

*/

#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <json/json.h>

#include <mailpurge/detail/exception_bridge.hpp>
#include <mailpurge/detail/result.hpp>

namespace mailpurge::backend
{

[[nodiscard]] inline result<Json::Value> parse_json(std::string_view text)
{
    Json::Value root;
    std::string errs;
    std::istringstream strm{std::string(text)};
    // jsoncpp throws on pathological input such as excessive nesting.
    auto parsed = protect([&] { return Json::parseFromStream(Json::CharReaderBuilder(), strm, &root, &errs); },
        errc::invalid_response);
    if (!parsed)
        return fail<Json::Value>(std::move(parsed).error());
    if (!*parsed)
        return fail<Json::Value>(errc::invalid_response, "Malformed JSON in response.", errs);
    if (!root.isObject())
        return fail<Json::Value>(errc::invalid_response, "JSON response is not an object.");
    return root;
}

[[nodiscard]] inline std::string to_json(const Json::Value& value)
{
    Json::StreamWriterBuilder swb;
    swb["indentation"] = "";
    return Json::writeString(swb, value);
}

[[nodiscard]] inline std::optional<std::string> get_string(const Json::Value& obj, const char* key)
{
    if (!obj.isObject() || !obj.isMember(key))
        return std::nullopt;
    const auto& memb = obj[key];
    if (memb.isString())
        return memb.asString();
    if (memb.isNumeric())
        return memb.asString();
    return std::nullopt;
}

/// Counts arrive as numbers, but some endpoints serialize 64-bit values as strings.
[[nodiscard]] inline std::optional<std::uint64_t> get_uint64(const Json::Value& obj, const char* key)
{
    if (!obj.isObject() || !obj.isMember(key))
        return std::nullopt;
    const auto& memb = obj[key];
    if (memb.isUInt64())
        return memb.asUInt64();
    if (memb.isIntegral() && memb.asInt64() >= 0)
        return static_cast<std::uint64_t>(memb.asInt64());
    if (memb.isString())
    {
        const std::string text = memb.asString();
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
            return std::nullopt;
        try
        {
            return std::stoull(text);
        }
        catch (const std::out_of_range&)
        {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/// Graph error envelope: {"error": {"code": "...", "message": "..."}}.
[[nodiscard]] inline std::string error_message_of(std::string_view body)
{
    auto root = parse_json(body);
    if (!root)
        return {};
    const auto& err = (*root)["error"];
    auto code = get_string(err, "code");
    auto message = get_string(err, "message");
    if (code && message)
        return *code + ": " + *message;
    if (message)
        return *message;
    return code.value_or(std::string{});
}

} // namespace mailpurge::backend
