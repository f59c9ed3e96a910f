/*

exception_bridge.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Helpers to bridge exception-based third-party code into mailpurge::result.

*/

#pragma once

#include <exception>
#include <functional>
#include <new>
#include <source_location>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <mailpurge/detail/result.hpp>

namespace mailpurge
{

[[nodiscard]] inline error_info from_exception(
    std::exception_ptr eptr,
    errc fallback,
    std::source_location where = std::source_location::current())
{
    if (!eptr)
        return make_error(fallback, "unknown exception", std::string{}, {}, where);

    try
    {
        std::rethrow_exception(eptr);
    }
    catch (const std::system_error& exc)
    {
        return make_error(fallback, exc.what(), std::string{}, exc.code(), where);
    }
    catch (const std::bad_alloc&)
    {
        return make_error(errc::internal_error, "out of memory", std::string{}, {}, where);
    }
    catch (const std::exception& exc)
    {
        return make_error(fallback, exc.what(), std::string{}, {}, where);
    }
    catch (...)
    {
        return make_error(fallback, "unknown exception", std::string{}, {}, where);
    }
}

/// Run `f`, converting anything it throws into an error_info with code `fallback`.
template<class F>
[[nodiscard]] auto protect(F&& f, errc fallback,
    std::source_location where = std::source_location::current()) -> result<std::invoke_result_t<F>>
{
    using ret_t = std::invoke_result_t<F>;
    try
    {
        if constexpr (std::is_void_v<ret_t>)
        {
            std::invoke(std::forward<F>(f));
            return ok();
        }
        else
        {
            return result<ret_t>(std::invoke(std::forward<F>(f)));
        }
    }
    catch (...)
    {
        return detail::make_unexpected(from_exception(std::current_exception(), fallback, where));
    }
}

} // namespace mailpurge
