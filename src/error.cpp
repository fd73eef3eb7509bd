//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/routing/error.hpp>

namespace boost {
namespace routing {

namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.routing";
}

std::string
error_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
error_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(code))
    {
    case error::undefined_action_parameter: return "undefined action parameter";
    case error::target_not_found: return "action target not found";
    case error::method_not_found: return "action method not found";
    case error::invalid_action_result: return "action return type must be scalar";
    case error::missing_placeholder_parameter: return "placeholder parameter is empty";
    case error::invalid_placeholder_parameter: return "placeholder parameter is invalid";
    case error::placeholders_not_found: return "string has no placeholders";
    default:
        return "?";
    }
}

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
#else
error_cat_type error_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail

} // routing
} // boost
