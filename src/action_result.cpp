//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/routing/action_result.hpp>
#include <boost/routing/detail/except.hpp>
#include <boost/routing/error.hpp>
#include <boost/json/kind.hpp>
#include <boost/json/string.hpp>
#include <fmt/format.h>
#include <cmath>

namespace boost {
namespace routing {

stringable::
~stringable() = default;

bool
action_result::
is_valid() const noexcept
{
    if(obj_)
        return true;
    switch(v_.kind())
    {
    case json::kind::array:
    case json::kind::object:
        return false;
    default:
        return true;
    }
}

std::string
action_result::
str() const
{
    if(obj_)
        return obj_->str();
    switch(v_.kind())
    {
    case json::kind::null:
        return {};
    case json::kind::bool_:
        if(v_.get_bool())
            return "1";
        return {};
    case json::kind::int64:
        return fmt::format("{}", v_.get_int64());
    case json::kind::uint64:
        return fmt::format("{}", v_.get_uint64());
    case json::kind::double_:
    {
        double const d = v_.get_double();
        if(std::isnan(d))
            return "NAN";
        if(std::isinf(d))
            return d < 0 ? "-INF" : "INF";
        return fmt::format("{}", d);
    }
    case json::kind::string:
    {
        json::string const& s = v_.get_string();
        return std::string(s.data(), s.size());
    }
    default:
        break;
    }
    detail::throw_system_error(
        BOOST_ROUTING_ERR(error::invalid_action_result),
        "Action return type must be scalar");
}

} // routing
} // boost
