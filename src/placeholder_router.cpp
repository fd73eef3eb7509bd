//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/routing/placeholder_router.hpp>
#include <boost/routing/detail/except.hpp>
#include <boost/routing/error.hpp>
#include "src/detail/placeholders.hpp"
#include "src/detail/trim.hpp"
#include <spdlog/spdlog.h>
#include <string_view>

namespace boost {
namespace routing {

placeholder_router::
placeholder_router(
    router_options opt)
    : opt_(std::move(opt))
{
    auto const m = opt_.default_action_method();
    if(m.empty())
        detail::throw_invalid_argument(
            "default action method is empty");
    if( m.find('/') != core::string_view::npos ||
        m.find("::") != core::string_view::npos)
        detail::throw_invalid_argument(
            "default action method is malformed");
}

placeholder_router::
~placeholder_router() = default;

placeholder_router&
placeholder_router::
add_target(
    core::string_view name,
    target_factory f)
{
    name = detail::trim(name, '\\');
    spdlog::debug("routing: add target {}",
        std::string_view(name));
    targets_[std::string(name.data(), name.size())] = std::move(f);
    return *this;
}

bool
placeholder_router::
is_placeholder(
    core::string_view token) noexcept
{
    return detail::find_placeholder(token) != nullptr;
}

std::string
placeholder_router::
fill_placeholders(
    core::string_view s,
    placeholder_params const& params) const
{
    std::string out;
    out.reserve(s.size());
    std::size_t n = 0;
    std::size_t i = 0;
    for(;;)
    {
        auto const pos = s.find('{', i);
        if(pos == core::string_view::npos)
            break;
        auto const end = s.find('}', pos);
        if(end == core::string_view::npos)
            break;
        auto const* ph = detail::find_placeholder(
            s.substr(pos, end - pos + 1));
        if(! ph)
        {
            // the brace is literal, a
            // placeholder may start after it
            out.append(s.data() + i, pos + 1 - i);
            i = pos + 1;
            continue;
        }
        out.append(s.data() + i, pos - i);
        if(n >= params.size())
            detail::throw_system_error(
                BOOST_ROUTING_ERR(error::missing_placeholder_parameter),
                "Placeholder parameter is empty: " + std::to_string(n));
        if(! ph->match(params[n]))
            detail::throw_system_error(
                BOOST_ROUTING_ERR(error::invalid_placeholder_parameter),
                "Placeholder parameter is invalid: " + std::to_string(n));
        out.append(params[n]);
        ++n;
        i = end + 1;
    }
    if(n == 0 && ! params.empty())
        detail::throw_system_error(
            BOOST_ROUTING_ERR(error::placeholders_not_found),
            "String has no placeholders. Parameters not required");
    out.append(s.data() + i, s.size() - i);
    return out;
}

core::string_view
placeholder_router::
default_action_method() const noexcept
{
    return opt_.default_action_method();
}

target_factory const*
placeholder_router::
find_target(
    core::string_view name) const noexcept
{
    auto it = targets_.find(std::string_view(
        detail::trim(name, '\\')));
    if(it == targets_.end())
        return nullptr;
    return &it->second;
}

} // routing
} // boost
