//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/routing/route_target.hpp>
#include <boost/routing/detail/except.hpp>
#include <boost/routing/error.hpp>
#include <string_view>

namespace boost {
namespace routing {

route_target::
~route_target() = default;

bool
route_target::
has_method(
    core::string_view name) const noexcept
{
    return methods_.find(std::string_view(name)) != methods_.end();
}

action_result
route_target::
invoke(
    core::string_view name,
    param_list const& params,
    output_sink& out)
{
    auto it = methods_.find(std::string_view(name));
    if(it == methods_.end())
        detail::throw_system_error(
            BOOST_ROUTING_ERR(error::method_not_found),
            "Class method not exists: " + std::string(name.data(), name.size()));
    return it->second(params, out);
}

void
route_target::
add_method(
    core::string_view name,
    method_type fn)
{
    methods_[std::string(name.data(), name.size())] = std::move(fn);
}

} // routing
} // boost
