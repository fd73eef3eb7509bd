//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_ROUTER_HPP
#define BOOST_ROUTING_ROUTER_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/routing/route_target.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>
#include <vector>

namespace boost {
namespace routing {

/** Values substituted for the placeholders of a URL template.
*/
using placeholder_params = std::vector<std::string>;

/** The services a route obtains from its router.

    A router creates routes, stores them and matches
    them against requests. A @ref route only needs the
    operations below, and refers to its router through
    this interface. The router must outlive every route
    which refers to it.
*/
class BOOST_ROUTING_SYMBOL_VISIBLE
    router
{
public:
    BOOST_ROUTING_DECL
    virtual ~router();

    /** Return a URL template with its placeholders filled.

        @param s The template text.

        @param params The values, in placeholder order.
    */
    virtual
    std::string
    fill_placeholders(
        core::string_view s,
        placeholder_params const& params) const = 0;

    /** Return the method used by descriptors which name none.
    */
    virtual
    core::string_view
    default_action_method() const noexcept = 0;

    /** Return the factory for the named target, or `nullptr`.
    */
    virtual
    target_factory const*
    find_target(
        core::string_view name) const noexcept = 0;
};

} // routing
} // boost

#endif
