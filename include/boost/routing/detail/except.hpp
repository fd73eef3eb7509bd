//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_DETAIL_EXCEPT_HPP
#define BOOST_ROUTING_DETAIL_EXCEPT_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>
#include <string>

namespace boost {
namespace routing {
namespace detail {

BOOST_NORETURN BOOST_ROUTING_DECL void throw_invalid_argument(
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

// the error code message is appended to `what`
BOOST_NORETURN BOOST_ROUTING_DECL void throw_system_error(
    system::error_code const& ec,
    std::string const& what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // routing
} // boost

#endif
