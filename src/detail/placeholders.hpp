//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_SRC_DETAIL_PLACEHOLDERS_HPP
#define BOOST_ROUTING_SRC_DETAIL_PLACEHOLDERS_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>

namespace boost {
namespace routing {
namespace detail {

struct placeholder
{
    // including the braces, e.g. "{int}"
    core::string_view token;

    // true if `s` may be substituted for the token
    bool (*match)(core::string_view s) noexcept;
};

// Returns nullptr if `token` is not a known placeholder
placeholder const*
find_placeholder(
    core::string_view token) noexcept;

} // detail
} // routing
} // boost

#endif
