//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_SRC_DETAIL_TRIM_HPP
#define BOOST_ROUTING_SRC_DETAIL_TRIM_HPP

#include <boost/core/detail/string_view.hpp>

namespace boost {
namespace routing {
namespace detail {

inline
core::string_view
trim_left(
    core::string_view s,
    char c) noexcept
{
    while(! s.empty() && s.front() == c)
        s.remove_prefix(1);
    return s;
}

inline
core::string_view
trim_right(
    core::string_view s,
    char c) noexcept
{
    while(! s.empty() && s.back() == c)
        s.remove_suffix(1);
    return s;
}

inline
core::string_view
trim(
    core::string_view s,
    char c) noexcept
{
    return trim_right(trim_left(s, c), c);
}

} // detail
} // routing
} // boost

#endif
