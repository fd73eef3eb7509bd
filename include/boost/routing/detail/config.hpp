//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_DETAIL_CONFIG_HPP
#define BOOST_ROUTING_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

namespace boost {

namespace routing {

//------------------------------------------------

# if (defined(BOOST_ROUTING_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_ROUTING_STATIC_LINK)
#  if defined(BOOST_ROUTING_SOURCE)
#   define BOOST_ROUTING_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_ROUTING_BUILD_DLL
#  else
#   define BOOST_ROUTING_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  BOOST_ROUTING_DECL
#  define BOOST_ROUTING_DECL
# endif

#if defined(__MINGW32__)
    #define BOOST_ROUTING_SYMBOL_VISIBLE BOOST_ROUTING_DECL
#else
    #define BOOST_ROUTING_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

# if !defined(BOOST_ROUTING_SOURCE) && !defined(BOOST_ALL_NO_LIB) && !defined(BOOST_ROUTING_NO_LIB)
#  define BOOST_LIB_NAME boost_routing
#  if defined(BOOST_ALL_DYN_LINK) || defined(BOOST_ROUTING_DYN_LINK)
#   define BOOST_DYN_LINK
#  endif
#  include <boost/config/auto_link.hpp>
# endif

//-----------------------------------------------

// Add source location to error codes
#ifdef BOOST_ROUTING_NO_SOURCE_LOCATION
# define BOOST_ROUTING_ERR(ev) (::boost::system::error_code(ev))
#else
# define BOOST_ROUTING_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
#endif

} // routing

// lift grammar and json into our namespace
namespace urls {
namespace grammar {}
}
namespace json {}
namespace routing {
namespace grammar = ::boost::urls::grammar;
namespace json = ::boost::json;
} // routing

} // boost

#endif
