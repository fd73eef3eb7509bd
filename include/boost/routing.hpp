//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_HPP
#define BOOST_ROUTING_HPP

#include <boost/routing/action_result.hpp>
#include <boost/routing/error.hpp>
#include <boost/routing/output_sink.hpp>
#include <boost/routing/placeholder_router.hpp>
#include <boost/routing/route.hpp>
#include <boost/routing/route_target.hpp>
#include <boost/routing/router.hpp>

#endif
