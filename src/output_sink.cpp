//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/routing/output_sink.hpp>
#include <spdlog/spdlog.h>

namespace boost {
namespace routing {

output_capture::
~output_capture()
{
    if(! released_ && ! sink_.empty())
        spdlog::trace(
            "routing: discarding {} bytes of captured output",
            sink_.size());
}

} // routing
} // boost
