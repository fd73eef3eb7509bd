//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_OUTPUT_SINK_HPP
#define BOOST_ROUTING_OUTPUT_SINK_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <fmt/format.h>
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>

namespace boost {
namespace routing {

class output_capture;

/** A writer for the incidental output of an action.

    Every invocation of an action or a hook receives
    its own sink. Text written to the sink is placed
    in front of the invocation's stringified result.

    @par Example
    @code
    action_result show(param_list const& params, output_sink& out)
    {
        out << "<h1>";
        out.print("{} items", params.size());
        out << "</h1>";
        return nullptr;
    }
    @endcode
*/
class output_sink
{
public:
    output_sink() = default;
    output_sink(output_sink const&) = delete;
    output_sink& operator=(output_sink const&) = delete;

    /** Append text to the output.
    */
    output_sink&
    write(core::string_view s)
    {
        buf_.append(s.data(), s.size());
        return *this;
    }

    /** Append text to the output.
    */
    output_sink&
    operator<<(core::string_view s)
    {
        return write(s);
    }

    /** Append formatted text to the output.
    */
    template<class... Args>
    output_sink&
    print(
        fmt::format_string<Args...> fs,
        Args&&... args)
    {
        fmt::format_to(
            std::back_inserter(buf_),
            fs, std::forward<Args>(args)...);
        return *this;
    }

    /** Return the text written so far.
    */
    core::string_view
    str() const noexcept
    {
        return buf_;
    }

    std::size_t
    size() const noexcept
    {
        return buf_.size();
    }

    bool
    empty() const noexcept
    {
        return buf_.empty();
    }

private:
    friend class output_capture;

    std::string buf_;
};

//-----------------------------------------------

/** A scope which captures incidental output.

    The capture owns a fresh @ref output_sink. The text
    written to it is obtained with @ref release. When the
    capture is destroyed without being released, for
    example because the invocation threw, its text is
    discarded and never reaches another invocation.
*/
class output_capture
{
public:
    output_capture() = default;
    output_capture(output_capture const&) = delete;
    output_capture& operator=(output_capture const&) = delete;

    /** Destructor

        Unreleased output is discarded.
    */
    BOOST_ROUTING_DECL
    ~output_capture();

    /** Return the sink to pass to the invocation.
    */
    output_sink&
    sink() noexcept
    {
        return sink_;
    }

    /** Return the captured text and end the capture.

        After the call the sink is empty.
    */
    std::string
    release() noexcept
    {
        released_ = true;
        std::string s;
        s.swap(sink_.buf_);
        return s;
    }

private:
    output_sink sink_;
    bool released_ = false;
};

} // routing
} // boost

#endif
