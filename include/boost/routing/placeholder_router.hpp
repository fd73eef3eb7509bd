//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_PLACEHOLDER_ROUTER_HPP
#define BOOST_ROUTING_PLACEHOLDER_ROUTER_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/routing/router.hpp>
#include <boost/routing/route_target.hpp>
#include <boost/core/detail/string_view.hpp>
#include <functional>
#include <map>
#include <string>

namespace boost {
namespace routing {

/** Configuration options for routers.
*/
struct router_options
{
    /** Constructor.

        The default action method is `"index"`.
    */
    router_options() = default;

    /** Set the method used by descriptors which name none.

        A descriptor such as `"blog"` is dispatched as
        `"blog::<name>"`. The name must not be empty and must
        not contain `'/'` or `"::"`; this is checked when the
        options are given to a router.

        @par Example
        @code
        placeholder_router r( router_options()
            .default_action_method( "main" ) );
        @endcode

        @param name The method name.

        @return A reference to `*this` for chaining.
    */
    router_options&
    default_action_method(
        core::string_view name)
    {
        method_.assign(name.data(), name.size());
        return *this;
    }

    /** Return the method used by descriptors which name none.
    */
    core::string_view
    default_action_method() const noexcept
    {
        return method_;
    }

private:
    std::string method_ = "index";
};

//-----------------------------------------------

/** A router which fills named placeholders.

    This router provides the services used by a @ref route:
    placeholder substitution, the default action method,
    and a registry of the targets named by descriptors.
    It does not store or match routes.

    The recognized placeholders, with the values they
    accept, are:

    @li `{alpha}` letters
    @li `{alphanum}` letters and digits
    @li `{any}` any text, including none
    @li `{hex}` hexadecimal digits
    @li `{int}` 1 to 18 decimal digits
    @li `{md5}` 32 lowercase hexadecimal digits
    @li `{num}` decimal digits
    @li `{port}` a decimal number from 0 to 65535
    @li `{scheme}` `http` or `https`
    @li `{segment}` any non-empty text without `'/'`
    @li `{subdomain}` any non-empty text without `'.'`
    @li `{title}` letters, digits, `'_'` and `'-'`
    @li `{uuid}` a lowercase UUID

    Any other text between braces is copied literally.

    @par Example
    @code
    placeholder_router r;
    r.add_target<blog>("App\\Blog");
    route rt(r, "{scheme}://example.com", "/posts/{int}", "App\\Blog::show/0");
    assert(rt.url({"https"}, {"25"}) == "https://example.com/posts/25");
    @endcode
*/
class BOOST_ROUTING_SYMBOL_VISIBLE
    placeholder_router : public router
{
public:
    /** Constructor

        @throw std::invalid_argument if the
        default action method is malformed.
    */
    BOOST_ROUTING_DECL
    explicit
    placeholder_router(
        router_options opt = {});

    BOOST_ROUTING_DECL
    ~placeholder_router() override;

    /** Register a target under a name.

        Backslashes surrounding the name are removed,
        so `"\\App\\Blog"` and `"App\\Blog"` are the
        same target. A later registration under the same
        name replaces the earlier one.

        @return A reference to `*this` for chaining.
    */
    BOOST_ROUTING_DECL
    placeholder_router&
    add_target(
        core::string_view name,
        target_factory f);

    /** Register a target type under a name.

        @see make_target_factory
    */
    template<class T>
    placeholder_router&
    add_target(core::string_view name)
    {
        return add_target(name, make_target_factory<T>());
    }

    /** Return true if `token` is a recognized placeholder.

        @param token The placeholder including
        its braces, such as `"{int}"`.
    */
    BOOST_ROUTING_DECL
    static
    bool
    is_placeholder(core::string_view token) noexcept;

    /** Return a URL template with its placeholders filled.

        Placeholders are replaced from left to right by
        `params[0]`, `params[1]`, and so on. Surplus
        parameters are ignored.

        @throw system::system_error with
        @li `error::placeholders_not_found` if `params`
            is not empty and `s` has no placeholders,
        @li `error::missing_placeholder_parameter` if
            there are fewer parameters than placeholders,
        @li `error::invalid_placeholder_parameter` if
            a parameter does not match its placeholder.
    */
    BOOST_ROUTING_DECL
    std::string
    fill_placeholders(
        core::string_view s,
        placeholder_params const& params) const override;

    BOOST_ROUTING_DECL
    core::string_view
    default_action_method() const noexcept override;

    BOOST_ROUTING_DECL
    target_factory const*
    find_target(
        core::string_view name) const noexcept override;

private:
    router_options opt_;
    std::map<std::string, target_factory, std::less<>> targets_;
};

} // routing
} // boost

#endif
