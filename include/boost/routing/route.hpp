//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_ROUTE_HPP
#define BOOST_ROUTING_ROUTE_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/routing/action_result.hpp>
#include <boost/routing/output_sink.hpp>
#include <boost/routing/route_target.hpp>
#include <boost/routing/router.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <boost/optional/optional.hpp>
#include <boost/variant2/variant.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace boost {
namespace routing {

/** The action parameters of a route, ordered by key.
*/
using param_map = std::map<std::int64_t, json::value>;

/** A function used as the action of a route.

    The function receives the route's action parameters,
    the arguments given to @ref route::run, and the sink
    for its incidental output.
*/
using action_function = std::function<
    action_result(
        param_map const&,
        construct_args const&,
        output_sink&)>;

/** The parsed form of an action descriptor.

    The descriptor `"App\\Blog::show/2/0"` names the
    target `"App\\Blog"`, the method `"show"`, and
    the parameter keys `"2"` and `"0"`.
*/
struct action_descriptor
{
    /// The registered name of the target
    std::string target;

    /// The name of the method to invoke
    std::string method;

    /** Keys into the action parameters.

        The values found under these keys, in this
        order, are the arguments of the method.
    */
    std::vector<std::string> param_keys;

    /** Return the descriptor in its text form.
    */
    BOOST_ROUTING_DECL
    std::string
    str() const;
};

/** Parse an action descriptor.

    Backslashes surrounding `s` are removed. When `s`
    contains no `"::"`, `default_method` is used as the
    method name. Parameter keys are kept verbatim; they
    are checked when the route is run.

    @par Example
    @code
    auto d = parse_action_descriptor( "\\App\\Blog::show/1/0", "index" );
    assert( d.target == "App\\Blog" );
    assert( d.method == "show" );
    assert( d.param_keys.size() == 2 );
    @endcode
*/
BOOST_ROUTING_DECL
action_descriptor
parse_action_descriptor(
    core::string_view s,
    core::string_view default_method);

//-----------------------------------------------

/** The action of a route.

    An action is either a function, or a descriptor
    naming a method of a registered target. The kind is
    decided when the action is set on the route.
*/
class route_action
{
public:
    route_action(action_function f)
        : v_(std::move(f))
    {
    }

    route_action(action_descriptor d)
        : v_(std::move(d))
    {
    }

    /** Return true if the action is a function.
    */
    bool
    is_function() const noexcept
    {
        return v_.index() == 0;
    }

    /** Return the function, or `nullptr` if the action is a descriptor.
    */
    action_function const*
    function() const noexcept
    {
        return variant2::get_if<action_function>(&v_);
    }

    /** Return the descriptor, or `nullptr` if the action is a function.
    */
    action_descriptor const*
    descriptor() const noexcept
    {
        return variant2::get_if<action_descriptor>(&v_);
    }

private:
    variant2::variant<
        action_function,
        action_descriptor> v_;
};

//-----------------------------------------------

/** A URL template bound to an action.

    A route holds an origin such as `"{scheme}://example.com"`,
    a path such as `"/posts/{int}"`, and an action which
    produces the response text when the route is run.

    @par Example
    @code
    placeholder_router r;
    r.add_target<blog>("App\\Blog");

    route rt(r, "", "/posts/{int}", "App\\Blog::show/0");
    rt.set_action_params({{0, "25"}});

    std::string body = rt.run();
    @endcode

    Routes are configured when they are registered and
    are not modified while they run. The router passed
    on construction must outlive the route.

    @par Thread Safety
    Distinct routes may be run concurrently. A route may
    be run concurrently with itself, as long as it is not
    modified at the same time.
*/
class BOOST_ROUTING_SYMBOL_VISIBLE
    route
{
public:
    /** Constructor

        @param r The router providing placeholder filling
        and target lookup.

        @param origin The URL origin, in the format
        `{scheme}://{hostname}[:{port}]`.

        @param path The URL path.

        @param action An action descriptor such
        as `"App\\Blog::show/0/2/1"`.
    */
    BOOST_ROUTING_DECL
    route(
        router const& r,
        core::string_view origin,
        core::string_view path,
        core::string_view action);

    /** Constructor

        @param r The router providing placeholder filling.

        @param origin The URL origin.

        @param path The URL path.

        @param action The function to run.
    */
    BOOST_ROUTING_DECL
    route(
        router const& r,
        core::string_view origin,
        core::string_view path,
        action_function action);

    /** Return the URL origin template.
    */
    std::string const&
    origin() const noexcept
    {
        return origin_;
    }

    /** Return the URL origin with its placeholders filled.

        When `params` is empty the template is returned.
    */
    BOOST_ROUTING_DECL
    std::string
    origin(placeholder_params const& params) const;

    /** Set the URL origin.

        Leading slashes are removed.
    */
    BOOST_ROUTING_DECL
    route&
    set_origin(core::string_view s);

    /** Return the URL path template.
    */
    std::string const&
    path() const noexcept
    {
        return path_;
    }

    /** Return the URL path with its placeholders filled.

        When `params` is empty the template is returned.
    */
    BOOST_ROUTING_DECL
    std::string
    path(placeholder_params const& params) const;

    /** Set the URL path.

        The stored path starts with a single slash
        and has no trailing slash, unless it is `"/"`.
    */
    BOOST_ROUTING_DECL
    route&
    set_path(core::string_view s);

    /** Return the URL.

        This is the filled origin followed by the
        filled path.
    */
    BOOST_ROUTING_DECL
    std::string
    url(
        placeholder_params const& origin_params = {},
        placeholder_params const& path_params = {}) const;

    route_action const&
    action() const noexcept
    {
        return action_;
    }

    /** Set the action to a descriptor.

        The descriptor has the form `"Target::method"`, or
        `"Target::method/k0/k1/.../kn"` where each `k` is
        a key of the action parameters, in call order. A
        descriptor without `"::"` uses the router's default
        action method.

        @see set_action_params, run
    */
    BOOST_ROUTING_DECL
    route&
    set_action(core::string_view descriptor);

    /** Set the action to a function.
    */
    BOOST_ROUTING_DECL
    route&
    set_action(action_function f);

    param_map const&
    action_params() const noexcept
    {
        return params_;
    }

    /** Set the action parameters.

        The keys are the ones referenced by the
        descriptor's parameter suffix.
    */
    BOOST_ROUTING_DECL
    route&
    set_action_params(param_map params);

    optional<std::string> const&
    name() const noexcept
    {
        return name_;
    }

    BOOST_ROUTING_DECL
    route&
    set_name(core::string_view s);

    /** Return the options.

        Options are not interpreted by the route.
    */
    json::object const&
    options() const noexcept
    {
        return options_;
    }

    BOOST_ROUTING_DECL
    route&
    set_options(json::object options);

    /** Run the action.

        For a function action, the function is called with
        the action parameters and `args`.

        For a descriptor action, the target is created with
        `args`. If the target implements @ref before_action_hook
        and the hook produces any text, that text is returned
        and the method is not called. Otherwise the method is
        called with the action parameters named by the
        descriptor. When the method returns null and the target
        implements @ref after_action_hook, the hook's value
        is used instead.

        @return The incidental output of the invocation
        followed by its result converted to text.

        @throw system::system_error with
        @li `error::undefined_action_parameter`,
        @li `error::target_not_found`,
        @li `error::method_not_found`,
        @li `error::invalid_action_result`.

        Exceptions thrown by the action propagate.

        @param args The arguments for the target factory.
    */
    BOOST_ROUTING_DECL
    std::string
    run(construct_args const& args = {}) const;

private:
    param_list
    resolve_params(
        action_descriptor const& d) const;

    router const* router_;
    std::string origin_;
    std::string path_;
    route_action action_;
    param_map params_;
    optional<std::string> name_;
    json::object options_;
};

} // routing
} // boost

#endif
