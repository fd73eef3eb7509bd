//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_ROUTE_TARGET_HPP
#define BOOST_ROUTING_ROUTE_TARGET_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/routing/action_result.hpp>
#include <boost/routing/output_sink.hpp>
#include <boost/any.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/json/value.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace boost {
namespace routing {

/** The positional arguments passed to a target method.
*/
using param_list = std::vector<json::value>;

/** Values forwarded to the construction of a target.
*/
using construct_args = std::vector<any>;

//-----------------------------------------------

/** Base class of the targets named by action descriptors.

    A target is created for each dispatch of a route
    whose action is a descriptor such as `"blog::show/0"`.
    Derived classes register their methods by name
    in their constructor.

    @par Example
    @code
    class blog : public route_target
    {
    public:
        blog()
        {
            add_method("show", &blog::show);
        }

        action_result show(param_list const& params, output_sink& out)
        {
            out << "post ";
            return params.at(0);
        }
    };
    @endcode

    A target may additionally derive from
    @ref before_action_hook or @ref after_action_hook.
*/
class BOOST_ROUTING_SYMBOL_VISIBLE
    route_target
{
public:
    /** The type of a registered method.
    */
    using method_type = std::function<
        action_result(param_list const&, output_sink&)>;

    route_target(route_target const&) = delete;
    route_target& operator=(route_target const&) = delete;

    BOOST_ROUTING_DECL
    virtual ~route_target();

    /** Return true if a method with the given name is registered.
    */
    BOOST_ROUTING_DECL
    bool
    has_method(core::string_view name) const noexcept;

    /** Invoke a registered method.

        @throw system::system_error `error::method_not_found`
        if no method is registered under `name`.
    */
    BOOST_ROUTING_DECL
    action_result
    invoke(
        core::string_view name,
        param_list const& params,
        output_sink& out);

protected:
    route_target() = default;

    /** Register a method.

        A method registered twice replaces the
        previous registration.
    */
    BOOST_ROUTING_DECL
    void
    add_method(
        core::string_view name,
        method_type fn);

    /** Register a member function of the derived class.
    */
    template<class T>
    void
    add_method(
        core::string_view name,
        action_result (T::*mf)(param_list const&, output_sink&))
    {
        static_assert(
            std::is_base_of<route_target, T>::value,
            "T must derive from route_target");
        T* self = static_cast<T*>(this);
        add_method(name, method_type(
            [self, mf](param_list const& params, output_sink& out)
            {
                return (self->*mf)(params, out);
            }));
    }

private:
    std::map<std::string, method_type, std::less<>> methods_;
};

//-----------------------------------------------

/** Capability of a target to intercept dispatch.

    When the target of a route implements this hook,
    it is called before the action method. If the
    captured output together with the returned value
    is not empty, that text becomes the response and
    the action method is not called.
*/
class before_action_hook
{
public:
    virtual ~before_action_hook() = default;

    virtual
    action_result
    before_action(
        core::string_view method,
        param_list const& params,
        output_sink& out) = 0;
};

/** Capability of a target to produce a deferred result.

    When the action method of a target implementing this
    hook returns null, the hook is called and its value
    replaces the result.
*/
class after_action_hook
{
public:
    virtual ~after_action_hook() = default;

    virtual
    action_result
    after_action(
        core::string_view method,
        param_list const& params,
        output_sink& out) = 0;
};

//-----------------------------------------------

/** A function which creates a target from construct arguments.
*/
using target_factory = std::function<
    std::unique_ptr<route_target>(construct_args const&)>;

/** Return a factory which creates targets of type `T`.

    When `T` is constructible from `construct_args const&`
    the arguments are passed to its constructor, otherwise
    `T` is default constructed and the arguments are ignored.
*/
template<class T>
target_factory
make_target_factory()
{
    static_assert(
        std::is_base_of<route_target, T>::value,
        "T must derive from route_target");
    return [](construct_args const& args)
        -> std::unique_ptr<route_target>
    {
        if constexpr(std::is_constructible<
            T, construct_args const&>::value)
            return std::unique_ptr<route_target>(new T(args));
        else
            return std::unique_ptr<route_target>(new T());
    };
}

} // routing
} // boost

#endif
