//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_ACTION_RESULT_HPP
#define BOOST_ROUTING_ACTION_RESULT_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/json/string_view.hpp>
#include <boost/json/value.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace boost {
namespace routing {

/** Base class for objects with a defined string conversion.

    An action may return a pointer to a stringable
    object. The object is converted to text by calling
    @ref str when the action's result is produced.

    @par Example
    @code
    struct greeting : stringable
    {
        std::string str() const override
        {
            return "Hello, world!";
        }
    };

    action_result index(param_list const&, output_sink&)
    {
        return std::make_shared<greeting>();
    }
    @endcode
*/
class BOOST_ROUTING_SYMBOL_VISIBLE
    stringable
{
public:
    BOOST_ROUTING_DECL
    virtual ~stringable();

    /** Return the text representation of this object.
    */
    virtual std::string str() const = 0;
};

//-----------------------------------------------

/** The value returned by an action or a hook.

    A result holds either a JSON value or a
    @ref stringable object. Only null, booleans,
    numbers, strings and stringable objects are
    valid results; arrays and objects can be held
    but are rejected when the result is checked
    by the route.

    A default-constructed result is null.
*/
class action_result
{
public:
    /** Constructor

        The result is null.
    */
    action_result() noexcept = default;

    /** Constructor

        The result is null.
    */
    action_result(std::nullptr_t) noexcept
    {
    }

    /** Constructor

        The result holds the text `s`.
    */
    template<
        class T,
        typename std::enable_if<
            std::is_convertible<T,
                json::string_view>::value, int>::type = 0>
    action_result(T const& s)
        : v_(static_cast<json::string_view>(s))
    {
    }

    /** Constructor

        The result holds a stringable object. If
        `sp` is null, the result is null.
    */
    template<
        class U,
        typename std::enable_if<
            std::is_convertible<
                U*, stringable const*>::value, int>::type = 0>
    action_result(
        std::shared_ptr<U> sp) noexcept
        : obj_(std::move(sp))
    {
    }

    /** Constructor

        The result holds the JSON value constructed from `t`.
    */
    template<
        class T,
        typename std::enable_if<
            ! std::is_same<typename
                std::decay<T>::type, action_result>::value &&
            ! std::is_convertible<T, json::string_view>::value &&
            ! std::is_convertible<T, std::nullptr_t>::value &&
            std::is_constructible<json::value, T>::value, int>::type = 0>
    action_result(T&& t)
        : v_(std::forward<T>(t))
    {
    }

    /** Return true if the result is null.
    */
    bool
    is_null() const noexcept
    {
        return ! obj_ && v_.is_null();
    }

    /** Return true if the result may be converted to text.
    */
    BOOST_ROUTING_DECL
    bool
    is_valid() const noexcept;

    /** Return the held JSON value.

        When the result holds a stringable
        object, the returned value is null.
    */
    json::value const&
    value() const noexcept
    {
        return v_;
    }

    /** Return the held stringable object, or `nullptr`.
    */
    stringable const*
    object() const noexcept
    {
        return obj_.get();
    }

    /** Return the result converted to text.

        @li null and `false` produce an empty string
        @li `true` produces `"1"`
        @li numbers are written in decimal, doubles
            in their shortest round-trip form
        @li strings are returned verbatim
        @li stringable objects produce @ref stringable::str

        @throw system::system_error `error::invalid_action_result`
        if `is_valid() == false`.
    */
    BOOST_ROUTING_DECL
    std::string
    str() const;

private:
    json::value v_;
    std::shared_ptr<stringable const> obj_;
};

} // routing
} // boost

#endif
