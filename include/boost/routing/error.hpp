//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef BOOST_ROUTING_ERROR_HPP
#define BOOST_ROUTING_ERROR_HPP

#include <boost/routing/detail/config.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <string>
#include <type_traits>

namespace boost {
namespace routing {

/** Error codes returned by routes and routers.

    All of these are fatal to the current dispatch.
    They are reported by throwing `system::system_error`
    holding the corresponding error code.
*/
enum class error
{
    /** An action descriptor references a parameter key
        which is not present in the route's action parameters.
    */
    undefined_action_parameter = 1,

    /** The target named by an action descriptor is not
        registered with the router.
    */
    target_not_found,

    /** The target does not have the method named by
        the action descriptor.
    */
    method_not_found,

    /** An action returned a value which is neither
        null, a scalar, nor a @ref stringable.
    */
    invalid_action_result,

    /** A URL template has more placeholders than
        the parameters supplied to fill them.
    */
    missing_placeholder_parameter,

    /** A placeholder parameter does not match the
        pattern of its placeholder.
    */
    invalid_placeholder_parameter,

    /** Placeholder parameters were supplied for a
        URL template which has no placeholders.
    */
    placeholders_not_found
};

} // routing
namespace system {
template<>
struct is_error_code_enum<
    ::boost::routing::error>
{
    static bool const value = true;
};
} // system
namespace routing {

namespace detail {
struct BOOST_ROUTING_SYMBOL_VISIBLE error_cat_type
    : system::error_category
{
    BOOST_ROUTING_DECL const char* name() const noexcept override;
    BOOST_ROUTING_DECL std::string message(int) const override;
    BOOST_ROUTING_DECL char const* message(
        int, char*, std::size_t) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x8b6c2f1d9e0a7354 )
    {
    }
};
BOOST_ROUTING_DECL extern error_cat_type error_cat;
} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(error ev) noexcept
{
    return system::error_code{static_cast<
        std::underlying_type<error>::type>(ev),
        detail::error_cat};
}

} // routing
} // boost

#endif
