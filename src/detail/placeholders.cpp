//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include "src/detail/placeholders.hpp"
#include <boost/url/grammar/alnum_chars.hpp>
#include <boost/url/grammar/alpha_chars.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/digit_chars.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/url/grammar/unsigned_rule.hpp>
#include <cstdint>

namespace boost {
namespace routing {
namespace detail {

namespace {

constexpr grammar::lut_chars lower_hex_chars =
    "0123456789abcdef";

constexpr grammar::lut_chars title_chars =
    grammar::lut_chars(grammar::alnum_chars) +
    grammar::lut_chars("_-");

template<class CharSet>
bool
all_of(
    core::string_view s,
    CharSet const& cs) noexcept
{
    if(s.empty())
        return false;
    auto const end = s.data() + s.size();
    return grammar::find_if_not(
        s.data(), end, cs) == end;
}

template<class CharSet>
bool
none_of(
    core::string_view s,
    CharSet const& cs) noexcept
{
    if(s.empty())
        return false;
    auto const end = s.data() + s.size();
    return grammar::find_if(
        s.data(), end, cs) == end;
}

bool
match_alpha(core::string_view s) noexcept
{
    return all_of(s, grammar::alpha_chars);
}

bool
match_alphanum(core::string_view s) noexcept
{
    return all_of(s, grammar::alnum_chars);
}

bool
match_any(core::string_view) noexcept
{
    return true;
}

bool
match_hex(core::string_view s) noexcept
{
    return all_of(s, grammar::hexdig_chars);
}

bool
match_int(core::string_view s) noexcept
{
    return s.size() <= 18 &&
        all_of(s, grammar::digit_chars);
}

bool
match_md5(core::string_view s) noexcept
{
    return s.size() == 32 &&
        all_of(s, lower_hex_chars);
}

bool
match_num(core::string_view s) noexcept
{
    return all_of(s, grammar::digit_chars);
}

bool
match_port(core::string_view s) noexcept
{
    auto rv = grammar::parse(s,
        grammar::unsigned_rule<std::uint16_t>{});
    return rv.has_value();
}

bool
match_scheme(core::string_view s) noexcept
{
    return s == "http" || s == "https";
}

bool
match_segment(core::string_view s) noexcept
{
    return none_of(s, grammar::lut_chars('/'));
}

bool
match_subdomain(core::string_view s) noexcept
{
    return none_of(s, grammar::lut_chars('.'));
}

bool
match_title(core::string_view s) noexcept
{
    return all_of(s, title_chars);
}

bool
match_uuid(core::string_view s) noexcept
{
    // 8-4-4-4-12
    if(s.size() != 36)
        return false;
    for(std::size_t i = 0; i < s.size(); ++i)
    {
        if(i == 8 || i == 13 || i == 18 || i == 23)
        {
            if(s[i] != '-')
                return false;
        }
        else if(! lower_hex_chars(s[i]))
        {
            return false;
        }
    }
    return true;
}

placeholder const placeholders[] = {
    { "{alpha}",     &match_alpha },
    { "{alphanum}",  &match_alphanum },
    { "{any}",       &match_any },
    { "{hex}",       &match_hex },
    { "{int}",       &match_int },
    { "{md5}",       &match_md5 },
    { "{num}",       &match_num },
    { "{port}",      &match_port },
    { "{scheme}",    &match_scheme },
    { "{segment}",   &match_segment },
    { "{subdomain}", &match_subdomain },
    { "{title}",     &match_title },
    { "{uuid}",      &match_uuid }
};

} // (anon)

placeholder const*
find_placeholder(
    core::string_view token) noexcept
{
    for(auto const& p : placeholders)
        if(p.token == token)
            return &p;
    return nullptr;
}

} // detail
} // routing
} // boost
