//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <boost/routing/route.hpp>
#include <boost/routing/detail/except.hpp>
#include <boost/routing/error.hpp>
#include "src/detail/trim.hpp"
#include <boost/url/grammar/parse.hpp>
#include <boost/url/grammar/unsigned_rule.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <memory>

namespace boost {
namespace routing {

namespace {

void
check_result(
    action_result const& rv)
{
    if(! rv.is_valid())
        detail::throw_system_error(
            BOOST_ROUTING_ERR(error::invalid_action_result),
            "Action return type must be scalar");
}

std::string
make_string(core::string_view s)
{
    return std::string(s.data(), s.size());
}

// A key is a decimal integer with no leading
// zeros, an optional minus sign, and no "-0"
optional<std::int64_t>
parse_param_key(core::string_view s)
{
    bool const neg =
        ! s.empty() && s.front() == '-';
    if(neg)
        s.remove_prefix(1);
    auto rv = grammar::parse(s,
        grammar::unsigned_rule<std::uint64_t>{});
    if(! rv.has_value())
        return none;
    std::uint64_t const u = *rv;
    std::uint64_t const max = static_cast<
        std::uint64_t>(INT64_MAX);
    if(! neg)
    {
        if(u > max)
            return none;
        return static_cast<std::int64_t>(u);
    }
    if(u == 0 || u > max + 1)
        return none;
    if(u == max + 1)
        return INT64_MIN;
    return -static_cast<std::int64_t>(u);
}

} // (anon)

std::string
action_descriptor::
str() const
{
    std::string s = target;
    s.append("::");
    s.append(method);
    for(auto const& k : param_keys)
    {
        s.push_back('/');
        s.append(k);
    }
    return s;
}

action_descriptor
parse_action_descriptor(
    core::string_view s,
    core::string_view default_method)
{
    s = detail::trim(s, '\\');

    action_descriptor d;
    core::string_view m;
    auto const pos = s.find("::");
    if(pos == core::string_view::npos)
    {
        d.target = make_string(s);
        m = default_method;
    }
    else
    {
        d.target = make_string(s.substr(0, pos));
        m = s.substr(pos + 2);
    }

    auto n = m.find('/');
    d.method = make_string(m.substr(0, n));
    while(n != core::string_view::npos)
    {
        m.remove_prefix(n + 1);
        n = m.find('/');
        d.param_keys.push_back(
            make_string(m.substr(0, n)));
    }
    return d;
}

//-----------------------------------------------

route::
route(
    router const& r,
    core::string_view origin,
    core::string_view path,
    core::string_view action)
    : router_(&r)
    , action_(parse_action_descriptor(
        action, r.default_action_method()))
{
    set_origin(origin);
    set_path(path);
}

route::
route(
    router const& r,
    core::string_view origin,
    core::string_view path,
    action_function action)
    : router_(&r)
    , action_(std::move(action))
{
    set_origin(origin);
    set_path(path);
}

std::string
route::
origin(
    placeholder_params const& params) const
{
    if(params.empty())
        return origin_;
    return router_->fill_placeholders(
        origin_, params);
}

route&
route::
set_origin(
    core::string_view s)
{
    origin_ = make_string(
        detail::trim_left(s, '/'));
    return *this;
}

std::string
route::
path(
    placeholder_params const& params) const
{
    if(params.empty())
        return path_;
    return router_->fill_placeholders(
        path_, params);
}

route&
route::
set_path(
    core::string_view s)
{
    s = detail::trim(s, '/');
    path_.clear();
    path_.reserve(s.size() + 1);
    path_.push_back('/');
    path_.append(s.data(), s.size());
    return *this;
}

std::string
route::
url(
    placeholder_params const& origin_params,
    placeholder_params const& path_params) const
{
    auto s = origin(origin_params);
    s.append(path(path_params));
    return s;
}

route&
route::
set_action(
    core::string_view descriptor)
{
    action_ = parse_action_descriptor(
        descriptor, router_->default_action_method());
    return *this;
}

route&
route::
set_action(
    action_function f)
{
    action_ = std::move(f);
    return *this;
}

route&
route::
set_action_params(
    param_map params)
{
    params_ = std::move(params);
    return *this;
}

route&
route::
set_name(
    core::string_view s)
{
    name_ = make_string(s);
    return *this;
}

route&
route::
set_options(
    json::object options)
{
    options_ = std::move(options);
    return *this;
}

param_list
route::
resolve_params(
    action_descriptor const& d) const
{
    param_list v;
    v.reserve(d.param_keys.size());
    for(auto const& key : d.param_keys)
    {
        auto it = params_.end();
        auto const n = parse_param_key(key);
        if(n.has_value())
            it = params_.find(*n);
        if(it == params_.end())
            detail::throw_system_error(
                BOOST_ROUTING_ERR(error::undefined_action_parameter),
                "Undefined action parameter: " + key);
        v.push_back(it->second);
    }
    return v;
}

std::string
route::
run(
    construct_args const& args) const
{
    if(auto const* f = action_.function())
    {
        spdlog::debug("routing: run function action {}", path_);
        output_capture cap;
        action_result rv = (*f)(params_, args, cap.sink());
        check_result(rv);
        std::string s = cap.release();
        s.append(rv.str());
        return s;
    }

    auto const& d = *action_.descriptor();
    auto const params = resolve_params(d);

    auto const* factory = router_->find_target(d.target);
    if(! factory || ! *factory)
        detail::throw_system_error(
            BOOST_ROUTING_ERR(error::target_not_found),
            "Class not exists: " + d.target);
    spdlog::debug("routing: run {}", d.str());

    std::unique_ptr<route_target> t = (*factory)(args);
    if(! t)
        detail::throw_system_error(
            BOOST_ROUTING_ERR(error::target_not_found),
            "Class not exists: " + d.target);
    if(! t->has_method(d.method))
        detail::throw_system_error(
            BOOST_ROUTING_ERR(error::method_not_found),
            "Class method not exists: " + d.target + "::" + d.method);

    if(auto* h = dynamic_cast<before_action_hook*>(t.get()))
    {
        output_capture cap;
        action_result rv = h->before_action(
            d.method, params, cap.sink());
        check_result(rv);
        std::string s = cap.release();
        s.append(rv.str());
        if(! s.empty())
        {
            spdlog::debug(
                "routing: {} intercepted by before_action",
                d.str());
            return s;
        }
    }

    output_capture cap;
    action_result rv = t->invoke(
        d.method, params, cap.sink());
    check_result(rv);
    if(rv.is_null())
    {
        if(auto* h = dynamic_cast<after_action_hook*>(t.get()))
        {
            spdlog::trace(
                "routing: {} result from after_action",
                d.str());
            rv = h->after_action(
                d.method, params, cap.sink());
            check_result(rv);
        }
    }
    std::string s = cap.release();
    s.append(rv.str());
    return s;
}

} // routing
} // boost
