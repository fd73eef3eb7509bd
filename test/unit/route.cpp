//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/routing/route.hpp>

#include "test_targets.hpp"

#include <boost/routing/placeholder_router.hpp>
#include <boost/core/lightweight_test.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace boost {
namespace routing {

struct route_test
{
    // Fills placeholders with a visible marker so
    // that delegation can be observed
    struct recording_router : router
    {
        mutable std::vector<std::string> templates;

        std::string
        fill_placeholders(
            core::string_view s,
            placeholder_params const& params) const override
        {
            templates.push_back(to_text(s));
            std::string out = "[" + to_text(s);
            for(auto const& p : params)
            {
                out.push_back('|');
                out.append(p);
            }
            out.push_back(']');
            return out;
        }

        core::string_view
        default_action_method() const noexcept override
        {
            return "main";
        }

        target_factory const*
        find_target(
            core::string_view) const noexcept override
        {
            return nullptr;
        }
    };

    placeholder_router pr;

    void
    testPath()
    {
        route rt(pr, "", "/", "Ctrl::index");
        BOOST_TEST_EQ(rt.path(), "/");

        auto check = [&](char const* in, char const* out)
        {
            rt.set_path(in);
            BOOST_TEST_EQ(rt.path(), out);
        };
        check("", "/");
        check("/", "/");
        check("///", "/");
        check("users", "/users");
        check("/users", "/users");
        check("//users//", "/users");
        check("/users/{int}/", "/users/{int}");
        check("a/b/c", "/a/b/c");
        check("/a//b/", "/a//b");
    }

    void
    testOrigin()
    {
        route rt(pr, "//{scheme}://domain.tld", "/", "Ctrl");
        BOOST_TEST_EQ(rt.origin(), "{scheme}://domain.tld");

        rt.set_origin("http://domain.tld/");
        BOOST_TEST_EQ(rt.origin(), "http://domain.tld/");

        rt.set_origin("///x");
        BOOST_TEST_EQ(rt.origin(), "x");

        rt.set_origin("");
        BOOST_TEST_EQ(rt.origin(), "");
    }

    void
    testPlaceholders()
    {
        route rt(pr, "{scheme}://{subdomain}.domain.tld",
            "/posts/{int}/{title}", "Blog::show/0");

        // no parameters returns the template
        BOOST_TEST_EQ(rt.origin(), "{scheme}://{subdomain}.domain.tld");
        BOOST_TEST_EQ(rt.path(), "/posts/{int}/{title}");
        BOOST_TEST_EQ(rt.path({}), "/posts/{int}/{title}");

        BOOST_TEST_EQ(rt.origin({"https", "blog"}),
            "https://blog.domain.tld");
        BOOST_TEST_EQ(rt.path({"25", "hello-world"}),
            "/posts/25/hello-world");
        BOOST_TEST_EQ(rt.url({"http", "www"}, {"1", "a"}),
            "http://www.domain.tld/posts/1/a");
        BOOST_TEST_EQ(rt.url(),
            "{scheme}://{subdomain}.domain.tld/posts/{int}/{title}");

        BOOST_TEST(error_of([&]
            {
                rt.path({"x", "y"});
            }) == error::invalid_placeholder_parameter);
    }

    void
    testDelegation()
    {
        recording_router rr;
        route rt(rr, "origin", "/path", "Ctrl");

        BOOST_TEST_EQ(rt.url(), "origin/path");
        BOOST_TEST(rr.templates.empty());

        BOOST_TEST_EQ(rt.url({"a"}, {}), "[origin|a]/path");
        BOOST_TEST_EQ(rt.url({}, {"b", "c"}), "origin[/path|b|c]");
        BOOST_TEST_EQ(rr.templates.size(), 2u);
        BOOST_TEST_EQ(rr.templates[0], "origin");
        BOOST_TEST_EQ(rr.templates[1], "/path");

        // the router supplies the default method
        BOOST_TEST_EQ(rt.action().descriptor()->method, "main");
    }

    void
    testActionParams()
    {
        route rt(pr, "", "/", "Ctrl::show");
        BOOST_TEST(rt.action_params().empty());

        rt.set_action_params({{2, "b"}, {1, "a"}, {3, "c"}});
        std::vector<std::int64_t> keys;
        for(auto const& kv : rt.action_params())
            keys.push_back(kv.first);
        BOOST_TEST_EQ(keys.size(), 3u);
        BOOST_TEST_EQ(keys[0], 1);
        BOOST_TEST_EQ(keys[1], 2);
        BOOST_TEST_EQ(keys[2], 3);

        // negative keys sort first
        rt.set_action_params({{0, "z"}, {-1, "n"}});
        BOOST_TEST_EQ(rt.action_params().begin()->first, -1);

        rt.set_action_params({{2, "b"}, {1, "a"}, {3, "c"}});
        BOOST_TEST_EQ(rt.action_params().at(2).as_string(), "b");

        // setting replaces
        rt.set_action_params({{0, 1}});
        BOOST_TEST_EQ(rt.action_params().size(), 1u);
    }

    void
    testNameAndOptions()
    {
        route rt(pr, "", "/", "Ctrl");
        BOOST_TEST(! rt.name());
        BOOST_TEST(rt.options().empty());

        rt.set_name("home")
          .set_options({{"cache", true}, {"ttl", 60}})
          .set_path("/home");
        BOOST_TEST(rt.name().has_value());
        BOOST_TEST_EQ(*rt.name(), "home");
        BOOST_TEST_EQ(rt.options().size(), 2u);
        BOOST_TEST(rt.options().at("cache").as_bool());
        BOOST_TEST_EQ(rt.path(), "/home");
    }

    void
    testDescriptor()
    {
        {
            auto d = parse_action_descriptor(
                "\\App\\Blog::show/1/0\\", "index");
            BOOST_TEST_EQ(d.target, "App\\Blog");
            BOOST_TEST_EQ(d.method, "show");
            BOOST_TEST_EQ(d.param_keys.size(), 2u);
            BOOST_TEST_EQ(d.param_keys[0], "1");
            BOOST_TEST_EQ(d.param_keys[1], "0");
            BOOST_TEST_EQ(d.str(), "App\\Blog::show/1/0");
        }
        {
            auto d = parse_action_descriptor("App\\Blog", "index");
            BOOST_TEST_EQ(d.target, "App\\Blog");
            BOOST_TEST_EQ(d.method, "index");
            BOOST_TEST(d.param_keys.empty());
            BOOST_TEST_EQ(d.str(), "App\\Blog::index");
        }
        {
            // only the first separator splits
            auto d = parse_action_descriptor("A::b::c/2/2", "index");
            BOOST_TEST_EQ(d.target, "A");
            BOOST_TEST_EQ(d.method, "b::c");
            BOOST_TEST_EQ(d.param_keys.size(), 2u);
        }
        {
            auto d = parse_action_descriptor("A::b/", "index");
            BOOST_TEST_EQ(d.method, "b");
            BOOST_TEST_EQ(d.param_keys.size(), 1u);
            BOOST_TEST_EQ(d.param_keys[0], "");
        }
        {
            auto d = parse_action_descriptor("A::", "index");
            BOOST_TEST_EQ(d.method, "");
        }
    }

    void
    testSetAction()
    {
        route rt(pr, "", "/", "Ctrl::show/0");
        BOOST_TEST(! rt.action().is_function());
        BOOST_TEST(rt.action().function() == nullptr);
        BOOST_TEST_EQ(rt.action().descriptor()->str(), "Ctrl::show/0");

        rt.set_action(
            [](param_map const&, construct_args const&, output_sink&)
                -> action_result
            {
                return "fn";
            });
        BOOST_TEST(rt.action().is_function());
        BOOST_TEST(rt.action().descriptor() == nullptr);
        BOOST_TEST_EQ(rt.run(), "fn");

        rt.set_action("\\Other");
        BOOST_TEST_EQ(rt.action().descriptor()->str(), "Other::index");
    }

    void
    run()
    {
        testPath();
        testOrigin();
        testPlaceholders();
        testDelegation();
        testActionParams();
        testNameAndOptions();
        testDescriptor();
        testSetAction();
    }
};

} // routing
} // boost

int
main()
{
    boost::routing::route_test().run();
    return boost::report_errors();
}
