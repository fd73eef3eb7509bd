//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <boost/routing/route_target.hpp>

#include "test_targets.hpp"

#include <boost/routing/error.hpp>
#include <boost/core/lightweight_test.hpp>
#include <cstdint>
#include <string>

namespace boost {
namespace routing {

struct route_target_test
{
    void
    testMethods()
    {
        test_controller t;
        BOOST_TEST(t.has_method("show"));
        BOOST_TEST(t.has_method("index"));
        BOOST_TEST(! t.has_method("missing"));
        BOOST_TEST(! t.has_method("Show"));
        BOOST_TEST(! t.has_method(""));

        output_sink out;
        auto rv = t.invoke("show", {"a", 1}, out);
        BOOST_TEST_EQ(rv.str(), "show(a,1)");
        BOOST_TEST(out.empty());

        rv = t.invoke("echo", {}, out);
        BOOST_TEST_EQ(rv.str(), "42");
        BOOST_TEST_EQ(out.str(), "X");

        BOOST_TEST(error_of([&]
            {
                t.invoke("missing", {}, out);
            }) == error::method_not_found);
    }

    void
    testFunctionMethod()
    {
        struct target : route_target
        {
            target()
            {
                add_method("sum",
                    [](param_list const& params, output_sink&)
                        -> action_result
                    {
                        std::int64_t n = 0;
                        for(auto const& v : params)
                            n += v.as_int64();
                        return n;
                    });
            }
        };

        target t;
        output_sink out;
        BOOST_TEST_EQ(t.invoke("sum", {1, 2, 3}, out).str(), "6");
    }

    void
    testFactory()
    {
        // constructed from the arguments
        {
            call_log log;
            auto f = make_target_factory<test_controller>();
            auto t = f({&log});
            BOOST_TEST(t != nullptr);
            output_sink out;
            t->invoke("show", {}, out);
            BOOST_TEST_EQ(log.calls.size(), 1u);
            BOOST_TEST_EQ(log.calls[0], "show");
        }

        // default constructed, arguments ignored
        {
            auto f = make_target_factory<noisy_controller>();
            auto t = f({42, std::string("ignored")});
            BOOST_TEST(t != nullptr);
            BOOST_TEST(dynamic_cast<before_action_hook*>(t.get()) != nullptr);
            BOOST_TEST(dynamic_cast<after_action_hook*>(t.get()) == nullptr);
        }

        // capabilities
        {
            call_log log;
            auto t = make_target_factory<hooked_controller>()({&log});
            BOOST_TEST(dynamic_cast<before_action_hook*>(t.get()) != nullptr);
            BOOST_TEST(dynamic_cast<after_action_hook*>(t.get()) != nullptr);
            BOOST_TEST(t->has_method("secret"));
            BOOST_TEST(t->has_method("show"));
        }
    }

    void
    run()
    {
        testMethods();
        testFunctionMethod();
        testFactory();
    }
};

} // routing
} // boost

int
main()
{
    boost::routing::route_target_test().run();
    return boost::report_errors();
}
