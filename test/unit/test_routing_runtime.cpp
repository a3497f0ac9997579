#include "fake_host.hpp"
#include "tsuba/runtime/routing.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace tsuba;
using tsuba::test_support::request;
using tsuba::test_support::response;
using tsuba::test_support::routes_builder;

TEST(RoutingRuntime, MethodNames) {
    EXPECT_EQ(parse_method("GET"), method::get);
    EXPECT_EQ(parse_method("DELETE"), method::del);
    EXPECT_EQ(parse_method("COPY"), method::copy);
    EXPECT_EQ(parse_method("get"), method::unknown);
    EXPECT_EQ(parse_method(""), method::unknown);
    EXPECT_EQ(method_to_string(method::patch), "PATCH");
    EXPECT_EQ(method_to_string(method::del), "DELETE");
    EXPECT_EQ(method_to_string(method::unknown), "UNKNOWN");
}

TEST(RoutingRuntime, Vocabulary) {
    using namespace tsuba::vocabulary;
    EXPECT_EQ(del, method::del);
    EXPECT_EQ(options, method::options);

    body_policy whole = collect;
    EXPECT_EQ(whole.kind, body_policy::mode::collect);
    EXPECT_FALSE(whole.max_size.has_value());

    body_policy capped = collect(1024);
    EXPECT_EQ(capped.kind, body_policy::mode::collect);
    ASSERT_TRUE(capped.max_size.has_value());
    EXPECT_EQ(*capped.max_size, 1024u);

    EXPECT_EQ(stream.kind, body_policy::mode::stream);
    EXPECT_NE(capped, whole);
}

TEST(RoutingRuntime, AttemptCapturesFailures) {
    auto ok = attempt([] { return 7; });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 7);

    auto failed = attempt([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_FALSE(failed.has_value());

    auto aborted = attempt([]() -> std::string {
        throw abort_error(problem_details::bad_request("nope"));
    });
    EXPECT_FALSE(aborted.has_value());
}

TEST(FakeHost, DispatchPrefersLiteralSegments) {
    routes_builder routes;
    routes.on(method::get, {"items", ":id"}, body_policy{}, [](request& req) {
        return "item " + req.path_params.at("id");
    });
    routes.on(method::get, {"items", "all"}, body_policy{}, [](request&) {
        return std::string("all");
    });

    EXPECT_EQ(routes.dispatch(method::get, "/items/4").body, "item 4");
    EXPECT_EQ(routes.dispatch(method::get, "/items/all").body, "all");

    auto missing = routes.dispatch(method::post, "/items/4");
    EXPECT_EQ(missing.status, 404);
}

TEST(FakeHost, DispatchByMethodName) {
    routes_builder routes;
    routes.on(method::del, {"items", ":id"}, body_policy{}, [](request& req) {
        return std::string(method_to_string(req.http_method)) + " " + req.path_params.at("id");
    });

    EXPECT_EQ(routes.dispatch("DELETE", "/items/7").body, "DELETE 7");

    auto lowercase = routes.dispatch("delete", "/items/7");
    EXPECT_EQ(lowercase.status, 404);
    EXPECT_NE(lowercase.body.find("\"detail\":\"UNKNOWN /items/7\""), std::string::npos);

    auto wrong_method = routes.dispatch(method::get, "/items/7");
    EXPECT_EQ(wrong_method.status, 404);
    EXPECT_NE(wrong_method.body.find("\"detail\":\"GET /items/7\""), std::string::npos);
}

TEST(FakeHost, GroupedCopiesShareRoutes) {
    routes_builder routes;
    auto api = routes.grouped({"api"}).with_middleware("auth");
    api.on(method::put, {"x"}, vocabulary::stream, [](request&) {});

    ASSERT_EQ(routes.routes().size(), 1u);
    const auto& entry = routes.routes()[0];
    EXPECT_EQ(entry.segments, (std::vector<std::string>{"api", "x"}));
    EXPECT_EQ(entry.middleware, (std::vector<std::string>{"auth"}));
    EXPECT_EQ(entry.body, vocabulary::stream);
    EXPECT_EQ(routes.dispatch(method::put, "/api/x").status, 204);
}

TEST(FakeHost, AbortErrorsBecomeProblemResponses) {
    routes_builder routes;
    routes.on(method::get, {"n"}, body_policy{}, [](request& req) {
        return req.query().require<int>("value");
    });

    request with_value;
    with_value.query_params["value"] = "12";
    EXPECT_EQ(routes.dispatch(method::get, "/n", with_value).body, "12");

    auto missing = routes.dispatch(method::get, "/n");
    EXPECT_EQ(missing.status, 400);
    EXPECT_NE(missing.body.find("missing query parameter 'value'"), std::string::npos);

    request malformed;
    malformed.query_params["value"] = "twelve";
    EXPECT_EQ(routes.dispatch(method::get, "/n", malformed).status, 400);
}

TEST(FakeHost, RequestViews) {
    request req;
    req.query_params["page"] = "x";
    EXPECT_FALSE(req.query().get<int>("page").has_value());
    EXPECT_FALSE(req.query().get<int>("other").has_value());
    EXPECT_FALSE(req.auth().get<std::string>().has_value());
    EXPECT_THROW(req.auth().require<std::string>(), abort_error);
    EXPECT_THROW(req.content().decode<std::string>(), abort_error);

    req.principal = "ana";
    req.body = "payload";
    EXPECT_EQ(req.auth().require<std::string>(), "ana");
    EXPECT_EQ(req.content().decode<std::string>(), "payload");
}
