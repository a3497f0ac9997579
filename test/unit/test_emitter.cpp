#include "tsuba/core/emitter.hpp"
#include "tsuba/core/header_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace tsuba;

namespace {

controller_spec controller_of(std::string_view source) {
    diagnostic_sink sink;
    auto unit = parse_header(source, "c.hpp", sink);
    EXPECT_TRUE(unit.has_value());
    if (!unit) {
        return {};
    }
    auto report = compile_routes(*unit, {});
    EXPECT_EQ(report.error_count(), 0u);
    EXPECT_EQ(report.controllers.size(), 1u);
    return report.controllers.empty() ? controller_spec{} : report.controllers.front();
}

} // namespace

TEST(Emitter, AdapterAndRegistration) {
    auto c = controller_of(R"(
struct [[tsuba::controller]] c {
    TSUBA_CONTROLLER();
    [[tsuba::get(path: "books", ":id", middleware: auth)]] book show(int id);
};
)");
    ASSERT_EQ(c.endpoints.size(), 1u);
    const auto& ep = c.endpoints[0];
    EXPECT_EQ(emit_handler_call(ep), "this->show(/*id=*/id)");
    EXPECT_EQ(emit_adapter(ep),
              "auto tsuba_adapter_show = [this](auto& req) -> book {\n"
              "    auto id = req.parameters().template require<int>(\"id\");\n"
              "    return this->show(/*id=*/id);\n"
              "};");
    EXPECT_EQ(emit_registration(ep, "routes"),
              "routes.with_middleware(auth).on(::tsuba::vocabulary::get, {\"books\", \":id\"}, "
              "::tsuba::vocabulary::collect, tsuba_adapter_show);");
}

TEST(Emitter, NoexceptAdapterWithoutParameters) {
    auto c = controller_of(R"(
struct [[tsuba::controller]] c {
    TSUBA_CONTROLLER();
    [[tsuba::get]] int version() noexcept;
};
)");
    ASSERT_EQ(c.endpoints.size(), 1u);
    EXPECT_EQ(emit_adapter(c.endpoints[0]),
              "auto tsuba_adapter_version = [this]([[maybe_unused]] auto& req) noexcept -> int {\n"
              "    return this->version();\n"
              "};");
}

TEST(Emitter, CustomEndpointRegistersInlineLambda) {
    auto c = controller_of(R"(
struct [[tsuba::controller]] c {
    TSUBA_CONTROLLER();
    [[tsuba::custom_endpoint(method: head, path: "ping")]] response ping(request& r);
};
)");
    ASSERT_EQ(c.endpoints.size(), 1u);
    EXPECT_EQ(emit_registration(c.endpoints[0], "grouped_routes"),
              "grouped_routes.on(head, {\"ping\"}, ::tsuba::vocabulary::collect, "
              "[this](auto& req) -> response { return this->ping(/*r=*/req); });");
}

TEST(Emitter, GroupDeclaration) {
    controller_spec spec;
    EXPECT_EQ(emit_group_declaration(spec), "");
    spec.global_path_segments = {"\"api\""};
    EXPECT_EQ(emit_group_declaration(spec), "auto grouped_routes = routes.grouped({\"api\"});");
    spec.global_middleware = {"auth", "log"};
    EXPECT_EQ(emit_group_declaration(spec),
              "auto grouped_routes = routes.grouped({\"api\"}).with_middleware(auth, log);");
    spec.global_path_segments.clear();
    EXPECT_EQ(emit_group_declaration(spec),
              "auto grouped_routes = routes.with_middleware(auth, log);");
}

TEST(Emitter, RouteBuilderCalls) {
    route_builder_spec rb;
    rb.name = "extra";
    rb.param_label = "r";
    EXPECT_EQ(emit_route_builder_call(rb, false), "this->extra(/*r=*/routes);");
    EXPECT_EQ(emit_route_builder_call(rb, true), "this->extra(/*r=*/routes);");

    rb.uses_global_grouping = known_flag{true};
    EXPECT_EQ(emit_route_builder_call(rb, true), "this->extra(/*r=*/grouped_routes);");
    EXPECT_EQ(emit_route_builder_call(rb, false), "this->extra(/*r=*/routes);");

    rb.param_label.reset();
    rb.uses_global_grouping = deferred_flag{"cfg.grouped"};
    EXPECT_EQ(emit_route_builder_call(rb, true),
              "if (cfg.grouped) {\n"
              "    this->extra(grouped_routes);\n"
              "} else {\n"
              "    this->extra(routes);\n"
              "}");
    EXPECT_EQ(emit_route_builder_call(rb, false), "this->extra(routes);");
}

TEST(Emitter, BootDefinitionOrder) {
    auto c = controller_of(R"(
struct [[tsuba::controller(path: "api")]] c {
    TSUBA_CONTROLLER();
    [[tsuba::custom_endpoint]] void raw(request& req);
    [[tsuba::post]] int add(int n);
    [[tsuba::route_builder(use_global_setting: true)]] void extra(routes_builder& r);
    [[tsuba::get]] int list();
};
)");
    EXPECT_EQ(emit_boot_definition(c),
              "template <typename Routes> void c::boot(Routes& routes) {\n"
              "    using namespace ::tsuba::vocabulary;\n"
              "    auto grouped_routes = routes.grouped({\"api\"});\n"
              "    auto tsuba_adapter_add = [this](auto& req) -> int {\n"
              "        auto n = req.parameters().template require<int>(\"n\");\n"
              "        return this->add(/*n=*/n);\n"
              "    };\n"
              "    auto tsuba_adapter_list = [this]([[maybe_unused]] auto& req) -> int {\n"
              "        return this->list();\n"
              "    };\n"
              "    grouped_routes.on(::tsuba::vocabulary::post, {\"add\"}, "
              "::tsuba::vocabulary::collect, tsuba_adapter_add);\n"
              "    grouped_routes.on(::tsuba::vocabulary::get, {\"list\"}, "
              "::tsuba::vocabulary::collect, tsuba_adapter_list);\n"
              "    grouped_routes.on(::tsuba::vocabulary::get, {\"raw\"}, "
              "::tsuba::vocabulary::collect, "
              "[this](auto& req) -> void { return this->raw(/*req=*/req); });\n"
              "    this->extra(/*r=*/grouped_routes);\n"
              "}\n");
}

TEST(Emitter, EmptyControllerSilencesUnusedRoutes) {
    auto plain = controller_of("struct [[tsuba::controller]] c { TSUBA_CONTROLLER(); };");
    EXPECT_EQ(emit_boot_definition(plain),
              "template <typename Routes> void c::boot(Routes& routes) {\n"
              "    using namespace ::tsuba::vocabulary;\n"
              "    static_cast<void>(routes);\n"
              "}\n");

    auto grouped = controller_of(R"(
struct [[tsuba::controller(middleware: auth)]] c {
    TSUBA_CONTROLLER();
    [[tsuba::route_builder]] void extra(routes_builder& r);
};
)");
    EXPECT_EQ(emit_boot_definition(grouped),
              "template <typename Routes> void c::boot(Routes& routes) {\n"
              "    using namespace ::tsuba::vocabulary;\n"
              "    auto grouped_routes = routes.with_middleware(auth);\n"
              "    this->extra(/*r=*/routes);\n"
              "    static_cast<void>(grouped_routes);\n"
              "}\n");
}

TEST(Emitter, RoutesHeaderLayout) {
    auto c = controller_of(R"(
namespace app::v1 {
struct [[tsuba::controller]] c { TSUBA_CONTROLLER(); };
}
)");
    header_context ctx;
    ctx.source_name = "c.hpp";
    ctx.include_spelling = "c.hpp";
    auto header = emit_routes_header({c}, ctx);
    EXPECT_EQ(header.rfind("// Generated by tsuba_gen from c.hpp. Do not edit.\n#pragma once\n", 0),
              0u);
    EXPECT_NE(header.find("#include \"c.hpp\"\n"), std::string::npos);
    EXPECT_NE(header.find("#include \"tsuba/runtime/routing.hpp\"\n"), std::string::npos);
    auto open_app = header.find("namespace app {\nnamespace v1 {\n");
    auto boot = header.find("void c::boot(");
    auto close = header.find("} // namespace v1\n} // namespace app\n");
    ASSERT_NE(open_app, std::string::npos);
    ASSERT_NE(boot, std::string::npos);
    ASSERT_NE(close, std::string::npos);
    EXPECT_LT(open_app, boot);
    EXPECT_LT(boot, close);

    ctx.include_spelling = "<app/c.hpp>";
    EXPECT_NE(emit_routes_header({c}, ctx).find("#include <app/c.hpp>\n"), std::string::npos);

    ctx.include_spelling.clear();
    ctx.source_name.clear();
    auto bare = emit_routes_header({}, ctx);
    EXPECT_EQ(bare.rfind("// Generated by tsuba_gen. Do not edit.\n", 0), 0u);
    EXPECT_EQ(bare.find("void "), std::string::npos);
}

TEST(Emitter, RepeatedRunsAreByteIdentical) {
    constexpr std::string_view source = R"(
namespace app {
struct [[tsuba::controller(path: "users", middleware: auth)]] users {
    TSUBA_CONTROLLER();
    [[tsuba::get(path: ":id")]] std::string show(int id);
    [[tsuba::get]] std::string show([[tsuba::query_param]] std::optional<int> page);
    [[tsuba::post]] int create([[tsuba::body]] const user& u, [[tsuba::auth]] account who);
    [[tsuba::custom_endpoint(method: head, path: "ping")]] response ping(request& req);
};
struct [[tsuba::controller]] admin {
    TSUBA_CONTROLLER();
    [[tsuba::del]] void show(int id);
};
}
)";
    auto run = [&] {
        diagnostic_sink sink;
        auto unit = parse_header(source, "app.hpp", sink);
        EXPECT_TRUE(unit.has_value());
        if (!unit) {
            return std::string{};
        }
        auto report = compile_routes(*unit, {});
        EXPECT_EQ(report.error_count(), 0u);
        EXPECT_EQ(report.controllers.size(), 2u);
        header_context ctx;
        ctx.source_name = "app.hpp";
        ctx.include_spelling = "app.hpp";
        return emit_routes_header(report.controllers, ctx);
    };
    auto first = run();
    auto second = run();
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
    EXPECT_NE(first.find("tsuba_adapter_show_2"), std::string::npos);
}
