#pragma once

#include "fake_host.hpp"
#include "task.hpp"
#include "tsuba/runtime/routing.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace bookshelf {

using tsuba::test_support::request;
using tsuba::test_support::response;
using tsuba::test_support::routes_builder;
using tsuba::test_support::task;

struct book_draft {
    std::string title;

    static book_draft parse(std::string_view text) {
        if (text.size() > 64) {
            throw tsuba::abort_error(
                tsuba::problem_details::unprocessable_entity("book title is too long"));
        }
        return {std::string(text)};
    }
};

class [[tsuba::controller(path: "api", "books", middleware: "auth")]] library {
public:
    TSUBA_CONTROLLER();

    [[tsuba::get(path: ":id")]]
    std::string show(int id) { return "book " + std::to_string(id); }

    [[tsuba::get]]
    std::string list([[tsuba::query_param]] std::optional<int> page,
                     [[tsuba::query_param(name: "size")]] int limit = 20) {
        return "page=" + (page ? std::to_string(*page) : std::string("none")) +
               " size=" + std::to_string(limit);
    }

    [[tsuba::endpoint(method: post, path: "new", body: collect(1024))]]
    std::string create([[tsuba::body]] book_draft draft, [[tsuba::auth]] std::string user) {
        return user + " added " + draft.title;
    }

    [[tsuba::del(path: ":id", middleware: "audit")]]
    int remove(int id, [[tsuba::auth]] std::optional<std::string> user) {
        return user ? id : -id;
    }

    [[tsuba::get(path: "count")]]
    task<int> count() { co_return 3; }

    [[tsuba::get(path: "echo")]]
    std::string echo([[tsuba::req(&request::path)]] const std::string& path) noexcept {
        return path;
    }

    [[tsuba::custom_endpoint(method: head, path: "ping")]]
    response ping(request& req) { return {200, "pong " + req.path}; }

    [[tsuba::route_builder(use_global_setting: true)]]
    void stats(routes_builder& routes) {
        routes.on(tsuba::method::get, {"stats"}, tsuba::body_policy{}, [](request&) {
            return std::string("stats");
        });
    }

    [[tsuba::route_builder]]
    void health(routes_builder& routes) {
        routes.on(tsuba::method::get, {"health"}, tsuba::body_policy{}, [](request&) {
            return std::string("ok");
        });
    }
};

} // namespace bookshelf
