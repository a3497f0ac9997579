#pragma once

#include "task.hpp"
#include "tsuba/runtime/problem.hpp"
#include "tsuba/runtime/routing.hpp"

#include <charconv>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tsuba::test_support {

// Text -> value conversion shared by every request view. Types other than strings and
// integers provide `static T parse(std::string_view)`.
template <typename T> T convert(std::string_view text, std::string_view what) {
    if constexpr (std::is_same_v<T, std::string>) {
        return std::string(text);
    } else if constexpr (std::is_integral_v<T>) {
        T value{};
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            throw abort_error(problem_details::bad_request("malformed " + std::string(what)));
        }
        return value;
    } else {
        return T::parse(text);
    }
}

template <typename T> std::optional<T> try_convert(std::string_view text, std::string_view what) {
    try {
        return convert<T>(text, what);
    } catch (const abort_error&) {
        return std::nullopt;
    }
}

class keyed_view {
public:
    keyed_view(const std::map<std::string, std::string>& values, std::string_view what)
        : values_(values), what_(what) {}

    template <typename T> T require(std::string_view key) const {
        auto it = values_.find(std::string(key));
        if (it == values_.end()) {
            throw abort_error(problem_details::bad_request("missing " + std::string(what_) +
                                                           " '" + std::string(key) + "'"));
        }
        return convert<T>(it->second, what_);
    }

    template <typename T> std::optional<T> get(std::string_view key) const {
        auto it = values_.find(std::string(key));
        if (it == values_.end()) {
            return std::nullopt;
        }
        return try_convert<T>(it->second, what_);
    }

protected:
    const std::map<std::string, std::string>& values_;
    std::string_view what_;
};

class query_view : public keyed_view {
public:
    query_view(const std::map<std::string, std::string>& values, std::string_view raw)
        : keyed_view(values, "query parameter"), raw_(raw) {}

    template <typename T> T decode() const { return convert<T>(raw_, "query string"); }

private:
    std::string_view raw_;
};

class content_view {
public:
    explicit content_view(std::string_view body) : body_(body) {}

    template <typename T> T decode() const {
        if (body_.empty()) {
            throw abort_error(problem_details::unsupported_media_type("request body is empty"));
        }
        return convert<T>(body_, "request body");
    }

private:
    std::string_view body_;
};

class auth_view {
public:
    explicit auth_view(const std::optional<std::string>& principal) : principal_(principal) {}

    template <typename T> T require() const {
        if (!principal_) {
            throw abort_error(problem_details::unauthorized("no authenticated principal"));
        }
        return convert<T>(*principal_, "principal");
    }

    template <typename T> std::optional<T> get() const {
        if (!principal_) {
            return std::nullopt;
        }
        return try_convert<T>(*principal_, "principal");
    }

private:
    const std::optional<std::string>& principal_;
};

struct request {
    method http_method = method::get;
    std::string path;
    std::string query_string;
    std::string body;
    std::map<std::string, std::string> path_params;
    std::map<std::string, std::string> query_params;
    std::optional<std::string> principal;

    keyed_view parameters() const { return {path_params, "path parameter"}; }
    query_view query() const { return {query_params, query_string}; }
    content_view content() const { return content_view{body}; }
    auth_view auth() const { return auth_view{principal}; }
};

struct response {
    int status = 200;
    std::string body;
};

template <typename T> struct is_task : std::false_type {};
template <typename T> struct is_task<task<T>> : std::true_type {};

template <typename T> response respond(T&& value) {
    using value_type = std::remove_cvref_t<T>;
    if constexpr (is_task<value_type>::value) {
        return respond(sync_wait(std::move(value)));
    } else if constexpr (std::is_same_v<value_type, response>) {
        return std::forward<T>(value);
    } else if constexpr (std::is_arithmetic_v<value_type>) {
        return {200, std::to_string(value)};
    } else {
        return {200, std::string(std::forward<T>(value))};
    }
}

struct route_entry {
    method http_method = method::get;
    std::vector<std::string> segments; // ":name" captures a path parameter
    std::vector<std::string> middleware;
    body_policy body;
    std::function<response(request&)> handler;
};

// Minimal host routing surface: records registrations and dispatches requests to them.
class routes_builder {
public:
    routes_builder() : table_(std::make_shared<std::vector<route_entry>>()) {}

    routes_builder grouped(std::vector<std::string> prefix) const {
        routes_builder copy = *this;
        for (auto& segment : prefix) {
            copy.prefix_.push_back(std::move(segment));
        }
        return copy;
    }

    template <typename... Ms> routes_builder with_middleware(Ms&&... names) const {
        routes_builder copy = *this;
        (copy.middleware_.emplace_back(std::forward<Ms>(names)), ...);
        return copy;
    }

    template <typename F>
    void on(method m, std::vector<std::string> segments, body_policy body, F handler) {
        route_entry entry;
        entry.http_method = m;
        entry.segments = prefix_;
        for (auto& segment : segments) {
            entry.segments.push_back(std::move(segment));
        }
        entry.middleware = middleware_;
        entry.body = body;
        entry.handler = [handler = std::move(handler)](request& req) mutable -> response {
            using result_type = decltype(handler(req));
            if constexpr (std::is_void_v<result_type>) {
                handler(req);
                return {204, {}};
            } else {
                return respond(handler(req));
            }
        };
        table_->push_back(std::move(entry));
    }

    [[nodiscard]] const std::vector<route_entry>& routes() const noexcept { return *table_; }

    // Takes the method as it appears on a request line; unknown names match no route.
    response dispatch(std::string_view method_name, std::string_view path, request req = {}) const {
        return dispatch(parse_method(method_name), path, std::move(req));
    }

    // Literal segments win over captures when several routes match.
    response dispatch(method m, std::string_view path, request req = {}) const {
        auto parts = split(path);
        const route_entry* best = nullptr;
        size_t best_literals = 0;
        for (const auto& entry : *table_) {
            if (entry.http_method != m || entry.segments.size() != parts.size()) {
                continue;
            }
            size_t literals = 0;
            bool matches = true;
            for (size_t i = 0; i < parts.size(); ++i) {
                if (entry.segments[i].starts_with(":")) {
                    continue;
                }
                if (entry.segments[i] != parts[i]) {
                    matches = false;
                    break;
                }
                ++literals;
            }
            if (matches && (!best || literals > best_literals)) {
                best = &entry;
                best_literals = literals;
            }
        }
        if (!best) {
            std::string detail(method_to_string(m));
            detail += ' ';
            detail += path;
            return {404, problem_details::not_found(detail).to_json()};
        }

        req.http_method = m;
        req.path = std::string(path);
        for (size_t i = 0; i < parts.size(); ++i) {
            if (best->segments[i].starts_with(":")) {
                req.path_params[best->segments[i].substr(1)] = parts[i];
            }
        }
        try {
            return best->handler(req);
        } catch (const abort_error& e) {
            return {e.status(), e.problem().to_json()};
        }
    }

private:
    static std::vector<std::string> split(std::string_view path) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (start <= path.size()) {
            auto end = path.find('/', start);
            auto part = path.substr(start, end == std::string_view::npos ? end : end - start);
            if (!part.empty()) {
                parts.emplace_back(part);
            }
            if (end == std::string_view::npos) {
                break;
            }
            start = end + 1;
        }
        return parts;
    }

    std::shared_ptr<std::vector<route_entry>> table_;
    std::vector<std::string> prefix_;
    std::vector<std::string> middleware_;
};

} // namespace tsuba::test_support
