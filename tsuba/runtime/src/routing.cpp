#include "tsuba/runtime/routing.hpp"

#include <array>
#include <utility>

namespace tsuba {

namespace {

constexpr std::array<std::pair<method, std::string_view>, 9> method_names{{
    {method::get, "GET"},
    {method::post, "POST"},
    {method::put, "PUT"},
    {method::del, "DELETE"},
    {method::patch, "PATCH"},
    {method::head, "HEAD"},
    {method::options, "OPTIONS"},
    {method::move, "MOVE"},
    {method::copy, "COPY"},
}};

} // namespace

method parse_method(std::string_view str) noexcept {
    for (const auto& [m, name] : method_names) {
        if (name == str) {
            return m;
        }
    }
    return method::unknown;
}

std::string_view method_to_string(method m) noexcept {
    for (const auto& [candidate, name] : method_names) {
        if (candidate == m) {
            return name;
        }
    }
    return "UNKNOWN";
}

} // namespace tsuba
