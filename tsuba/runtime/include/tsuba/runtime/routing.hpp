#pragma once

#include "problem.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

// Declares the member template whose definition tsuba_gen writes:
//   template <typename Routes> void boot(Routes& routes);
#define TSUBA_CONTROLLER() template <typename Routes> void boot(Routes& routes)

namespace tsuba {

enum class method : uint8_t { get, post, put, del, patch, head, options, move, copy, unknown };

method parse_method(std::string_view str) noexcept;
std::string_view method_to_string(method m) noexcept;

struct body_policy {
    enum class mode : uint8_t { collect, stream };

    mode kind = mode::collect;
    std::optional<size_t> max_size;

    friend bool operator==(const body_policy&, const body_policy&) = default;
};

// Names visible to marker argument expressions inside a generated boot().
namespace vocabulary {

inline constexpr method get = method::get;
inline constexpr method post = method::post;
inline constexpr method put = method::put;
inline constexpr method del = method::del;
inline constexpr method patch = method::patch;
inline constexpr method head = method::head;
inline constexpr method options = method::options;
inline constexpr method move = method::move;
inline constexpr method copy = method::copy;

// `collect` buffers the whole body, `collect(n)` caps it at n bytes.
struct collect_fn {
    constexpr body_policy operator()(size_t max_size) const {
        return body_policy{body_policy::mode::collect, max_size};
    }
    constexpr operator body_policy() const { return body_policy{}; }
};

inline constexpr collect_fn collect{};
inline constexpr body_policy stream{body_policy::mode::stream, std::nullopt};

} // namespace vocabulary

// Runs a fallible fetch and turns any std::exception into an empty optional.
template <typename F>
auto attempt(F&& fetch) -> std::optional<std::remove_cvref_t<std::invoke_result_t<F&>>> {
    try {
        return std::invoke(fetch);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace tsuba
