#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tsuba {

// RFC 7807 problem document a host renders when a generated extraction fails.
struct problem_details {
    std::string type = "about:blank";
    std::string title;
    int status = 500;
    std::optional<std::string> detail;
    std::optional<std::string> instance;
    std::map<std::string, std::string> extensions;

    std::string to_json() const;

    static problem_details bad_request(std::string_view detail = "");
    static problem_details unauthorized(std::string_view detail = "");
    static problem_details not_found(std::string_view detail = "");
    static problem_details unsupported_media_type(std::string_view detail = "");
    static problem_details unprocessable_entity(std::string_view detail = "");
    static problem_details internal_server_error(std::string_view detail = "");
};

// Thrown by request views when a required value is missing or cannot be decoded.
class abort_error : public std::runtime_error {
public:
    explicit abort_error(problem_details problem);

    [[nodiscard]] const problem_details& problem() const noexcept { return problem_; }
    [[nodiscard]] int status() const noexcept { return problem_.status; }

private:
    problem_details problem_;
};

} // namespace tsuba
