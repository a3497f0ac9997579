#include "tsuba/runtime/problem.hpp"

#include <cstdio>
#include <sstream>
#include <utility>

namespace tsuba {

namespace {

void write_json_string(std::ostringstream& oss, std::string_view s) {
    oss << '"';
    for (char c : s) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                oss << buf;
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
}

problem_details make_problem(int status, std::string_view title, std::string_view detail) {
    problem_details p;
    p.status = status;
    p.title = std::string(title);
    if (!detail.empty()) {
        p.detail = std::string(detail);
    }
    return p;
}

std::string what_of(const problem_details& p) {
    std::string msg = std::to_string(p.status) + " " + p.title;
    if (p.detail) {
        msg += ": " + *p.detail;
    }
    return msg;
}

} // namespace

std::string problem_details::to_json() const {
    std::ostringstream oss;
    oss << "{\"type\":";
    write_json_string(oss, type);
    oss << ",\"title\":";
    write_json_string(oss, title);
    oss << ",\"status\":" << status;

    if (detail) {
        oss << ",\"detail\":";
        write_json_string(oss, *detail);
    }

    if (instance) {
        oss << ",\"instance\":";
        write_json_string(oss, *instance);
    }

    for (const auto& [key, value] : extensions) {
        oss << ",";
        write_json_string(oss, key);
        oss << ":";
        write_json_string(oss, value);
    }

    oss << "}";
    return oss.str();
}

problem_details problem_details::bad_request(std::string_view detail) {
    return make_problem(400, "Bad Request", detail);
}

problem_details problem_details::unauthorized(std::string_view detail) {
    return make_problem(401, "Unauthorized", detail);
}

problem_details problem_details::not_found(std::string_view detail) {
    return make_problem(404, "Not Found", detail);
}

problem_details problem_details::unsupported_media_type(std::string_view detail) {
    return make_problem(415, "Unsupported Media Type", detail);
}

problem_details problem_details::unprocessable_entity(std::string_view detail) {
    return make_problem(422, "Unprocessable Entity", detail);
}

problem_details problem_details::internal_server_error(std::string_view detail) {
    return make_problem(500, "Internal Server Error", detail);
}

abort_error::abort_error(problem_details problem)
    : std::runtime_error(what_of(problem)), problem_(std::move(problem)) {}

} // namespace tsuba
