#include "generator.hpp"

#include <fstream>

namespace tsuba_gen {

std::string escape_json(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

std::filesystem::path routes_header_name(const std::filesystem::path& input) {
    return input.stem().string() + "_routes.hpp";
}

std::filesystem::path routes_json_name(const std::filesystem::path& input) {
    return input.stem().string() + "_routes.json";
}

tsuba::result<void> write_file(const std::filesystem::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return std::unexpected(tsuba::make_error_code(tsuba::error_code::output_write_failed));
    }
    out << content;
    if (!out) {
        return std::unexpected(tsuba::make_error_code(tsuba::error_code::output_write_failed));
    }
    return {};
}

} // namespace tsuba_gen
