#pragma once

#include "tsuba/core/controller.hpp"
#include "tsuba/core/diagnostic.hpp"
#include "tsuba/core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tsuba_gen {

std::string escape_json(std::string_view sv);

// "include/app/library.hpp" -> "library_routes.hpp"
std::filesystem::path routes_header_name(const std::filesystem::path& input);
std::filesystem::path routes_json_name(const std::filesystem::path& input);

tsuba::result<void> write_file(const std::filesystem::path& path, std::string_view content);

std::string dump_spec_summary(const tsuba::generation_report& report,
                              const std::vector<tsuba::diagnostic>& parse_diagnostics,
                              std::string_view source);

} // namespace tsuba_gen
