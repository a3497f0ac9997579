#pragma once

#include "declaration.hpp"
#include "diagnostic.hpp"
#include "result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tsuba {

struct parse_options {
    // Function-like macros that declare `template <typename Routes> void boot(Routes&)`.
    std::vector<std::string> boot_macros{"TSUBA_CONTROLLER"};
};

// Recovers the declaration subset the route compiler needs from a C++ header: namespaces,
// classes, attribute lists, member functions and their parameters. Anything else is skipped.
// Unbalanced brackets and lexer failures are fatal for the file and are also reported to
// `sink` with a source position.
result<translation_unit> parse_header(std::string_view source,
                                      std::string path,
                                      diagnostic_sink& sink,
                                      const parse_options& opts = {});

result<translation_unit> load_header(const std::filesystem::path& file,
                                     diagnostic_sink& sink,
                                     const parse_options& opts = {});

// "const std::optional<T>&" -> "std::optional<T>"
std::string strip_cv_ref(std::string_view type);

// Last unqualified component of a type name without template arguments:
// "const host::request&" -> "request", "tsuba::task<int>" -> "task".
std::string base_type_name(std::string_view type);

} // namespace tsuba
