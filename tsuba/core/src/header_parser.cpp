#include "tsuba/core/header_parser.hpp"

#include "tsuba/core/lexer.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace tsuba {

std::string class_decl::qualified_name() const {
    std::string out;
    for (const auto& ns : namespaces) {
        if (ns.empty()) {
            continue;
        }
        out += ns;
        out += "::";
    }
    out += class_path();
    return out;
}

std::string class_decl::class_path() const {
    std::string out;
    for (const auto& outer : enclosing_classes) {
        out += outer;
        out += "::";
    }
    out += name;
    return out;
}

namespace {

const std::unordered_set<std::string_view>& decl_specifiers() {
    static const std::unordered_set<std::string_view> set{"static",
                                                          "virtual",
                                                          "inline",
                                                          "constexpr",
                                                          "consteval",
                                                          "constinit",
                                                          "explicit",
                                                          "friend",
                                                          "extern",
                                                          "mutable",
                                                          "thread_local"};
    return set;
}

// Identifiers that can precede '(' without naming a declarator.
const std::unordered_set<std::string_view>& non_declarator_words() {
    static const std::unordered_set<std::string_view> set{
        "decltype", "alignas",  "noexcept", "sizeof",   "alignof", "__attribute__",
        "__declspec", "requires", "typeid",  "throw",    "static_assert", "void",
        "bool",     "char",     "int",      "short",    "long",    "float",
        "double",   "unsigned", "signed",   "auto",     "wchar_t", "char8_t",
        "char16_t", "char32_t", "const",    "volatile", "explicit"};
    return set;
}

const std::unordered_set<std::string_view>& type_words() {
    static const std::unordered_set<std::string_view> set{
        "void",   "bool",     "char",   "int",      "short",    "long",     "float",
        "double", "unsigned", "signed", "auto",     "wchar_t",  "char8_t",  "char16_t",
        "char32_t", "const",  "volatile", "typename", "struct", "class", "enum"};
    return set;
}

bool is_class_key(const token& t) {
    return t.is_identifier("struct") || t.is_identifier("class") || t.is_identifier("union");
}

bool is_opener(const token& t) {
    return t.is_punct("(") || t.is_punct("[") || t.is_punct("{");
}

bool is_closer(const token& t) {
    return t.is_punct(")") || t.is_punct("]") || t.is_punct("}");
}

bool closes(const token& open, const token& close) {
    return (open.is_punct("(") && close.is_punct(")")) ||
           (open.is_punct("[") && close.is_punct("]")) ||
           (open.is_punct("{") && close.is_punct("}"));
}

struct span {
    size_t first = 0;
    size_t last = 0; // exclusive
    [[nodiscard]] bool empty() const noexcept { return first >= last; }
};

struct declaration_result {
    size_t next = 0;
    std::optional<function_decl> function;
    std::optional<other_decl> other;
};

class parser {
public:
    parser(const std::vector<token>& tokens,
           std::vector<size_t> matches,
           const parse_options& opts,
           translation_unit& unit)
        : tokens_(tokens), match_(std::move(matches)), opts_(opts), unit_(unit) {}

    void run() {
        size_t i = 0;
        std::vector<std::string> namespaces;
        parse_scope(i, namespaces, false);
    }

private:
    [[nodiscard]] const token& at(size_t i) const {
        return i < tokens_.size() ? tokens_[i] : tokens_.back();
    }

    [[nodiscard]] bool at_end(size_t i) const { return at(i).kind == token_kind::end; }

    [[nodiscard]] bool at_attribute(size_t i) const {
        return at(i).is_punct("[") && at(i + 1).is_punct("[");
    }

    // i is an opener; returns the index after its closer.
    [[nodiscard]] size_t jump(size_t i) const { return match_[i] + 1; }

    [[nodiscard]] std::string text(size_t first, size_t last) const {
        std::string out;
        for (size_t idx = first; idx < last && !at_end(idx); ++idx) {
            if (idx > first && tokens_[idx].begin.offset != tokens_[idx - 1].end.offset) {
                out += ' ';
            }
            out += tokens_[idx].text;
        }
        return out;
    }

    [[nodiscard]] source_range range(size_t first, size_t last) const {
        if (last <= first) {
            return {at(first).begin, at(first).begin};
        }
        return {at(first).begin, at(last - 1).end};
    }

    // i is '<'; returns the index after the matching '>'.
    [[nodiscard]] size_t skip_angles(size_t i) const {
        int depth = 0;
        while (!at_end(i)) {
            const auto& t = at(i);
            if (is_opener(t)) {
                i = jump(i);
                continue;
            }
            if (t.is_punct("<")) {
                ++depth;
            } else if (t.is_punct(">")) {
                if (--depth == 0) {
                    return i + 1;
                }
            } else if (t.is_punct(";") || is_closer(t)) {
                return i;
            }
            ++i;
        }
        return i;
    }

    // Consumes through the next ';' at depth zero. A brace block ends the statement when it
    // is not followed by ';'. Stops before a '}' that closes the enclosing scope.
    [[nodiscard]] size_t skip_statement(size_t i) const {
        while (!at_end(i)) {
            const auto& t = at(i);
            if (t.is_punct(";")) {
                return i + 1;
            }
            if (t.is_punct("}")) {
                return i;
            }
            if (t.is_punct("{")) {
                i = jump(i);
                return at(i).is_punct(";") ? i + 1 : i;
            }
            if (is_opener(t)) {
                i = jump(i);
                continue;
            }
            ++i;
        }
        return i;
    }

    [[nodiscard]] size_t skip_template_header(size_t i) const {
        ++i;
        if (at(i).is_punct("<")) {
            i = skip_angles(i);
        }
        return i;
    }

    [[nodiscard]] size_t skip_requires_clause(size_t i) const {
        ++i;
        if (at(i).is_punct("(")) {
            return jump(i);
        }
        while (at(i).kind == token_kind::identifier || at(i).is_punct("::")) {
            ++i;
        }
        if (at(i).is_punct("<")) {
            i = skip_angles(i);
        }
        return i;
    }

    [[nodiscard]] std::vector<span> split_top_level(size_t first, size_t last,
                                                    bool track_angles) const {
        std::vector<span> parts;
        size_t start = first;
        int angle = 0;
        size_t i = first;
        while (i < last) {
            const auto& t = at(i);
            if (is_opener(t)) {
                i = jump(i);
                continue;
            }
            if (track_angles && t.is_punct("<") && i > first &&
                at(i - 1).kind == token_kind::identifier) {
                ++angle;
            } else if (track_angles && t.is_punct(">") && angle > 0) {
                --angle;
            } else if (t.is_punct(",") && angle == 0) {
                parts.push_back({start, i});
                start = i + 1;
            }
            ++i;
        }
        if (track_angles && angle != 0) {
            return split_top_level(first, last, false);
        }
        if (start < last || !parts.empty()) {
            parts.push_back({start, last});
        }
        return parts;
    }

    // Parses consecutive attribute-specifiers ([[...]], alignas(...), __attribute__((...))).
    size_t parse_attributes(size_t i, std::vector<attribute>& out) const {
        while (true) {
            if (at_attribute(i)) {
                size_t inner_close = match_[i + 1];
                parse_attribute_list(i + 2, inner_close, out);
                i = jump(i);
                continue;
            }
            if ((at(i).is_identifier("alignas") || at(i).is_identifier("__attribute__")) &&
                at(i + 1).is_punct("(")) {
                i = jump(i + 1);
                continue;
            }
            return i;
        }
    }

    void parse_attribute_list(size_t first, size_t last, std::vector<attribute>& out) const {
        std::string default_scope;
        if (at(first).is_identifier("using") && at(first + 1).kind == token_kind::identifier &&
            at(first + 2).is_punct(":")) {
            default_scope = std::string(at(first + 1).text);
            first += 3;
        }
        for (const auto& piece : split_top_level(first, last, false)) {
            if (piece.empty() || at(piece.first).kind != token_kind::identifier) {
                continue;
            }
            attribute attr;
            size_t n = piece.first;
            if (at(n + 1).is_punct("::") && at(n + 2).kind == token_kind::identifier) {
                attr.scope = std::string(at(n).text);
                attr.name = std::string(at(n + 2).text);
                n += 3;
            } else {
                attr.scope = default_scope;
                attr.name = std::string(at(n).text);
                n += 1;
            }
            attr.name_where = range(n - 1, n);
            if (n < piece.last && at(n).is_punct("(")) {
                attr.has_argument_clause = true;
                size_t close = match_[n];
                for (const auto& part : split_top_level(n + 1, close, true)) {
                    if (part.empty()) {
                        continue;
                    }
                    argument arg;
                    size_t s = part.first;
                    if (at(s).kind == token_kind::identifier && at(s + 1).is_punct(":") &&
                        s + 1 < part.last) {
                        arg.label = std::string(at(s).text);
                        s += 2;
                    }
                    arg.expression = text(s, part.last);
                    arg.where = range(part.first, part.last);
                    attr.arguments.push_back(std::move(arg));
                }
            }
            attr.where = range(piece.first, piece.last);
            out.push_back(std::move(attr));
        }
    }

    void parse_scope(size_t& i, std::vector<std::string>& namespaces, bool braced) {
        std::vector<attribute> pending;
        bool pending_template = false;
        auto reset = [&] {
            pending.clear();
            pending_template = false;
        };

        while (!at_end(i)) {
            const auto& t = at(i);
            if (t.is_punct("}")) {
                ++i;
                if (braced) {
                    return;
                }
                continue;
            }
            if (t.is_punct(";")) {
                ++i;
                reset();
                continue;
            }
            if (at_attribute(i)) {
                i = parse_attributes(i, pending);
                continue;
            }
            if (t.is_identifier("export") || (t.is_identifier("inline") &&
                                              at(i + 1).is_identifier("namespace"))) {
                ++i;
                continue;
            }
            if (t.is_identifier("namespace")) {
                parse_namespace(i, namespaces);
                reset();
                continue;
            }
            if (t.is_identifier("extern") && at(i + 1).kind == token_kind::string_literal) {
                if (at(i + 2).is_punct("{")) {
                    i += 3;
                    parse_scope(i, namespaces, true);
                } else {
                    i += 2;
                }
                continue;
            }
            if (t.is_identifier("template")) {
                i = skip_template_header(i);
                pending_template = true;
                continue;
            }
            if (t.is_identifier("requires")) {
                i = skip_requires_clause(i);
                continue;
            }
            if (is_class_key(t)) {
                i = parse_class(i, namespaces, {}, std::move(pending), pending_template);
                reset();
                continue;
            }
            if (t.is_identifier("using") || t.is_identifier("typedef") ||
                t.is_identifier("static_assert") || t.is_identifier("enum")) {
                record_skipped(i, pending, unit_.free_declarations);
                i = skip_statement(i);
                reset();
                continue;
            }

            auto decl = parse_declaration(i, std::move(pending), pending_template);
            i = std::max(decl.next, i + 1);
            if (decl.function && !decl.function->attributes.empty()) {
                other_decl free;
                free.kind = member_kind::free_function;
                free.name = decl.function->name;
                free.attributes = std::move(decl.function->attributes);
                free.where = decl.function->name_range;
                unit_.free_declarations.push_back(std::move(free));
            } else if (decl.other && !decl.other->attributes.empty()) {
                unit_.free_declarations.push_back(std::move(*decl.other));
            }
            reset();
        }
    }

    void parse_namespace(size_t& i, std::vector<std::string>& namespaces) {
        size_t j = parse_attributes(i + 1, scratch_);
        scratch_.clear();
        std::vector<std::string> names;
        while (at(j).kind == token_kind::identifier || at(j).is_punct("::")) {
            if (at(j).kind == token_kind::identifier && !at(j).is_identifier("inline")) {
                names.emplace_back(at(j).text);
            }
            ++j;
        }
        if (!at(j).is_punct("{")) {
            i = skip_statement(j);
            return;
        }
        if (names.empty()) {
            names.emplace_back();
        }
        i = j + 1;
        for (const auto& n : names) {
            namespaces.push_back(n);
        }
        parse_scope(i, namespaces, true);
        namespaces.resize(namespaces.size() - names.size());
    }

    void record_skipped(size_t i,
                        const std::vector<attribute>& attrs,
                        std::vector<other_decl>& sink) const {
        if (attrs.empty()) {
            return;
        }
        other_decl other;
        other.kind = at(i).is_identifier("static_assert") ? member_kind::other : member_kind::type;
        if (at(i + 1).kind == token_kind::identifier) {
            other.name = std::string(at(i + 1).text);
        }
        other.attributes = attrs;
        other.where = range(i, i + 1);
        sink.push_back(std::move(other));
    }

    // i is a class key. Returns the index after the declaration.
    size_t parse_class(size_t i,
                       const std::vector<std::string>& namespaces,
                       const std::vector<std::string>& enclosing,
                       std::vector<attribute> attrs,
                       bool is_template) {
        size_t head = i;
        size_t j = parse_attributes(i + 1, attrs);
        if (at(j).kind != token_kind::identifier || at(j).is_identifier("final")) {
            // anonymous class or elaborated type in a declaration
            return skip_statement(j);
        }
        size_t name_idx = j;
        ++j;
        while (at(j).is_punct("::") && at(j + 1).kind == token_kind::identifier) {
            name_idx = j + 1;
            j += 2;
        }
        if (at(j).is_punct("<")) {
            is_template = true;
            j = skip_angles(j);
        }
        if (at(j).is_identifier("final")) {
            ++j;
        }
        if (at(j).is_punct(":")) {
            while (!at_end(j) && !at(j).is_punct("{") && !at(j).is_punct(";")) {
                j = is_opener(at(j)) ? jump(j) : j + 1;
            }
        }
        if (!at(j).is_punct("{")) {
            return skip_statement(head);
        }

        size_t slot = unit_.classes.size();
        unit_.classes.emplace_back();

        class_decl cls;
        cls.name = std::string(at(name_idx).text);
        cls.namespaces = namespaces;
        cls.enclosing_classes = enclosing;
        cls.attributes = std::move(attrs);
        cls.is_template = is_template;
        cls.where = range(head, name_idx + 1);
        cls.body_start = {at(j).end, at(j).end};

        size_t close = match_[j];
        parse_class_body(j + 1, close, cls);
        unit_.classes[slot] = std::move(cls);

        size_t next = close + 1;
        return at(next).is_punct(";") ? next + 1 : skip_statement(next);
    }

    void parse_class_body(size_t k, size_t end, class_decl& cls) {
        std::vector<attribute> pending;
        bool pending_template = false;
        auto reset = [&] {
            pending.clear();
            pending_template = false;
        };
        std::vector<std::string> nested_path = cls.enclosing_classes;
        nested_path.push_back(cls.name);

        while (k < end) {
            const auto& t = at(k);
            if (t.is_punct(";")) {
                ++k;
                reset();
                continue;
            }
            if ((t.is_identifier("public") || t.is_identifier("private") ||
                 t.is_identifier("protected")) &&
                at(k + 1).is_punct(":")) {
                k += 2;
                continue;
            }
            if (at_attribute(k)) {
                k = parse_attributes(k, pending);
                continue;
            }
            if (t.is_identifier("template")) {
                k = skip_template_header(k);
                pending_template = true;
                continue;
            }
            if (t.is_identifier("requires")) {
                k = skip_requires_clause(k);
                continue;
            }
            if (is_class_key(t)) {
                k = parse_class(k, cls.namespaces, nested_path, std::move(pending),
                                pending_template);
                reset();
                continue;
            }
            if (t.is_identifier("using") || t.is_identifier("typedef") ||
                t.is_identifier("static_assert") || t.is_identifier("enum") ||
                t.is_identifier("friend")) {
                record_skipped(k, pending, cls.other_members);
                k = skip_statement(k);
                reset();
                continue;
            }
            if (t.kind == token_kind::identifier && at(k + 1).is_punct("(") &&
                std::find(opts_.boot_macros.begin(), opts_.boot_macros.end(), t.text) !=
                    opts_.boot_macros.end()) {
                cls.declares_boot = true;
                k = jump(k + 1);
                if (at(k).is_punct(";")) {
                    ++k;
                }
                reset();
                continue;
            }

            auto decl = parse_declaration(k, std::move(pending), pending_template);
            k = std::max(decl.next, k + 1);
            if (decl.function) {
                auto& fn = *decl.function;
                bool special = fn.return_type.empty() &&
                               (fn.name == cls.name || fn.name.starts_with("~"));
                if (fn.name == "boot") {
                    cls.declares_boot = true;
                }
                if (special) {
                    if (!fn.attributes.empty()) {
                        other_decl ctor;
                        ctor.kind = member_kind::other;
                        ctor.name = fn.name;
                        ctor.attributes = std::move(fn.attributes);
                        ctor.where = fn.name_range;
                        cls.other_members.push_back(std::move(ctor));
                    }
                } else {
                    cls.functions.push_back(std::move(fn));
                }
            } else if (decl.other && !decl.other->attributes.empty()) {
                cls.other_members.push_back(std::move(*decl.other));
            }
            reset();
        }
    }

    [[nodiscard]] bool names_declarator(size_t idx) const {
        const auto& t = at(idx);
        return t.kind == token_kind::identifier && !non_declarator_words().contains(t.text);
    }

    declaration_result parse_declaration(size_t k, std::vector<attribute> attrs, bool is_template) {
        declaration_result res;
        size_t j = k;
        std::optional<size_t> open;
        std::optional<size_t> name_idx;
        int angle = 0;

        while (!at_end(j)) {
            const auto& t = at(j);
            if (angle == 0 && (t.is_punct(";") || t.is_punct("=") || t.is_punct("{") ||
                               t.is_punct("}") || t.is_punct(":"))) {
                break;
            }
            if (t.is_identifier("operator")) {
                name_idx = j;
                size_t p = j + 1;
                if (at(p).is_punct("(") && at(p + 1).is_punct(")")) {
                    p += 2;
                }
                while (!at_end(p) && !at(p).is_punct("(") && !at(p).is_punct(";")) {
                    ++p;
                }
                if (at(p).is_punct("(")) {
                    open = p;
                }
                break;
            }
            if (t.is_punct("(")) {
                if (angle == 0 && j > k && names_declarator(j - 1)) {
                    open = j;
                    name_idx = j - 1;
                    break;
                }
                j = jump(j);
                continue;
            }
            if (is_opener(t)) {
                j = jump(j);
                continue;
            }
            if (t.is_punct("<") && j > k && at(j - 1).kind == token_kind::identifier) {
                ++angle;
            } else if (t.is_punct(">") && angle > 0) {
                --angle;
            }
            ++j;
        }

        if (!open) {
            return parse_data_member(k, j, std::move(attrs));
        }

        function_decl fn;
        fn.attributes = std::move(attrs);
        fn.is_template = is_template;

        size_t id_start = *name_idx;
        if (id_start > k && at(id_start - 1).is_punct("~")) {
            --id_start;
        }
        size_t name_start = id_start;
        while (name_start >= k + 2 && at(name_start - 1).is_punct("::") &&
               at(name_start - 2).kind == token_kind::identifier) {
            name_start -= 2;
        }
        fn.name = text(id_start, *open);
        fn.name_range = range(name_start, *open);

        size_t r = k;
        while (r < name_start) {
            const auto& t = at(r);
            if (at_attribute(r)) {
                r = parse_attributes(r, fn.attributes);
                continue;
            }
            if (t.is_identifier("requires")) {
                r = skip_requires_clause(r);
                continue;
            }
            if (t.is_identifier("explicit") && at(r + 1).is_punct("(")) {
                r = jump(r + 1);
                continue;
            }
            if (t.kind == token_kind::identifier && decl_specifiers().contains(t.text)) {
                fn.is_static = fn.is_static || t.is_identifier("static");
                fn.is_virtual = fn.is_virtual || t.is_identifier("virtual");
                ++r;
                continue;
            }
            break;
        }
        fn.return_type = text(r, name_start);
        fn.return_type_range = range(r, name_start);

        size_t close = match_[*open];
        fn.parameters_range = range(*open, close + 1);
        auto parts = split_top_level(*open + 1, close, true);
        if (!(parts.size() == 1 && parts.front().last == parts.front().first + 1 &&
              at(parts.front().first).is_identifier("void"))) {
            for (const auto& part : parts) {
                if (!part.empty()) {
                    fn.parameters.push_back(parse_parameter(part));
                }
            }
        }

        size_t m = close + 1;
        while (!at_end(m)) {
            const auto& t = at(m);
            if (t.is_identifier("const") || t.is_identifier("volatile") || t.is_punct("&") ||
                t.is_punct("&&") || t.is_identifier("override") || t.is_identifier("final")) {
                ++m;
                continue;
            }
            if (t.is_identifier("noexcept")) {
                if (at(m + 1).is_punct("(")) {
                    fn.is_noexcept = text(m + 2, match_[m + 1]) == "true";
                    m = jump(m + 1);
                } else {
                    fn.is_noexcept = true;
                    ++m;
                }
                continue;
            }
            if (t.is_identifier("throw") && at(m + 1).is_punct("(")) {
                fn.is_noexcept = match_[m + 1] == m + 2;
                m = jump(m + 1);
                continue;
            }
            if (t.is_punct("->")) {
                size_t first = m + 1;
                size_t e = first;
                int depth = 0;
                while (!at_end(e)) {
                    const auto& u = at(e);
                    if (depth == 0 &&
                        (u.is_punct("{") || u.is_punct(";") || u.is_punct("=") ||
                         u.is_identifier("override") || u.is_identifier("final") ||
                         u.is_identifier("requires") || at_attribute(e))) {
                        break;
                    }
                    if (is_opener(u)) {
                        e = jump(e);
                        continue;
                    }
                    if (u.is_punct("<")) {
                        ++depth;
                    } else if (u.is_punct(">") && depth > 0) {
                        --depth;
                    }
                    ++e;
                }
                fn.return_type = text(first, e);
                fn.return_type_range = range(first, e);
                m = e;
                continue;
            }
            if (t.is_identifier("requires")) {
                while (!at_end(m) && !at(m).is_punct("{") && !at(m).is_punct(";") &&
                       !at(m).is_punct("=")) {
                    m = is_opener(at(m)) ? jump(m) : m + 1;
                }
                continue;
            }
            if (at_attribute(m)) {
                m = jump(m);
                continue;
            }
            if (t.is_punct(":")) {
                m = skip_member_initializers(m + 1);
                continue;
            }
            if (t.is_identifier("try")) {
                ++m;
                continue;
            }
            if (t.is_punct("{")) {
                m = jump(m);
                while (at(m).is_identifier("catch") && at(m + 1).is_punct("(")) {
                    m = jump(m + 1);
                    if (at(m).is_punct("{")) {
                        m = jump(m);
                    }
                }
                if (at(m).is_punct(";")) {
                    ++m;
                }
                break;
            }
            m = skip_statement(m);
            break;
        }

        fn.where = range(k, m);
        res.next = m;
        res.function = std::move(fn);
        return res;
    }

    [[nodiscard]] size_t skip_member_initializers(size_t m) const {
        while (!at_end(m)) {
            while (at(m).kind == token_kind::identifier || at(m).is_punct("::")) {
                ++m;
            }
            if (at(m).is_punct("<")) {
                m = skip_angles(m);
            }
            if (at(m).is_punct("(") || at(m).is_punct("{")) {
                m = jump(m);
            }
            if (at(m).is_punct("...")) {
                ++m;
            }
            if (at(m).is_punct(",")) {
                ++m;
                continue;
            }
            break;
        }
        return m;
    }

    declaration_result parse_data_member(size_t k, size_t stop, std::vector<attribute> attrs) {
        declaration_result res;
        other_decl other;
        other.kind = member_kind::data;
        for (size_t idx = k; idx < stop; ++idx) {
            if (at(idx).kind == token_kind::identifier && !type_words().contains(at(idx).text) &&
                !at(idx + 1).is_punct("::")) {
                other.name = std::string(at(idx).text);
                other.where = range(idx, idx + 1);
            }
        }
        if (other.name.empty()) {
            other.where = range(k, std::max(stop, k + 1));
        }
        other.attributes = std::move(attrs);

        size_t next = stop;
        if (at(stop).is_punct(":") || at(stop).is_punct("=") || at(stop).is_punct("{")) {
            next = skip_statement(stop);
        } else if (at(stop).is_punct(";")) {
            next = stop + 1;
        }
        res.next = next;
        res.other = std::move(other);
        return res;
    }

    parameter_decl parse_parameter(const span& part) {
        parameter_decl param;
        size_t a = parse_attributes(part.first, param.attributes);

        size_t decl_end = part.last;
        int angle = 0;
        for (size_t i = a; i < part.last;) {
            const auto& t = at(i);
            if (is_opener(t)) {
                i = jump(i);
                continue;
            }
            if (t.is_punct("<") && i > a && at(i - 1).kind == token_kind::identifier) {
                ++angle;
            } else if (t.is_punct(">") && angle > 0) {
                --angle;
            } else if (t.is_punct("=") && angle == 0) {
                decl_end = i;
                param.default_value = text(i + 1, part.last);
                break;
            }
            ++i;
        }

        // The last identifier names the parameter only when the tokens before it still
        // spell a type: `const book` is an unnamed parameter.
        bool has_type = false;
        for (size_t i = a; i + 1 < decl_end; ++i) {
            if (!at(i).is_identifier("const") && !at(i).is_identifier("volatile")) {
                has_type = true;
                break;
            }
        }
        size_t type_end = decl_end;
        if (decl_end >= a + 2 && has_type) {
            const auto& last = at(decl_end - 1);
            if (last.kind == token_kind::identifier && !type_words().contains(last.text) &&
                !at(decl_end - 2).is_punct("::")) {
                param.name = std::string(last.text);
                type_end = decl_end - 1;
            }
        }
        param.type = text(a, type_end);
        param.where = range(part.first, part.last);
        return param;
    }

    const std::vector<token>& tokens_;
    std::vector<size_t> match_;
    const parse_options& opts_;
    translation_unit& unit_;
    std::vector<attribute> scratch_;
};

// Pairs every bracket with its partner; reports the first imbalance.
std::optional<diagnostic> match_brackets(const std::vector<token>& tokens,
                                         std::vector<size_t>& matches) {
    matches.assign(tokens.size(), 0);
    std::vector<size_t> stack;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& t = tokens[i];
        if (is_opener(t)) {
            stack.push_back(i);
            continue;
        }
        if (!is_closer(t)) {
            continue;
        }
        if (stack.empty() || !closes(tokens[stack.back()], t)) {
            return make_diagnostic(diagnostic_id::parse_error,
                                   {t.begin, t.end},
                                   "unbalanced '" + std::string(t.text) + "'");
        }
        matches[stack.back()] = i;
        matches[i] = stack.back();
        stack.pop_back();
    }
    if (!stack.empty()) {
        const auto& t = tokens[stack.back()];
        return make_diagnostic(diagnostic_id::parse_error,
                               {t.begin, t.end},
                               "'" + std::string(t.text) + "' is never closed");
    }
    return std::nullopt;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

result<translation_unit> parse_header(std::string_view source,
                                      std::string path,
                                      diagnostic_sink& sink,
                                      const parse_options& opts) {
    auto tokens = tokenize(source);
    if (!tokens) {
        auto where = tokens.error().where;
        sink.report(make_diagnostic(diagnostic_id::parse_error,
                                    {where, where},
                                    make_error_code(tokens.error().code).message()));
        return std::unexpected(make_error_code(tokens.error().code));
    }

    std::vector<size_t> matches;
    if (auto failure = match_brackets(*tokens, matches)) {
        sink.report(std::move(*failure));
        return std::unexpected(make_error_code(error_code::unbalanced_brackets));
    }

    translation_unit unit;
    unit.path = std::move(path);
    parser p(*tokens, std::move(matches), opts, unit);
    p.run();
    return unit;
}

result<translation_unit> load_header(const std::filesystem::path& file,
                                     diagnostic_sink& sink,
                                     const parse_options& opts) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return std::unexpected(make_error_code(error_code::file_not_found));
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error_code(error_code::file_read_failed));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(make_error_code(error_code::file_read_failed));
    }
    std::string source = buffer.str();
    return parse_header(source, file.string(), sink, opts);
}

std::string strip_cv_ref(std::string_view type) {
    std::string_view s = trim(type);
    bool changed = true;
    while (changed) {
        changed = false;
        if (s.ends_with("&&")) {
            s.remove_suffix(2);
            changed = true;
        } else if (s.ends_with("&")) {
            s.remove_suffix(1);
            changed = true;
        }
        s = trim(s);
        for (std::string_view q : {"const ", "volatile "}) {
            if (s.starts_with(q)) {
                s.remove_prefix(q.size());
                changed = true;
            }
        }
        for (std::string_view q : {" const", " volatile"}) {
            if (s.ends_with(q)) {
                s.remove_suffix(q.size());
                changed = true;
            }
        }
        s = trim(s);
    }
    return std::string(s);
}

std::string base_type_name(std::string_view type) {
    std::string stripped = strip_cv_ref(type);
    std::string_view s = stripped;
    for (std::string_view kw : {"typename ", "struct ", "class "}) {
        if (s.starts_with(kw)) {
            s.remove_prefix(kw.size());
        }
    }
    if (auto lt = s.find('<'); lt != std::string_view::npos) {
        s = s.substr(0, lt);
    }
    s = trim(s);
    if (auto colon = s.rfind("::"); colon != std::string_view::npos) {
        s = s.substr(colon + 2);
    }
    return std::string(trim(s));
}

} // namespace tsuba
