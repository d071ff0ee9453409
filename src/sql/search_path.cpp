#include "matview/sql/search_path.hpp"

#include <tao/pegtl.hpp>

#include <utility>

namespace matview::sql {

namespace pegtl = tao::pegtl;

namespace {

struct blank : pegtl::one<' ', '\t', '\r', '\n'> {
};

struct optional_space : pegtl::star<blank> {
};

struct quote : pegtl::one<'"'> {
};

struct escaped_quote : pegtl::two<'"'> {
};

struct quoted_char : pegtl::sor<escaped_quote, pegtl::not_one<'"'>> {
};

struct quoted_body : pegtl::star<quoted_char> {
};

struct quoted_entry : pegtl::seq<quote, quoted_body, pegtl::must<quote>> {
};

struct bare_char : pegtl::not_one<',', '"', ' ', '\t', '\r', '\n'> {
};

struct bare_entry : pegtl::plus<bare_char> {
};

struct entry_rule : pegtl::sor<quoted_entry, bare_entry> {
};

struct separator : pegtl::seq<optional_space, pegtl::one<','>, optional_space> {
};

struct entry_list : pegtl::seq<entry_rule, pegtl::star<separator, pegtl::must<entry_rule>>> {
};

struct search_path_grammar : pegtl::seq<optional_space, pegtl::opt<entry_list>, optional_space, pegtl::eof> {
};

template <typename Rule>
struct search_path_action : pegtl::nothing<Rule> {
};

template <>
struct search_path_action<quoted_body> {
    template <typename Input>
    static void apply(const Input& in, std::vector<SearchPathEntry>& entries)
    {
        SearchPathEntry entry{};
        entry.quoted = true;
        const auto raw = in.string();
        entry.name.reserve(raw.size());
        for (std::size_t index = 0U; index < raw.size(); ++index) {
            entry.name.push_back(raw[index]);
            if (raw[index] == '"' && index + 1U < raw.size() && raw[index + 1U] == '"') {
                ++index;
            }
        }
        entries.push_back(std::move(entry));
    }
};

template <>
struct search_path_action<bare_entry> {
    template <typename Input>
    static void apply(const Input& in, std::vector<SearchPathEntry>& entries)
    {
        SearchPathEntry entry{};
        entry.name = in.string();
        entries.push_back(std::move(entry));
    }
};

std::string format_parse_error(const pegtl::parse_error& error)
{
    std::string message = "malformed search_path";
    if (!error.positions().empty()) {
        message += " at column " + std::to_string(error.positions().front().column);
    }
    return message;
}

}  // namespace

SearchPathParseResult parse_search_path(std::string_view input)
{
    SearchPathParseResult result{};
    pegtl::memory_input in(input.data(), input.size(), "search_path");

    try {
        const auto parsed = pegtl::parse<search_path_grammar, search_path_action>(in, result.entries);
        if (!parsed) {
            result.entries.clear();
            result.error = "input did not match search_path grammar";
        }
    } catch (const pegtl::parse_error& error) {
        result.entries.clear();
        result.error = format_parse_error(error);
    }

    return result;
}

std::vector<std::string> search_path_schemas(std::string_view input)
{
    std::vector<std::string> schemas;
    const auto parsed = parse_search_path(input);
    if (!parsed.success()) {
        return schemas;
    }
    for (const auto& entry : parsed.entries) {
        if (!entry.name.empty()) {
            schemas.push_back(entry.name);
        }
    }
    return schemas;
}

bool is_user_placeholder(std::string_view entry) noexcept
{
    return entry == "$user";
}

}  // namespace matview::sql
