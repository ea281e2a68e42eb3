#include "codegen/type_tag.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <algorithm>
#include <iterator>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace funcjudge::codegen {
using namespace std;

// clang-format off
static const unordered_map<string, scalar_kind> scalar_names = boost::assign::map_list_of
    ("int", scalar_kind::INT)
    ("integer", scalar_kind::INT)
    ("long", scalar_kind::LONG)
    ("double", scalar_kind::DOUBLE)
    ("boolean", scalar_kind::BOOLEAN)
    ("bool", scalar_kind::BOOLEAN)
    ("char", scalar_kind::CHAR)
    ("character", scalar_kind::CHAR)
    ("string", scalar_kind::STRING)
    ("str", scalar_kind::STRING);
// clang-format on

const char *scalar_name(scalar_kind kind) {
    switch (kind) {
        case scalar_kind::INT: return "int";
        case scalar_kind::LONG: return "long";
        case scalar_kind::DOUBLE: return "double";
        case scalar_kind::BOOLEAN: return "boolean";
        case scalar_kind::CHAR: return "char";
        case scalar_kind::STRING: return "string";
    }
    throw logic_error("unknown scalar kind");
}

type_tag type_tag::scalar(scalar_kind kind) {
    return type_tag{scalar_type{kind}};
}

type_tag type_tag::array_of(type_tag element) {
    return type_tag{array_type{make_shared<const type_tag>(move(element))}};
}

type_tag type_tag::list_of(type_tag element) {
    return type_tag{list_type{make_shared<const type_tag>(move(element))}};
}

string type_tag::spelling() const {
    return visit(overloaded{
                     [](const scalar_type &s) -> string { return scalar_name(s.kind); },
                     [](const array_type &a) -> string { return a.element->spelling() + "[]"; },
                     [](const list_type &l) -> string { return "list<" + l.element->spelling() + ">"; }},
                 node);
}

string type_tag::mangled() const {
    return visit(overloaded{
                     [](const scalar_type &s) -> string { return scalar_name(s.kind); },
                     [](const array_type &a) -> string { return "array_of_" + a.element->mangled(); },
                     [](const list_type &l) -> string { return "list_of_" + l.element->mangled(); }},
                 node);
}

bool operator==(const type_tag &a, const type_tag &b) {
    return a.spelling() == b.spelling();
}

bool operator!=(const type_tag &a, const type_tag &b) {
    return !(a == b);
}

static type_tag parse_stripped(const string &text, const string &original) {
    if (boost::ends_with(text, "[]"))
        return type_tag::array_of(parse_stripped(text.substr(0, text.size() - 2), original));

    string lower = boost::to_lower_copy(text);
    for (const char *prefix : {"list<", "vector<"}) {
        if (boost::starts_with(lower, prefix) && boost::ends_with(lower, ">")) {
            size_t len = char_traits<char>::length(prefix);
            return type_tag::list_of(parse_stripped(text.substr(len, text.size() - len - 1), original));
        }
    }

    auto it = scalar_names.find(lower);
    if (it == scalar_names.end())
        throw unsupported_type(original);
    return type_tag::scalar(it->second);
}

type_tag parse_type_tag(const string &text) {
    string stripped;
    remove_copy_if(text.begin(), text.end(), back_inserter(stripped), boost::is_space());
    return parse_stripped(stripped, text);
}

}  // namespace funcjudge::codegen
