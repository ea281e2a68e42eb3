#include "codegen/codec.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace funcjudge::codegen {
using namespace std;

/**
 * @brief 去掉类型名中的泛型参数，比如 List<Integer>[] 得到 List[]
 */
static string erase_generics(const string &native) {
    string erased;
    int depth = 0;
    for (char c : native) {
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0) erased += c;
    }
    return erased;
}

/**
 * @brief Java 不允许直接创建泛型数组，因此 List<Integer>[] 需要创建 List[] 再强制转换
 */
static string java_array_alloc(const string &elem_native, const string &size) {
    string erased = erase_generics(elem_native);
    auto pos = erased.find('[');
    string base = erased.substr(0, pos);
    string dims = pos == string::npos ? "" : erased.substr(pos);
    string alloc = "new " + base + "[" + size + "]" + dims;
    if (elem_native.find('<') != string::npos)
        alloc = "(" + elem_native + "[]) " + alloc;
    return alloc;
}

const codec_table &java_codec_table() {
    static const codec_table table = [] {
        codec_table t;
        // clang-format off
        t.scalars[scalar_kind::INT] = {"int", "Integer",
            "        return Json.asNumber(v).intValue();",
            "        return String.valueOf(v);"};
        t.scalars[scalar_kind::LONG] = {"long", "Long",
            "        return Json.asNumber(v).longValue();",
            "        return String.valueOf(v);"};
        t.scalars[scalar_kind::DOUBLE] = {"double", "Double",
            "        return Json.asNumber(v).doubleValue();",
            "        return Double.toString(v);"};
        t.scalars[scalar_kind::BOOLEAN] = {"boolean", "Boolean",
            "        return Json.asBoolean(v);",
            R"(        return v ? "true" : "false";)"};
        t.scalars[scalar_kind::CHAR] = {"char", "Character",
            "        return Json.asChar(v);",
            "        return Json.quote(String.valueOf(v));"};
        t.scalars[scalar_kind::STRING] = {"String", "String",
            "        return Json.asString(v);",
            R"(        return v == null ? "null" : Json.quote(v);)"};
        // clang-format on

        t.array.native = "${elem_native}[]";
        t.array.decode = R"(        if (v == null) return null;
        List<Object> items = Json.asList(v);
        ${native} r = ${alloc};
        for (int i = 0; i < items.size(); i++) r[i] = decode_${elem}(items.get(i));
        return r;)";
        t.array.encode = R"(        if (v == null) return "null";
        StringBuilder sb = new StringBuilder("[");
        for (int i = 0; i < v.length; i++) {
            if (i > 0) sb.append(',');
            sb.append(encode_${elem}(v[i]));
        }
        return sb.append(']').toString();)";

        t.list.native = "List<${elem_boxed}>";
        t.list.decode = R"(        if (v == null) return null;
        List<Object> items = Json.asList(v);
        ${native} r = new ArrayList<>(items.size());
        for (Object item : items) r.add(decode_${elem}(item));
        return r;)";
        t.list.encode = R"(        if (v == null) return "null";
        StringBuilder sb = new StringBuilder("[");
        boolean first = true;
        for (${elem_boxed} item : v) {
            if (!first) sb.append(',');
            first = false;
            sb.append(encode_${elem}(item));
        }
        return sb.append(']').toString();)";

        t.decode_helper = R"(    static ${native} decode_${name}(Object v) {
${body}
    }
)";
        t.encode_helper = R"(    static String encode_${name}(${native} v) {
${body}
    }
)";
        t.decode_call = "decode_${name}(${value})";
        t.encode_call = "encode_${name}(${value})";
        t.array_alloc = java_array_alloc;
        return t;
    }();
    return table;
}

const codec_table &python_codec_table() {
    static const codec_table table = [] {
        codec_table t;
        // Python 没有静态类型，native 和 boxed 留空
        // clang-format off
        t.scalars[scalar_kind::INT] = {"", "",
            "    return int(v)",
            "    return str(int(v))"};
        t.scalars[scalar_kind::LONG] = {"", "",
            "    return int(v)",
            "    return str(int(v))"};
        t.scalars[scalar_kind::DOUBLE] = {"", "",
            "    return float(v)",
            "    return repr(float(v))"};
        t.scalars[scalar_kind::BOOLEAN] = {"", "",
            "    return bool(v)",
            R"(    return "true" if v else "false")"};
        t.scalars[scalar_kind::CHAR] = {"", "",
            "    return None if v is None else str(v)",
            R"(    return "null" if v is None else json.dumps(str(v)))"};
        t.scalars[scalar_kind::STRING] = {"", "",
            "    return None if v is None else str(v)",
            R"(    return "null" if v is None else json.dumps(str(v)))"};
        // clang-format on

        t.array.decode = R"(    if v is None:
        return None
    return [_decode_${elem}(e) for e in v])";
        t.array.encode = R"(    if v is None:
        return "null"
    return "[" + ",".join(_encode_${elem}(e) for e in v) + "]")";
        t.list = t.array;

        t.decode_helper = R"(def _decode_${name}(v):
${body}

)";
        t.encode_helper = R"(def _encode_${name}(v):
${body}

)";
        t.decode_call = "_decode_${name}(${value})";
        t.encode_call = "_encode_${name}(${value})";
        return t;
    }();
    return table;
}

string expand(const string &tmpl, const map<string, string> &vars) {
    string result = tmpl;
    for (auto &[key, value] : vars)
        boost::replace_all(result, "${" + key + "}", value);
    return result;
}

codec_generator::codec_generator(const codec_table &table) : table(table) {}

static const scalar_codec &lookup_scalar(const codec_table &table, const scalar_type &s) {
    auto it = table.scalars.find(s.kind);
    if (it == table.scalars.end())
        throw unsupported_type(scalar_name(s.kind));
    return it->second;
}

string codec_generator::native_type(const type_tag &type) const {
    return visit(overloaded{
                     [&](const scalar_type &s) { return lookup_scalar(table, s).native; },
                     [&](const array_type &a) {
                         return expand(table.array.native, {{"elem_native", native_type(*a.element)},
                                                            {"elem_boxed", boxed_type(*a.element)}});
                     },
                     [&](const list_type &l) {
                         return expand(table.list.native, {{"elem_native", native_type(*l.element)},
                                                           {"elem_boxed", boxed_type(*l.element)}});
                     }},
                 type.node);
}

string codec_generator::boxed_type(const type_tag &type) const {
    if (auto s = get_if<scalar_type>(&type.node))
        return lookup_scalar(table, *s).boxed;
    return native_type(type);
}

string codec_generator::require_decoder(const type_tag &type) {
    string name = type.mangled();
    if (emitted.count("decode:" + name)) return name;

    string native = native_type(type);
    string body = visit(overloaded{
                            [&](const scalar_type &s) { return lookup_scalar(table, s).decode; },
                            [&](const array_type &a) {
                                string elem = require_decoder(*a.element);
                                string alloc = table.array_alloc ? table.array_alloc(native_type(*a.element), "items.size()") : "";
                                return expand(table.array.decode, {{"elem", elem}, {"native", native}, {"alloc", alloc}});
                            },
                            [&](const list_type &l) {
                                string elem = require_decoder(*l.element);
                                return expand(table.list.decode, {{"elem", elem}, {"native", native}});
                            }},
                        type.node);

    emitted.insert("decode:" + name);
    functions.push_back(expand(table.decode_helper, {{"name", name}, {"native", native}, {"body", body}}));
    return name;
}

string codec_generator::require_encoder(const type_tag &type) {
    string name = type.mangled();
    if (emitted.count("encode:" + name)) return name;

    string native = native_type(type);
    string body = visit(overloaded{
                            [&](const scalar_type &s) { return lookup_scalar(table, s).encode; },
                            [&](const array_type &a) {
                                string elem = require_encoder(*a.element);
                                return expand(table.array.encode, {{"elem", elem}, {"elem_boxed", boxed_type(*a.element)}});
                            },
                            [&](const list_type &l) {
                                string elem = require_encoder(*l.element);
                                return expand(table.list.encode, {{"elem", elem}, {"elem_boxed", boxed_type(*l.element)}});
                            }},
                        type.node);

    emitted.insert("encode:" + name);
    functions.push_back(expand(table.encode_helper, {{"name", name}, {"native", native}, {"body", body}}));
    return name;
}

string codec_generator::decode_expr(const string &value_expr, const type_tag &type) {
    string name = require_decoder(type);
    return expand(table.decode_call, {{"name", name}, {"value", value_expr}});
}

string codec_generator::encode_expr(const string &value_expr, const type_tag &type) {
    string name = require_encoder(type);
    return expand(table.encode_call, {{"name", name}, {"value", value_expr}});
}

string codec_generator::helpers() const {
    return boost::algorithm::join(functions, "\n");
}

}  // namespace funcjudge::codegen
