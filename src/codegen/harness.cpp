#include "codegen/harness.hpp"
#include <set>
#include <boost/algorithm/string/join.hpp>
#include "codegen/codec.hpp"
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace funcjudge::codegen {
using namespace std;

execution_spec legacy_execution_spec() {
    execution_spec spec;
    spec.function_name = "sortArray";
    spec.params.push_back({"nums", type_tag::array_of(type_tag::scalar(scalar_kind::INT))});
    spec.return_type = type_tag::array_of(type_tag::scalar(scalar_kind::INT));
    return spec;
}

void validate_execution_spec(const execution_spec &spec) {
    if (!is_identifier(spec.function_name))
        throw invalid_request("invalid function name: " + spec.function_name);
    set<string> names;
    for (auto &param : spec.params) {
        if (!is_identifier(param.name))
            throw invalid_request("invalid parameter name: " + param.name);
        if (!names.insert(param.name).second)
            throw invalid_request("duplicate parameter name: " + param.name);
    }
}

harness_synthesizer::~harness_synthesizer() = default;

// Runner.java 中的 JSON 解析器，解析结果：
// object -> LinkedHashMap, array -> ArrayList, string -> String,
// 整数 -> Long, 小数 -> Double, true/false -> Boolean, null -> null
static const char *JAVA_JSON_CLASS = R"java(    static final class Json {
        private final String s;
        private int pos;

        Json(String s) {
            this.s = s;
        }

        Object parse() {
            Object value = parseValue();
            skipWhitespace();
            if (pos != s.length()) throw error("trailing characters");
            return value;
        }

        private IllegalArgumentException error(String what) {
            return new IllegalArgumentException("Invalid JSON input at offset " + pos + ": " + what);
        }

        private void skipWhitespace() {
            while (pos < s.length() && Character.isWhitespace(s.charAt(pos))) pos++;
        }

        private void expect(String word) {
            if (!s.startsWith(word, pos)) throw error("expected " + word);
            pos += word.length();
        }

        private Object parseValue() {
            skipWhitespace();
            if (pos >= s.length()) throw error("unexpected end of input");
            switch (s.charAt(pos)) {
                case '{': return parseObject();
                case '[': return parseArray();
                case '"': return parseString();
                case 't': expect("true"); return Boolean.TRUE;
                case 'f': expect("false"); return Boolean.FALSE;
                case 'n': expect("null"); return null;
                default: return parseNumber();
            }
        }

        private Map<String, Object> parseObject() {
            Map<String, Object> map = new LinkedHashMap<>();
            pos++;
            skipWhitespace();
            if (pos < s.length() && s.charAt(pos) == '}') {
                pos++;
                return map;
            }
            while (true) {
                skipWhitespace();
                if (pos >= s.length() || s.charAt(pos) != '"') throw error("expected string key");
                String key = parseString();
                skipWhitespace();
                if (pos >= s.length() || s.charAt(pos) != ':') throw error("expected ':'");
                pos++;
                map.put(key, parseValue());
                skipWhitespace();
                if (pos >= s.length()) throw error("unexpected end of input");
                char c = s.charAt(pos++);
                if (c == '}') return map;
                if (c != ',') throw error("expected ',' or '}'");
            }
        }

        private List<Object> parseArray() {
            List<Object> list = new ArrayList<>();
            pos++;
            skipWhitespace();
            if (pos < s.length() && s.charAt(pos) == ']') {
                pos++;
                return list;
            }
            while (true) {
                list.add(parseValue());
                skipWhitespace();
                if (pos >= s.length()) throw error("unexpected end of input");
                char c = s.charAt(pos++);
                if (c == ']') return list;
                if (c != ',') throw error("expected ',' or ']'");
            }
        }

        private String parseString() {
            StringBuilder sb = new StringBuilder();
            pos++;
            while (pos < s.length()) {
                char c = s.charAt(pos++);
                if (c == '"') return sb.toString();
                if (c != '\\') {
                    sb.append(c);
                    continue;
                }
                if (pos >= s.length()) break;
                char e = s.charAt(pos++);
                switch (e) {
                    case '"': sb.append('"'); break;
                    case '\\': sb.append('\\'); break;
                    case '/': sb.append('/'); break;
                    case 'b': sb.append('\b'); break;
                    case 'f': sb.append('\f'); break;
                    case 'n': sb.append('\n'); break;
                    case 'r': sb.append('\r'); break;
                    case 't': sb.append('\t'); break;
                    case 'u':
                        if (pos + 4 > s.length()) throw error("bad unicode escape");
                        try {
                            sb.append((char) Integer.parseInt(s.substring(pos, pos + 4), 16));
                        } catch (NumberFormatException ex) {
                            throw error("bad unicode escape");
                        }
                        pos += 4;
                        break;
                    default: throw error("bad escape \\" + e);
                }
            }
            throw error("unterminated string");
        }

        private Number parseNumber() {
            int start = pos;
            boolean floating = false;
            while (pos < s.length()) {
                char c = s.charAt(pos);
                if (c == '.' || c == 'e' || c == 'E') floating = true;
                else if (c != '-' && c != '+' && !Character.isDigit(c)) break;
                pos++;
            }
            if (start == pos) throw error("unexpected character '" + s.charAt(pos) + "'");
            String text = s.substring(start, pos);
            try {
                if (floating) return Double.parseDouble(text);
                return Long.parseLong(text);
            } catch (NumberFormatException ex) {
                throw error("bad number " + text);
            }
        }

        static Object field(Map<String, Object> data, String name) {
            if (!data.containsKey(name)) throw new IllegalArgumentException("Missing input field: " + name);
            return data.get(name);
        }

        static Map<String, Object> asObject(Object v) {
            if (!(v instanceof Map)) throw new IllegalArgumentException("Input must be a JSON object");
            return (Map<String, Object>) v;
        }

        static List<Object> asList(Object v) {
            if (!(v instanceof List)) throw new IllegalArgumentException("Expected JSON array but got " + v);
            return (List<Object>) v;
        }

        static Number asNumber(Object v) {
            if (!(v instanceof Number)) throw new IllegalArgumentException("Expected JSON number but got " + v);
            return (Number) v;
        }

        static boolean asBoolean(Object v) {
            if (!(v instanceof Boolean)) throw new IllegalArgumentException("Expected JSON boolean but got " + v);
            return (Boolean) v;
        }

        static char asChar(Object v) {
            if (!(v instanceof String) || ((String) v).length() != 1)
                throw new IllegalArgumentException("Expected single character string but got " + v);
            return ((String) v).charAt(0);
        }

        static String asString(Object v) {
            if (v == null) return null;
            if (!(v instanceof String)) throw new IllegalArgumentException("Expected JSON string but got " + v);
            return (String) v;
        }

        static String quote(String v) {
            StringBuilder sb = new StringBuilder("\"");
            for (int i = 0; i < v.length(); i++) {
                char c = v.charAt(i);
                switch (c) {
                    case '"': sb.append("\\\""); break;
                    case '\\': sb.append("\\\\"); break;
                    case '\b': sb.append("\\b"); break;
                    case '\f': sb.append("\\f"); break;
                    case '\n': sb.append("\\n"); break;
                    case '\r': sb.append("\\r"); break;
                    case '\t': sb.append("\\t"); break;
                    default:
                        // 非 ASCII 字符也转义，输出不受 System.out 编码的影响
                        if (c < 0x20 || c > 0x7e) sb.append(String.format("\\u%04x", (int) c));
                        else sb.append(c);
                }
            }
            return sb.append('"').toString();
        }
    }
)java";

static const char *JAVA_RUNNER = R"java(import java.io.*;
import java.nio.charset.StandardCharsets;
import java.util.*;

@SuppressWarnings("unchecked")
public class Runner {
${helpers}
    public static void main(String[] args) throws IOException {
        String result;
        try {
            Reader reader = new InputStreamReader(System.in, StandardCharsets.UTF_8);
            StringBuilder input = new StringBuilder();
            char[] buf = new char[8192];
            int n;
            while ((n = reader.read(buf)) != -1) input.append(buf, 0, n);
            Map<String, Object> data = Json.asObject(new Json(input.toString()).parse());
${decode_args}            ${return_native} ret = new Solution().${function}(${call_args});
            result = ${encode_result};
        } catch (Throwable e) {
            System.out.flush();
            System.err.println("Error: " + e);
            e.printStackTrace();
            System.exit(1);
            return;
        }
        System.out.println();
        System.out.println("${sentinel}");
        System.out.println("{\"result\":" + result + "}");
        System.out.flush();
    }

${json_class}}
)java";

string java_harness_synthesizer::synthesize(const execution_spec &spec, const string &sentinel) const {
    validate_execution_spec(spec);
    codec_generator gen(java_codec_table());

    string decode_args;
    vector<string> call_args;
    for (auto &param : spec.params) {
        string var = "arg_" + param.name;
        decode_args += expand("            ${native} ${var} = ${decode};\n",
                              {{"native", gen.native_type(param.type)},
                               {"var", var},
                               {"decode", gen.decode_expr("Json.field(data, \"" + param.name + "\")", param.type)}});
        call_args.push_back(var);
    }
    string encode_result = gen.encode_expr("ret", spec.return_type);

    return expand(JAVA_RUNNER, {{"helpers", gen.helpers()},
                                {"decode_args", decode_args},
                                {"return_native", gen.native_type(spec.return_type)},
                                {"function", spec.function_name},
                                {"call_args", boost::algorithm::join(call_args, ", ")},
                                {"encode_result", encode_result},
                                {"sentinel", sentinel},
                                {"json_class", JAVA_JSON_CLASS}});
}

// 导入用户代码的语句放在 try 之外，语法错误会以 SyntaxError 的形式出现在标准错误流中
static const char *PYTHON_RUNNER = R"py(import json
import sys
import traceback

from solution import Solution


def _field(data, name):
    if name not in data:
        raise KeyError("Missing input field: " + name)
    return data[name]


${helpers}
def main():
    data = json.loads(sys.stdin.read())
    if not isinstance(data, dict):
        raise ValueError("Input must be a JSON object")
${decode_args}    ret = Solution().${function}(${call_args})
    result = ${encode_result}
    sys.stdout.flush()
    print()
    print("${sentinel}")
    print('{"result":' + result + '}')


if __name__ == "__main__":
    try:
        main()
    except Exception as e:
        sys.stdout.flush()
        traceback.print_exc()
        print("Error: " + str(e), file=sys.stderr)
        sys.exit(1)
)py";

string python_harness_synthesizer::synthesize(const execution_spec &spec, const string &sentinel) const {
    validate_execution_spec(spec);
    codec_generator gen(python_codec_table());

    string decode_args;
    vector<string> call_args;
    for (auto &param : spec.params) {
        string var = "arg_" + param.name;
        decode_args += expand("    ${var} = ${decode}\n",
                              {{"var", var},
                               {"decode", gen.decode_expr("_field(data, \"" + param.name + "\")", param.type)}});
        call_args.push_back(var);
    }
    string encode_result = gen.encode_expr("ret", spec.return_type);

    return expand(PYTHON_RUNNER, {{"helpers", gen.helpers()},
                                  {"decode_args", decode_args},
                                  {"function", spec.function_name},
                                  {"call_args", boost::algorithm::join(call_args, ", ")},
                                  {"encode_result", encode_result},
                                  {"sentinel", sentinel}});
}

}  // namespace funcjudge::codegen
