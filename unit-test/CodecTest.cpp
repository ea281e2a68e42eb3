#include "codegen/codec.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace funcjudge;
using namespace funcjudge::codegen;

static size_t count_occurrences(const string &text, const string &pattern) {
    size_t count = 0;
    for (size_t pos = text.find(pattern); pos != string::npos; pos = text.find(pattern, pos + 1))
        ++count;
    return count;
}

TEST(CodecTest, Expand) {
    EXPECT_EQ(expand("${a} + ${b} = ${a}${b}", {{"a", "1"}, {"b", "2"}}), "1 + 2 = 12");
    EXPECT_EQ(expand("${missing}", {}), "${missing}");
}

TEST(CodecTest, JavaNativeTypes) {
    codec_generator gen(java_codec_table());
    EXPECT_EQ(gen.native_type(parse_type_tag("int")), "int");
    EXPECT_EQ(gen.boxed_type(parse_type_tag("int")), "Integer");
    EXPECT_EQ(gen.native_type(parse_type_tag("int[][]")), "int[][]");
    EXPECT_EQ(gen.native_type(parse_type_tag("list<list<int>>")), "List<List<Integer>>");
    EXPECT_EQ(gen.native_type(parse_type_tag("list<char[]>")), "List<char[]>");
    EXPECT_EQ(gen.native_type(parse_type_tag("list<string>[]")), "List<String>[]");
    EXPECT_EQ(gen.boxed_type(parse_type_tag("long[]")), "long[]");
}

TEST(CodecTest, JavaHelpersAreGeneratedOnce) {
    codec_generator gen(java_codec_table());
    type_tag grid = parse_type_tag("int[][]");
    EXPECT_EQ(gen.decode_expr("a", grid), "decode_array_of_array_of_int(a)");
    EXPECT_EQ(gen.decode_expr("b", grid), "decode_array_of_array_of_int(b)");
    EXPECT_EQ(gen.decode_expr("c", parse_type_tag("int[]")), "decode_array_of_int(c)");
    EXPECT_EQ(gen.encode_expr("ret", grid), "encode_array_of_array_of_int(ret)");

    string helpers = gen.helpers();
    EXPECT_EQ(count_occurrences(helpers, "static int decode_int(Object v)"), 1u);
    EXPECT_EQ(count_occurrences(helpers, "static int[] decode_array_of_int(Object v)"), 1u);
    EXPECT_EQ(count_occurrences(helpers, "static int[][] decode_array_of_array_of_int(Object v)"), 1u);
    EXPECT_EQ(count_occurrences(helpers, "static String encode_array_of_array_of_int(int[][] v)"), 1u);

    // 元素类型的函数在前
    EXPECT_LT(helpers.find("decode_array_of_int(Object v)"), helpers.find("decode_array_of_array_of_int(Object v)"));
    EXPECT_NE(helpers.find("int[][] r = new int[items.size()][];"), string::npos);
}

TEST(CodecTest, JavaGenericArrayAllocation) {
    codec_generator gen(java_codec_table());
    gen.decode_expr("v", parse_type_tag("list<int>[]"));
    string helpers = gen.helpers();
    EXPECT_NE(helpers.find("List<Integer>[] r = (List<Integer>[]) new List[items.size()];"), string::npos);
    EXPECT_NE(helpers.find("List<Integer> r = new ArrayList<>(items.size());"), string::npos);
}

TEST(CodecTest, JavaStringEncoding) {
    codec_generator gen(java_codec_table());
    gen.encode_expr("v", parse_type_tag("list<string>"));
    string helpers = gen.helpers();
    EXPECT_NE(helpers.find(R"(return v == null ? "null" : Json.quote(v);)"), string::npos);
    EXPECT_NE(helpers.find("for (String item : v)"), string::npos);
}

TEST(CodecTest, PythonHelpers) {
    codec_generator gen(python_codec_table());
    EXPECT_EQ(gen.decode_expr("x", parse_type_tag("list<list<string>>")), "_decode_list_of_list_of_string(x)");
    EXPECT_EQ(gen.encode_expr("ret", parse_type_tag("double[]")), "_encode_array_of_double(ret)");

    string helpers = gen.helpers();
    EXPECT_NE(helpers.find("def _decode_list_of_list_of_string(v):"), string::npos);
    EXPECT_NE(helpers.find("[_decode_list_of_string(e) for e in v]"), string::npos);
    EXPECT_NE(helpers.find("return repr(float(v))"), string::npos);
    EXPECT_NE(helpers.find("json.dumps(str(v))"), string::npos);
    EXPECT_EQ(count_occurrences(helpers, "def _decode_string(v):"), 1u);
}
