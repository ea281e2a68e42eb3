#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include "codegen/type_tag.hpp"

/**
 * 这个头文件包含类型编解码代码的生成器
 * 生成器对类型描述的语法树做结构递归：对于每个出现过的类型，在评测程序中
 * 生成一个 decode_<类型名>（JSON 值 → 本地类型）和 encode_<类型名>（本地类型 → JSON 文本）
 * 函数，数组、列表的编解码函数调用元素类型的编解码函数，因此任意嵌套深度都不需要特殊处理。
 *
 * 不同目标语言的差异全部放在 codec_table 中，生成器本身与语言无关。
 * 模板中使用 ${name} 形式的占位符：
 * ${name}        类型名（type_tag::mangled）
 * ${native}      本地类型名
 * ${body}        函数体
 * ${value}       被编解码的值的表达式
 * ${elem}        元素类型名
 * ${elem_native} 元素的本地类型名
 * ${elem_boxed}  元素的包装类型名（Java 的泛型参数不能是基本类型）
 * ${alloc}       创建数组的表达式
 */
namespace funcjudge::codegen {

/**
 * @brief 一种标量类型在目标语言中的表示
 */
struct scalar_codec {
    std::string native;
    std::string boxed;

    /**
     * @brief decode 函数体，参数名为 v，是 JSON 解析器给出的通用值
     */
    std::string decode;

    /**
     * @brief encode 函数体，参数名为 v，返回 JSON 文本
     */
    std::string encode;
};

/**
 * @brief 数组或列表在目标语言中的表示
 */
struct composite_codec {
    std::string native;
    std::string decode;
    std::string encode;
};

/**
 * @brief 一个目标语言的编解码模板表
 */
struct codec_table {
    std::map<scalar_kind, scalar_codec> scalars;
    composite_codec array;
    composite_codec list;

    std::string decode_helper;
    std::string encode_helper;
    std::string decode_call;
    std::string encode_call;

    /**
     * @brief 根据元素本地类型和长度表达式生成创建数组的表达式，不需要时为空
     */
    std::string (*array_alloc)(const std::string &elem_native, const std::string &size) = nullptr;
};

const codec_table &java_codec_table();

const codec_table &python_codec_table();

/**
 * @brief 替换模板中的 ${key} 占位符
 */
std::string expand(const std::string &tmpl, const std::map<std::string, std::string> &vars);

/**
 * @brief 编解码代码生成器
 * 一个生成器对应一个评测程序，同一个类型的编解码函数只会生成一次
 */
struct codec_generator {
    explicit codec_generator(const codec_table &table);

    /**
     * @brief 生成将通用 JSON 值解码为本地类型的表达式，并登记所需的辅助函数
     * @param value_expr 通用 JSON 值的表达式
     * @param type 目标类型
     */
    std::string decode_expr(const std::string &value_expr, const type_tag &type);

    /**
     * @brief 生成将本地类型编码为 JSON 文本的表达式，并登记所需的辅助函数
     * @param value_expr 本地类型的值的表达式
     * @param type 值的类型
     */
    std::string encode_expr(const std::string &value_expr, const type_tag &type);

    std::string native_type(const type_tag &type) const;

    std::string boxed_type(const type_tag &type) const;

    /**
     * @brief 所有已登记的辅助函数的源代码，元素类型的函数排在前面
     */
    std::string helpers() const;

private:
    std::string require_decoder(const type_tag &type);
    std::string require_encoder(const type_tag &type);

    const codec_table &table;
    std::set<std::string> emitted;
    std::vector<std::string> functions;
};

}  // namespace funcjudge::codegen
