#pragma once

#include <string>
#include <vector>
#include "codegen/type_tag.hpp"

namespace funcjudge::codegen {

/**
 * @brief 用户函数的一个参数
 */
struct parameter_descriptor {
    /**
     * @brief 参数名，也是评测输入 JSON 对象中的键名
     */
    std::string name;

    type_tag type;
};

/**
 * @brief 用户函数的签名
 * 每道题目给出一次，评测过程中不会改变
 */
struct execution_spec {
    std::string function_name;

    /**
     * @brief 参数列表，按照声明顺序解码并传入用户函数
     */
    std::vector<parameter_descriptor> params;

    type_tag return_type;
};

/**
 * @brief 题目没有给出函数签名时使用的默认签名：sortArray(nums: int[]) -> int[]
 */
execution_spec legacy_execution_spec();

/**
 * @brief 检查函数名和参数名都是合法的标识符，且参数名不重复
 * @throw invalid_request 若签名不合法
 */
void validate_execution_spec(const execution_spec &spec);

/**
 * @brief 评测程序生成器
 * 评测程序从标准输入读取参数 JSON，调用用户的函数，将返回值编码后输出：
 * 先输出分隔行（sentinel），再输出一行 {"result":<返回值>}。
 * 任何错误（缺少参数、类型不匹配、用户代码抛出异常）都会使评测程序以非零返回值退出，
 * 并在标准错误流中输出错误信息，此时不会输出分隔行。
 */
struct harness_synthesizer {
    virtual ~harness_synthesizer();

    /**
     * @brief 生成完整的评测程序源代码
     * @param spec 用户函数的签名
     * @param sentinel 分隔行，调试输出与结果之间的分界
     * @throw invalid_request 若签名不合法
     * @throw unsupported_type 若签名中存在无法生成编解码代码的类型
     */
    virtual std::string synthesize(const execution_spec &spec, const std::string &sentinel) const = 0;
};

/**
 * @brief 生成 Runner.java，用户代码位于 Solution.java 的 Solution 类中
 * Java 标准库没有 JSON 解析器，因此评测程序内嵌一个递归下降的 JSON 解析器
 */
struct java_harness_synthesizer : public harness_synthesizer {
    std::string synthesize(const execution_spec &spec, const std::string &sentinel) const override;
};

/**
 * @brief 生成 runner.py，用户代码位于 solution.py 的 Solution 类中
 */
struct python_harness_synthesizer : public harness_synthesizer {
    std::string synthesize(const execution_spec &spec, const std::string &sentinel) const override;
};

}  // namespace funcjudge::codegen
