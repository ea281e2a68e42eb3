#pragma once

#include <memory>
#include <string>
#include <vector>
#include "codegen/harness.hpp"
#include "grading/diagnostics.hpp"

namespace funcjudge::grading {

/**
 * @brief 一种编程语言的评测方式
 * 包括用户代码和评测程序的文件名、编译与运行命令、错误信息的解析方式以及评测程序生成器。
 * 所有命令都在提交的工作目录中执行，参数中的文件名都是相对路径。
 */
struct language {
    virtual ~language();

    /**
     * @brief 语言标识，与评测请求中的 language 字段对应
     */
    virtual std::string id() const = 0;

    virtual language_kind kind() const = 0;

    /**
     * @brief 是否需要编译，解释执行的语言直接进入运行阶段
     */
    bool compiles() const;

    /**
     * @brief 用户代码的文件名，比如 Solution.java
     */
    virtual std::string source_file() const = 0;

    /**
     * @brief 评测程序的文件名，比如 Runner.java
     */
    virtual std::string harness_file() const = 0;

    /**
     * @brief 编译命令，不需要编译的语言返回空列表
     */
    virtual std::vector<std::string> compile_command() const;

    /**
     * @brief 运行评测程序的命令，标准输入会被重定向到测试点的输入文件
     */
    virtual std::vector<std::string> run_command() const = 0;

    /**
     * @brief 从编译器（或者解释器）的错误输出中提取错误信息，忽略评测程序自身的位置
     */
    virtual std::vector<diagnostic> parse_diagnostics(const std::string &stderr_text) const;

    /**
     * @brief 判断运行第一个测试点时的错误输出是否表示用户代码存在语法错误
     * 解释执行的语言没有编译阶段，语法错误只能在运行时发现，此时应当报告编译错误而不是运行错误
     */
    virtual bool is_syntax_error(const std::string &stderr_text) const;

    virtual const codegen::harness_synthesizer &synthesizer() const = 0;
};

struct java_language : public language {
    std::string id() const override;
    language_kind kind() const override;
    std::string source_file() const override;
    std::string harness_file() const override;
    std::vector<std::string> compile_command() const override;
    std::vector<std::string> run_command() const override;
    const codegen::harness_synthesizer &synthesizer() const override;

private:
    codegen::java_harness_synthesizer java_synthesizer;
};

struct python3_language : public language {
    std::string id() const override;
    language_kind kind() const override;
    std::string source_file() const override;
    std::string harness_file() const override;
    std::vector<std::string> run_command() const override;
    bool is_syntax_error(const std::string &stderr_text) const override;
    const codegen::harness_synthesizer &synthesizer() const override;

private:
    codegen::python_harness_synthesizer python_synthesizer;
};

/**
 * @brief 注册一种语言，已存在相同标识的语言时覆盖
 */
void register_language(std::shared_ptr<language> lang);

/**
 * @brief 根据标识查找语言
 * @throw invalid_request 若语言不存在
 */
std::shared_ptr<language> get_language(const std::string &id);

/**
 * @brief 注册内置的语言：java、python3。重复调用不会产生影响
 */
void register_builtin_languages();

}  // namespace funcjudge::grading
