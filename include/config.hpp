#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace funcjudge {

enum error_codes {
    E_SUCCESS = 0,
    E_INVALID_ARGUMENT = 1,
    E_INTERNAL_ERROR = 2
};

/**
 * @brief 分隔用户调试输出和评测结果的标记行
 * 评测程序先输出用户的调试信息，再输出这一行，最后输出一行 {"result": ...}
 * 若开启了 UNIQUE_SENTINEL，每个提交会在这个标记后追加一个随机串
 */
extern const char *RESULT_SENTINEL;

/**
 * @brief 选手程序编译及运行的根目录，每个提交在此目录下创建一个随机命名的工作目录
 * 评测结束后（无论成功与否）工作目录都会被删除
 *
 * RUN_DIR
 * ├── 5f0c...-uuid // 一个提交的工作目录
 * │   ├── Solution.java // 选手代码（文件名由语言决定）
 * │   ├── Runner.java // 生成的评测程序
 * │   ├── Runner.class // 编译产物
 * │   └── input.json // 当前测试点的输入数据
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 每个测试点的时钟时间限制
 * @note 单位为毫秒
 */
extern int TESTCASE_TIME_LIMIT;

/**
 * @brief 编译的时钟时间限制
 * @note 单位为毫秒
 */
extern int COMPILE_TIME_LIMIT;

/**
 * @brief 子进程 stdout、stderr 各自最多保存多少字节，超出部分被丢弃
 */
extern std::size_t MAX_OUTPUT_LENGTH;

/**
 * @brief 下标（从 0 开始）不小于该值的测试点在提交模式下视为隐藏测试点
 */
extern std::size_t HIDDEN_TESTCASE_THRESHOLD;

/**
 * @brief 是否为每个提交生成不同的分隔标记，避免用户程序打印出分隔标记导致结果被截断
 */
extern bool UNIQUE_SENTINEL;

/**
 * @brief 编译器、解释器的路径，不是绝对路径时在 PATH 中查找
 */
extern std::string JAVAC;

extern std::string JAVA;

extern std::string PYTHON3;

}  // namespace funcjudge
