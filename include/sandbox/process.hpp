#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace funcjudge::sandbox {

struct process_options {
    /**
     * @brief 命令及参数，command[0] 不是路径时在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录
     */
    std::filesystem::path working_dir;

    /**
     * @brief 时钟时间限制，单位为毫秒
     */
    int timeout_ms = 1000;

    /**
     * @brief 标准输入重定向的文件，为空时重定向到 /dev/null
     */
    std::filesystem::path stdin_file;

    /**
     * @brief stdout、stderr 各自最多保存多少字节，超出的部分读出后丢弃
     * 小于 0 表示不限制
     */
    std::int64_t output_limit = -1;
};

/**
 * @brief 一次子进程运行的原始结果，不包含任何评测语义
 */
struct raw_process_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 子进程的返回值，被信号杀死时为 128 + 信号值
     */
    int exit_code = 0;

    /**
     * @brief 杀死子进程的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief 是否因为超过时间限制而被杀死
     */
    bool timed_out = false;

    bool stdout_truncated = false;
    bool stderr_truncated = false;

    std::int64_t elapsed_ms = 0;
};

/**
 * @brief 运行外部命令并等待其结束
 * 子进程位于独立的进程组中，stdout 与 stderr 通过管道被父进程读取。
 * 超过时间限制时，先向整个进程组发送 SIGTERM，100ms 后再发送 SIGKILL；
 * 子进程正常结束后同样会杀死进程组中残留的进程，因此函数返回后不会有任何
 * 由这次调用产生的进程存活。
 * @param opt 运行参数
 * @throw internal_error 若无法创建管道、无法 fork 或者命令无法启动
 */
raw_process_result run_process(const process_options &opt);

}  // namespace funcjudge::sandbox
