#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace funcjudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    template <typename T>
    judge_exception operator<<(const T &t) const {
        return judge_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如无法创建工作目录、无法写入文件、无法创建子进程，
 * 这类错误不属于评测结果，必须作为服务错误返回给调用方，不能伪造成 CE/RE
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示评测请求不合法
 * 比如缺少字段、语言不存在、参数名不是合法的标识符
 */
struct invalid_request : public judge_exception {
    invalid_request();
    explicit invalid_request(const std::string &message);
};

/**
 * @brief 表示类型描述无法被生成器识别
 * 在生成评测程序时就会抛出，而不是等到运行时
 */
struct unsupported_type : public invalid_request {
    explicit unsupported_type(const std::string &type);
};

}  // namespace funcjudge
