#pragma once

#include <memory>
#include <string>
#include <variant>

/**
 * 这个头文件包含参数、返回值的类型描述
 * 类型描述是一个递归的语法：
 * 1. 标量：int, long, double, boolean, char, string
 * 2. 数组：T[]，T 可以是任意类型描述
 * 3. 列表：list<T>，T 可以是任意类型描述
 * 嵌套的层数在语法上没有限制，比如 int[][]、list<list<string>>、list<int[]>
 */
namespace funcjudge::codegen {

enum class scalar_kind {
    INT,
    LONG,
    DOUBLE,
    BOOLEAN,
    CHAR,
    STRING
};

struct type_tag;

struct scalar_type {
    scalar_kind kind;
};

struct array_type {
    std::shared_ptr<const type_tag> element;
};

struct list_type {
    std::shared_ptr<const type_tag> element;
};

/**
 * @brief 类型描述的语法树节点
 * 代码生成器通过 std::visit 对语法树做结构递归
 */
struct type_tag {
    std::variant<scalar_type, array_type, list_type> node;

    static type_tag scalar(scalar_kind kind);
    static type_tag array_of(type_tag element);
    static type_tag list_of(type_tag element);

    /**
     * @brief 类型的规范写法，比如 int[][]、list<string>
     * 规范写法相同的两个类型一定相同，可以作为代码生成时的缓存键
     */
    std::string spelling() const;

    /**
     * @brief 可以作为标识符的一部分的类型名，比如 array_of_list_of_int
     * 采用前缀形式，因此 list<int>[] 和 list<int[]> 不会冲突
     */
    std::string mangled() const;
};

bool operator==(const type_tag &a, const type_tag &b);

bool operator!=(const type_tag &a, const type_tag &b);

const char *scalar_name(scalar_kind kind);

/**
 * @brief 解析类型描述
 * 标量名大小写不敏感，同时接受 Java 的包装类名（Integer、Character 等）以及 bool、str；
 * 数组写作 T[]，列表写作 list<T>、List<T> 或 vector<T>，空白字符会被忽略
 * @param text 类型描述，比如 "int[]"、"List<List<Integer>>"
 * @throw unsupported_type 若类型描述无法识别
 */
type_tag parse_type_tag(const std::string &text);

}  // namespace funcjudge::codegen
