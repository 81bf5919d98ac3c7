#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

/**
 * @brief 评分流水线所有异常的基类
 * 构造时记录调用栈，方便在日志中定位错误发生的位置
 */
struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 找不到题目、题目版本或提交
 * 直接返回给调用方，不重试
 */
struct not_found_error : public grader_exception {
    not_found_error();
    explicit not_found_error(const std::string &message);
};

/**
 * @brief 提交内容不合法，比如代码为空、代码过长、运行环境不存在
 * 直接返回给调用方，不重试
 */
struct validation_error : public grader_exception {
    validation_error();
    explicit validation_error(const std::string &message);
};

/**
 * @brief 表示基础设施不可用：沙箱、数据库、缓存无法访问
 * 提交将保持 pending 状态，稍后通过重新调用 grade 重试
 */
struct infrastructure_error : public grader_exception {
    infrastructure_error();
    explicit infrastructure_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public infrastructure_error {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示数据库查询错误
 */
struct database_error : public infrastructure_error {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief 内部不变量被破坏，比如同一个指纹得到了不同的评分结果
 * 这种错误是致命的，必须记录日志并上报，不允许被吞掉
 */
struct invariant_violation : public grader_exception {
    invariant_violation();
    explicit invariant_violation(const std::string &message);
};

}  // namespace grader
