#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <chrono>
#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 检查字符串是否是合法的 UTF-8 编码
 * 提交的代码会写入数据库并发送给沙箱，二者都要求 UTF-8
 */
bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 生成一个随机 UUID 字符串，用作提交 id
 */
std::string new_uuid();

/**
 * @brief 当前时间，毫秒级 Unix 时间戳
 */
std::int64_t now_millis();

/**
 * @brief 计算第 attempt 次重试前需要等待的时间
 * 指数增长，不超过 max_delay
 */
std::chrono::milliseconds backoff_delay(unsigned attempt, std::chrono::milliseconds base, std::chrono::milliseconds max_delay);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
