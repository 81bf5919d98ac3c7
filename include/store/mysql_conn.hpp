#pragma once

#include <mysql/mysql.h>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"

namespace grader::store {

/**
 * @brief 查询结果的一行，NULL 值为 nullopt
 */
typedef std::vector<std::optional<std::string>> mysql_row;

/**
 * @brief 表示一个 MySQL 连接
 * 一个连接同一时刻只能被一个线程使用，调用方负责加锁
 */
class mysql_conn {
public:
    explicit mysql_conn(const database_config &config);
    ~mysql_conn();

    mysql_conn(const mysql_conn &) = delete;
    mysql_conn &operator=(const mysql_conn &) = delete;

    /**
     * @brief 确保连接可用，连接断开时重新连接
     * @throw database_error 无法连接到数据库
     */
    void ensure_connected();

    /**
     * @brief 转义字符串，返回值带单引号，可以直接拼接进 SQL
     */
    std::string quote(const std::string &value);

    /**
     * @brief 执行不返回结果的语句
     * @return 受影响的行数
     * @throw database_error 执行失败
     */
    std::uint64_t execute(const std::string &sql);

    /**
     * @brief 执行查询
     * @throw database_error 执行失败
     */
    std::vector<mysql_row> query(const std::string &sql);

    void begin();
    void commit();
    void rollback();

private:
    void connect();
    [[noreturn]] void fail(const std::string &sql);

    database_config config;
    MYSQL *handle = nullptr;
    bool in_transaction = false;
};

/**
 * @brief 事务守卫，没有调用 commit 时在析构函数中回滚
 */
class mysql_transaction {
public:
    explicit mysql_transaction(mysql_conn &conn);
    ~mysql_transaction();

    void commit();

private:
    mysql_conn &conn;
    bool finished = false;
};

}  // namespace grader::store
