#include "store/mysql_conn.hpp"
#include <glog/logging.h>
#include <memory>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace grader::store {
using namespace std;

mysql_conn::mysql_conn(const database_config &config) : config(config) {}

mysql_conn::~mysql_conn() {
    if (handle) mysql_close(handle);
}

void mysql_conn::connect() {
    if (handle) {
        mysql_close(handle);
        handle = nullptr;
    }
    handle = mysql_init(nullptr);
    if (!handle) throw database_error("unable to allocate mysql handle");

    LOG(INFO) << "MySQL: connecting to " << config.host << ":" << config.port << "/" << config.database;
    if (!mysql_real_connect(handle, config.host.c_str(), config.user.c_str(), config.password.c_str(),
                            config.database.c_str(), config.port, nullptr, 0)) {
        string message = mysql_error(handle);
        mysql_close(handle);
        handle = nullptr;
        throw database_error("unable to connect to mysql server " + config.host + ": " + message);
    }
    mysql_set_character_set(handle, "utf8mb4");
}

void mysql_conn::ensure_connected() {
    // 事务内重连会丢失之前的语句，只能让语句失败并回滚
    if (in_transaction) {
        if (!handle) throw database_error("mysql connection lost inside a transaction");
        return;
    }
    if (!handle || mysql_ping(handle) != 0) {
        if (handle) LOG(WARNING) << "MySQL: lost connection, reconnecting";
        connect();
    }
}

string mysql_conn::quote(const string &value) {
    ensure_connected();
    unique_ptr<char[]> buffer(new char[value.size() * 2 + 1]);
    unsigned long length = mysql_real_escape_string(handle, buffer.get(), value.data(), value.size());
    return "'" + string(buffer.get(), length) + "'";
}

void mysql_conn::fail(const string &sql) {
    string message = handle ? mysql_error(handle) : "no connection";
    LOG(ERROR) << "MySQL: query failed: " << message;
    DLOG(INFO) << "MySQL: failed statement: " << sql;
    throw database_error("mysql query failed: " + message);
}

uint64_t mysql_conn::execute(const string &sql) {
    ensure_connected();
    if (mysql_real_query(handle, sql.data(), sql.size()) != 0)
        fail(sql);
    return mysql_affected_rows(handle);
}

vector<mysql_row> mysql_conn::query(const string &sql) {
    ensure_connected();
    if (mysql_real_query(handle, sql.data(), sql.size()) != 0)
        fail(sql);

    unique_ptr<MYSQL_RES, decltype(&mysql_free_result)> result(mysql_store_result(handle), mysql_free_result);
    if (!result) {
        if (mysql_field_count(handle) == 0) return {};
        fail(sql);
    }

    vector<mysql_row> rows;
    unsigned int fields = mysql_num_fields(result.get());
    while (MYSQL_ROW row = mysql_fetch_row(result.get())) {
        unsigned long *lengths = mysql_fetch_lengths(result.get());
        mysql_row values;
        for (unsigned int i = 0; i < fields; ++i) {
            if (row[i])
                values.emplace_back(string(row[i], lengths[i]));
            else
                values.emplace_back(nullopt);
        }
        rows.push_back(move(values));
    }
    return rows;
}

void mysql_conn::begin() {
    execute("START TRANSACTION");
    in_transaction = true;
}

void mysql_conn::commit() {
    defer { in_transaction = false; };
    execute("COMMIT");
}

void mysql_conn::rollback() {
    defer { in_transaction = false; };
    execute("ROLLBACK");
}

mysql_transaction::mysql_transaction(mysql_conn &conn) : conn(conn) {
    conn.begin();
}

mysql_transaction::~mysql_transaction() {
    if (finished) return;
    try {
        conn.rollback();
    } catch (database_error &ex) {
        LOG(ERROR) << "MySQL: rollback failed: " << ex.what();
    }
}

void mysql_transaction::commit() {
    conn.commit();
    finished = true;
}

}  // namespace grader::store
