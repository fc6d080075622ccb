#pragma once

#include <climits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ladder::server {

/**
 * @brief ormpp 的 execute 在不同版本中返回 bool 或 int，int 版本失败时返回 INT_MIN
 */
template <typename R>
bool execute_succeeded(R result) {
    if constexpr (std::is_same_v<R, bool>)
        return result;
    else
        return result != INT_MIN;
}

inline std::string last_error_of(const std::string &error) {
    return error.empty() ? std::string("unknown database error") : error;
}

/**
 * @brief 执行查询并检查错误
 * ormpp 查询失败时可能直接抛出 runtime_error，也可能返回空结果并设置 has_error，
 * 后一种情况也转换为 runtime_error，避免把失败的查询当成空表
 * @throw std::runtime_error 查询失败
 */
template <typename Row, typename DB, typename... Args>
std::vector<Row> checked_query(DB &db, const std::string &sql, Args &&... args) {
    std::vector<Row> rows = db.template query<Row>(sql.c_str(), std::forward<Args>(args)...);
    if (rows.empty() && db.has_error())
        throw std::runtime_error(last_error_of(db.get_last_error()));
    return rows;
}

/**
 * @brief 执行 INSERT/UPDATE 等语句并检查返回值
 * @throw std::runtime_error 语句执行失败
 */
template <typename DB, typename... Args>
void checked_execute(DB &db, const std::string &sql, Args &&... args) {
    auto result = db.execute(sql.c_str(), std::forward<Args>(args)...);
    if (!execute_succeeded(result))
        throw std::runtime_error(last_error_of(db.get_last_error()));
}

}  // namespace ladder::server
