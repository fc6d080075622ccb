#pragma once

#include <optional>
#include "common/json_utils.hpp"
#include "judge/sandbox.hpp"

namespace ladder::server {

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database {
    /**
     * @brief 数据库服务器的地址
     */
    std::string host;

    /**
     * @brief 数据库服务器的账号
     */
    std::string user;

    /**
     * @brief 数据库服务器的密码
     */
    std::string password;

    /**
     * @brief 使用连接到的数据库服务器的哪一个数据库
     */
    std::string database;
};

void from_json(const nlohmann::json &j, database &db);

/**
 * @brief 评测程序的配置文件
 * {
 *   "sandbox": { "url": "...", "maxConcurrency": 4 },
 *   "database": { "host": "...", "user": "...", "password": "...", "database": "..." },
 *   "fixture": "exam.json"
 * }
 * database 和 fixture 至多设置一个，都不设置时需要在命令行中指定 fixture
 */
struct application_config {
    sandbox_config sandbox;

    std::optional<server::database> database;

    /**
     * @brief 不连接数据库时使用的 JSON 数据文件
     */
    std::string fixture;
};

void from_json(const nlohmann::json &j, application_config &config);

}  // namespace ladder::server
