#include "server/config.hpp"

namespace ladder::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, database &db) {
    j.at("host").get_to(db.host);
    j.at("user").get_to(db.user);
    j.at("password").get_to(db.password);
    j.at("database").get_to(db.database);
}

void from_json(const json &j, application_config &config) {
    if (j.count("sandbox"))
        j.at("sandbox").get_to(config.sandbox);
    if (exists(j, "database"))
        config.database = j.at("database").get<database>();
    else
        config.database.reset();
    config.fixture = get_value_def<string>(j, "", "fixture");
}

}  // namespace ladder::server
