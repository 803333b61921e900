#pragma once

#include <pqxx/connection>

namespace km::db {

struct Schema {
    // Creates the keymaint tables and indexes if they do not exist yet.
    static void init(pqxx::connection& conn);
};

}
