#pragma once

#include "sqlite_db.hpp"

namespace aggregator::db::sqlite {

// Creates the tables on a fresh file and stamps PRAGMA user_version.
// A no-op on a current store; refuses a store written by a newer schema.
void BootstrapSchema(SqliteDB& db);

} // namespace aggregator::db::sqlite
