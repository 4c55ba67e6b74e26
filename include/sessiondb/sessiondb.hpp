// include/sessiondb/sessiondb.hpp
// Purpose: Main header file for the sessiondb library
// This is the primary include for users of the library

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include "connection.hpp"
#include "database_adaptor.hpp"
#include "session_context.hpp"
#include "session_table_schema.hpp"
#include "attribute_codec.hpp"
#include "session_data_store.hpp"
#include "session_sweeper.hpp"

namespace sessiondb {

// Version information
constexpr const char* VERSION = "1.0.0";
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

// Get library version
inline std::string version() {
    return VERSION;
}

} // namespace sessiondb
