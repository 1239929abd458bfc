#pragma once

#include "core/error.hpp"
#include <array>
#include <cstdint>

namespace sqlpool {

/**
 * @brief Server error codes after which a connection cannot be trusted
 *
 * Resource exhaustion, shutdown, handshake and network failures,
 * corruption, replication failures and connection limits.
 */
inline constexpr std::array<uint32_t, 42> kFatalServerErrorCodes = {
    1021,  // Disk is full
    1037,  // Server is out of memory and needs to be restarted
    1041,  // Server is out of memory
    1042,  // Can't get hostname
    1043,  // Bad handshake
    1044,  // Access denied to database
    1045,  // Access denied
    1053,  // Server shutdown in progress
    1077,  // Normal shutdown
    1078,  // Aborting because of signal
    1079,  // Shutdown complete
    1080,  // Forcing thread to close
    1081,  // Can't create IP socket
    1114,  // Table is full
    1119,  // Thread stack overrun
    1152,  // Aborting connection
    1153,  // Network packet too large
    1154,  // Read error from pipe
    1155,  // Error from fcntl()
    1156,  // Network packets out of order
    1157,  // Couldn't decompress packet
    1158,  // Error reading network packets
    1159,  // Timeout when reading packets
    1160,  // Error writing network packets
    1161,  // Timeout when writing packets
    1188,  // Error from master
    1189,  // Network error reading from master
    1190,  // Network error writing to master
    1194,  // Table has crashed and requires repair
    1195,  // Table has crashed and repair failed
    1197,  // Transaction cache is full
    1203,  // User has too many connections
    1218,  // Error connecting to master
    1219,  // Error running query on master
    1436,  // Thread stack overrun
    1459,  // Table upgrade required
    1534,  // Writing to binlog failed
    1535,  // Table definitions on master and slave don't match
    1547,  // Column count wrong; table is probably corrupted
    1548,  // Table is probably corrupted
    1610,  // Corrupted replication statement
    1705,  // Statement cache is full
};

/** @brief Client library errors (CR_*) start here; all of them are fatal */
inline constexpr uint32_t kFirstClientErrorCode = 2000;

/**
 * @brief Does this error mean the connection itself is unusable?
 *
 * Fatal:
 * - Any non-driver error other than END_OF_STREAM
 * - Driver errors with a client-side code (>= 2000)
 * - Driver errors listed in kFatalServerErrorCodes
 *
 * Everything else (syntax errors, missing tables, duplicate keys, ...)
 * leaves the connection reusable.
 */
[[nodiscard]] bool is_fatal_error(const Error& err);

/**
 * @brief Is this driver code in the fatal server table?
 */
[[nodiscard]] bool is_fatal_server_code(uint32_t code);

} // namespace sqlpool
