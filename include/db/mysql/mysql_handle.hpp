#pragma once

#include "core/error.hpp"
#include <mysql/mysql.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace sqlpool {

/**
 * @brief Native MYSQL* handle shared by a connection and everything it produced
 *
 * Every C API call sequence runs inside an Operation, which holds op_mutex.
 * close() from another thread cannot take op_mutex while an operation is in
 * flight; it shuts the socket down instead, which makes the blocked call
 * fail, and the Operation frees the handle on its way out.
 *
 * Result sets taken from the handle are registered here and freed before
 * mysql_close, since mysql_free_result reads the MYSQL they came from.
 */
struct MysqlHandle {
    std::mutex op_mutex;
    MYSQL* mysql = nullptr;             // Guarded by op_mutex
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<int> socket{-1};        // Written under fd_mutex
    std::atomic<uint64_t> generation{0};  // Bumped by every successful connect

    // Held across shutdown() and mysql_close() so a descriptor is never
    // shut down after it was closed and handed to another connection
    std::mutex fd_mutex;

    // Live results of the current session, guarded by op_mutex.
    // The value marks an unbuffered (mysql_use_result) result.
    std::unordered_map<MYSQL_RES*, bool> results;

    ~MysqlHandle();

    /**
     * @brief Close the handle now, or abort the in-flight operation
     */
    void close();

    // op_mutex must be held
    void close_locked();

    /**
     * @brief Install a freshly connected MYSQL* (op_mutex held)
     */
    void attach_locked(MYSQL* connected_mysql);

    // op_mutex must be held
    void track_result(MYSQL_RES* res, bool unbuffered);

    /**
     * @brief Free a result still owned by the current session (op_mutex held)
     * @return false if close_locked() already freed it
     */
    bool free_result(MYSQL_RES* res);

    // op_mutex must be held
    [[nodiscard]] Error last_error() const;

    /**
     * @brief RAII scope for one C API call sequence
     */
    class Operation {
    public:
        explicit Operation(MysqlHandle& handle);
        ~Operation();

        Operation(const Operation&) = delete;
        Operation& operator=(const Operation&) = delete;

        /** @brief Handle is open and not being closed */
        [[nodiscard]] bool usable() const;

        [[nodiscard]] MYSQL* mysql() const { return handle_.mysql; }

    private:
        MysqlHandle& handle_;
        std::lock_guard<std::mutex> lock_;
    };
};

/**
 * @brief Error returned for calls on a closed handle
 */
[[nodiscard]] Error closed_connection_error();

} // namespace sqlpool
