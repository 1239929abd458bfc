#include "db/mysql/mysql_handle.hpp"
#include <mysql/errmsg.h>
#include <algorithm>
#include <sys/socket.h>

namespace sqlpool {

namespace {

// Per-thread client library state; worker threads touch handles they did not create
struct MysqlThreadScope {
    MysqlThreadScope() { mysql_thread_init(); }
    ~MysqlThreadScope() { mysql_thread_end(); }
};

void ensure_thread_init() {
    thread_local MysqlThreadScope scope;
}

} // anonymous namespace

MysqlHandle::~MysqlHandle() {
    std::lock_guard lock(op_mutex);
    close_locked();
}

void MysqlHandle::close() {
    closing.store(true, std::memory_order_release);
    connected.store(false, std::memory_order_release);

    std::unique_lock lock(op_mutex, std::try_to_lock);
    if (lock.owns_lock()) {
        close_locked();
        return;
    }

    // An operation is in flight: break its socket so the call returns.
    // The operation cannot close the descriptor while fd_mutex is held.
    std::lock_guard fd_lock(fd_mutex);
    const int fd = socket.load(std::memory_order_acquire);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void MysqlHandle::close_locked() {
    std::lock_guard fd_lock(fd_mutex);
    if (mysql) {
        const bool unbuffered = std::any_of(results.begin(), results.end(),
            [](const auto& entry) { return entry.second; });
        const int fd = socket.load(std::memory_order_acquire);
        if (unbuffered && fd >= 0) {
            // Freeing an unread streaming result would drain it from the server
            ::shutdown(fd, SHUT_RDWR);
        }
        for (const auto& [res, streaming] : results) {
            mysql_free_result(res);
        }
        mysql_close(mysql);
        mysql = nullptr;
    }
    results.clear();
    socket.store(-1, std::memory_order_release);
    connected.store(false, std::memory_order_release);
}

void MysqlHandle::attach_locked(MYSQL* connected_mysql) {
    std::lock_guard fd_lock(fd_mutex);
    mysql = connected_mysql;
    socket.store(static_cast<int>(connected_mysql->net.fd), std::memory_order_release);
    generation.fetch_add(1);
    connected.store(true, std::memory_order_release);
}

void MysqlHandle::track_result(MYSQL_RES* res, bool unbuffered) {
    results.emplace(res, unbuffered);
}

bool MysqlHandle::free_result(MYSQL_RES* res) {
    const auto it = results.find(res);
    if (it == results.end()) {
        return false;
    }
    results.erase(it);
    // Reads and discards the rest of an unbuffered result
    mysql_free_result(res);
    return true;
}

Error MysqlHandle::last_error() const {
    if (!mysql) {
        return closed_connection_error();
    }
    const unsigned int code = mysql_errno(mysql);
    if (code == 0) {
        return Error{ErrorCategory::INTERNAL_ERROR, 0, "Unknown MySQL client failure"};
    }
    return Error::driver(code, mysql_error(mysql));
}

Error closed_connection_error() {
    return Error::driver(CR_SERVER_GONE_ERROR, "MySQL server has gone away (connection closed)");
}

MysqlHandle::Operation::Operation(MysqlHandle& handle)
    : handle_(handle), lock_(handle.op_mutex) {
    ensure_thread_init();
}

MysqlHandle::Operation::~Operation() {
    if (handle_.closing.load(std::memory_order_acquire)) {
        handle_.close_locked();
    }
}

bool MysqlHandle::Operation::usable() const {
    return handle_.mysql != nullptr && !handle_.closing.load(std::memory_order_acquire);
}

} // namespace sqlpool
