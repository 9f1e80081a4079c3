#include "storage/mysql/connection.hpp"

#include <fmt/format.h>

#include <vector>

namespace sessionguard {
namespace storage {

namespace {

// MySQL 客户端只接受秒级超时, 不足一秒按一秒处理
unsigned int ToTimeoutSeconds(std::chrono::milliseconds timeout) {
    auto seconds = (timeout.count() + 999) / 1000;
    return static_cast<unsigned int>(seconds > 0 ? seconds : 1);
}

} // namespace

common::Status MakeMySqlStatus(MYSQL* handle, const std::string& context) {
    if (handle == nullptr) {
        return common::Status::Internal(context);
    }
    const unsigned int err = mysql_errno(handle);
    std::string message = fmt::format("{}: {} ({})", context, mysql_error(handle), err);
    switch (err) {
        case 1062: // ER_DUP_ENTRY
            return common::Status::AlreadyExists(message);
        case 1205: // ER_LOCK_WAIT_TIMEOUT
        case 2002: // CR_CONNECTION_ERROR
        case 2003: // CR_CONN_HOST_ERROR
        case 2006: // CR_SERVER_GONE_ERROR
        case 2013: // CR_SERVER_LOST
            return common::Status::Unavailable(message);
        default:
            return common::Status::Internal(message);
    }
}

Connection::Connection(MYSQL* handle, Options options): handle_(handle), options_(std::move(options)) {}

Connection::~Connection() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

common::StatusOr<std::unique_ptr<Connection>> Connection::Create(const Options& options) {
    MYSQL* handle = mysql_init(nullptr);
    if (handle == nullptr) {
        return common::Status::Internal("mysql_init failed");
    }

    unsigned int connect_timeout_sec = ToTimeoutSeconds(options.connect_timeout);
    mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_sec);
    unsigned int read_timeout_sec = ToTimeoutSeconds(options.read_timeout);
    mysql_options(handle, MYSQL_OPT_READ_TIMEOUT, &read_timeout_sec);
    unsigned int write_timeout_sec = ToTimeoutSeconds(options.write_timeout);
    mysql_options(handle, MYSQL_OPT_WRITE_TIMEOUT, &write_timeout_sec);

    if (!mysql_real_connect(handle,
                           options.host.c_str(),
                           options.user.c_str(),
                           options.password.c_str(),
                           options.database.c_str(),
                           options.port,
                           nullptr,
                           0)) {
        // 连不上数据库一律按不可用处理, 由调用方决定是否重试
        common::Status status = common::Status::Unavailable(
            fmt::format("mysql_real_connect failed: {}", mysql_error(handle)));
        mysql_close(handle);
        return status;
    }

    if (!options.charset.empty() && mysql_set_character_set(handle, options.charset.c_str()) != 0) {
        common::Status status = MakeMySqlStatus(handle, "mysql_set_character_set failed");
        mysql_close(handle);
        return status;
    }

    return common::StatusOr<std::unique_ptr<Connection>>(std::unique_ptr<Connection>(new Connection(handle, options)));
}

std::string Connection::Escape(const std::string& value) const {
    std::vector<char> buffer(value.size() * 2 + 1);
    unsigned long length = mysql_real_escape_string(handle_, buffer.data(), value.data(),
                                                    static_cast<unsigned long>(value.size()));
    return std::string(buffer.data(), length);
}

common::StatusOr<std::uint64_t> Connection::Execute(const std::string& sql) {
    if (mysql_real_query(handle_, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
        return MakeMySqlStatus(handle_, "query failed");
    }
    return common::StatusOr<std::uint64_t>(static_cast<std::uint64_t>(mysql_affected_rows(handle_)));
}

} // namespace storage
} // namespace sessionguard
