#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>
#include <memory>
#include <string>

namespace sessionguard {
namespace storage {

// 将当前连接上的 MySQL 错误转换为 Status
// 重复键 -> AlreadyExists, 断线和超时 -> Unavailable
common::Status MakeMySqlStatus(MYSQL* handle, const std::string& context);

class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    static common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    // 转义字符串字面量, 结果不含外层引号
    std::string Escape(const std::string& value) const;
    // 执行不返回结果集的语句, 返回受影响行数
    common::StatusOr<std::uint64_t> Execute(const std::string& sql);

    MYSQL* Raw() const noexcept {return handle_;}
    const Options& GetOptions() const noexcept {return options_;}
private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
};

}
}
