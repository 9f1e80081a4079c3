#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "core/token/revocation_controller.hpp"
#include "core/token/session_directory.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/token_store.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using sessionguard::core::TokenErrorCodeToString;
using sessionguard::core::TokenStatus;

constexpr const char* kOperatorIp = "127.0.0.1";

void PrintUsage(const char* program) {
    fmt::print(stderr,
               "usage: {} [-c config] <command>\n"
               "  list <user>\n"
               "  revoke <user> <session>\n"
               "  revoke-all <user> [--except <session>]\n"
               "  revoke-family <session>\n",
               program);
}

std::string FormatTime(std::int64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%SZ", &tm);
    return buffer;
}

int Fail(const TokenStatus& status) {
    fmt::print(stderr, "error: {} {}\n", TokenErrorCodeToString(status.Code()), status.Message());
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(std::move(arg));
        }
    }
    if (args.empty()) {
        PrintUsage(argv[0]);
        return EXIT_FAILURE;
    }

    sessionguard::common::AppConfig config;
    try {
        config = config_path.empty() ? sessionguard::common::ConfigLoader::LoadFromEnvOrDefault()
                                     : sessionguard::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "Failed to load config {}: {}\n", config_path, ex.what());
        return EXIT_FAILURE;
    }
    sessionguard::common::InitLogger(config.logging);

    auto pool = std::make_shared<sessionguard::storage::ConnectionPool>(
        sessionguard::storage::MakeOptions(config.storage.mysql));
    auto store = std::make_shared<sessionguard::storage::MySqlTokenStore>(pool);
    sessionguard::core::SessionDirectory directory(store);
    sessionguard::core::RevocationController controller(store);

    int exit_code = EXIT_SUCCESS;
    const std::string& command = args[0];
    if (command == "list" && args.size() == 2) {
        auto sessions = directory.ListSessions(args[1]);
        if (!sessions.IsOk()) {
            exit_code = Fail(sessions.GetStatus());
        } else {
            for (const auto& session : sessions.Value()) {
                fmt::print("{}  {}  ip={}  created={}  expires={}  agent={}\n",
                           session.session_id,
                           session.device_name.empty() ? "<unknown device>" : session.device_name,
                           session.ip_address,
                           FormatTime(session.created_at),
                           FormatTime(session.expires_at),
                           session.user_agent);
            }
            fmt::print("{} active session(s)\n", sessions.Value().size());
        }
    } else if (command == "revoke" && args.size() == 3) {
        auto status = controller.RevokeSession(args[1], args[2], kOperatorIp);
        if (!status.IsOk()) {
            exit_code = Fail(status);
        } else {
            fmt::print("session {} revoked\n", args[2]);
        }
    } else if (command == "revoke-all" && (args.size() == 2 || (args.size() == 4 && args[2] == "--except"))) {
        std::optional<std::string> except;
        if (args.size() == 4) {
            except = args[3];
        }
        auto revoked = controller.RevokeAllSessions(args[1], except, kOperatorIp);
        if (!revoked.IsOk()) {
            exit_code = Fail(revoked.GetStatus());
        } else {
            fmt::print("{} token(s) revoked\n", revoked.Value());
        }
    } else if (command == "revoke-family" && args.size() == 2) {
        auto revoked = controller.RevokeFamily(args[1], sessionguard::core::RevocationReason::kManualRevoke,
                                               kOperatorIp);
        if (!revoked.IsOk()) {
            exit_code = Fail(revoked.GetStatus());
        } else {
            fmt::print("{} token(s) revoked in session {}\n", revoked.Value(), args[1]);
        }
    } else {
        PrintUsage(argv[0]);
        exit_code = EXIT_FAILURE;
    }

    sessionguard::common::ShutdownLogger();
    return exit_code;
}
