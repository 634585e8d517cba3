#include "mysql_probe.hpp"
#include <mysql.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <mutex>
#include <stdexcept>

namespace {
    std::once_flag g_library_init;

    struct MysqlCloser {
        void operator()(MYSQL* conn) const {
            if (conn) mysql_close(conn);
        }
    };

    struct ResultFreer {
        void operator()(MYSQL_RES* res) const {
            if (res) mysql_free_result(res);
        }
    };

    std::runtime_error mysql_failure(const char* stage, MYSQL* conn) {
        return std::runtime_error(fmt::format("{} failed: {} ({})", stage, mysql_error(conn), mysql_errno(conn)));
    }
}

NativeMysqlClient::NativeMysqlClient() {
    std::call_once(g_library_init, []() {
        if (mysql_library_init(0, nullptr, nullptr) != 0) {
            spdlog::error("Could not initialize the MySQL client library");
        }
    });
}

NativeMysqlClient::~NativeMysqlClient() = default;

void NativeMysqlClient::check(const MysqlTarget& target, const std::string& query) {
    // Each probe thread needs its own client thread state
    mysql_thread_init();
    struct ThreadEnd {
        ~ThreadEnd() { mysql_thread_end(); }
    } thread_end;

    std::unique_ptr<MYSQL, MysqlCloser> conn(mysql_init(nullptr));
    if (!conn) {
        throw std::runtime_error("mysql_init failed: out of memory");
    }

    unsigned int timeout = static_cast<unsigned int>(target.timeout.count());
    mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &timeout);
    mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &timeout);

    const char* db = target.database.empty() ? nullptr : target.database.c_str();
    if (!mysql_real_connect(conn.get(), target.host.c_str(), target.user.c_str(), target.password.c_str(),
                            db, static_cast<unsigned int>(target.port), nullptr, 0)) {
        throw mysql_failure("Connect", conn.get());
    }

    if (query.empty()) {
        if (mysql_ping(conn.get()) != 0) {
            throw mysql_failure("Ping", conn.get());
        }
        return;
    }

    if (mysql_real_query(conn.get(), query.c_str(), static_cast<unsigned long>(query.size())) != 0) {
        throw mysql_failure("Query", conn.get());
    }

    std::unique_ptr<MYSQL_RES, ResultFreer> result(mysql_store_result(conn.get()));
    if (!result && mysql_field_count(conn.get()) != 0) {
        throw mysql_failure("Reading result", conn.get());
    }
}

MysqlProbe::MysqlProbe(std::shared_ptr<MysqlClient> client, std::chrono::seconds default_timeout)
    : client_(std::move(client)), default_timeout_(default_timeout) {}

ProbeResult MysqlProbe::run(const Monitor& monitor) {
    const auto& config = monitor.config;

    MysqlTarget target;
    target.host = config.hostname;
    target.port = config.port > 0 ? config.port : 3306;
    target.user = config.username;
    target.password = config.password;
    target.database = config.database;
    target.timeout = probe_timeout(monitor, default_timeout_);

    auto started = std::chrono::steady_clock::now();
    try {
        client_->check(target, config.query);
    } catch (const std::exception& e) {
        spdlog::debug("MySQL check for monitor {} failed: {}", monitor.id, e.what());
        return ProbeResult::failure(e.what(), elapsed_ms(started));
    }

    return ProbeResult::success(config.query.empty() ? "MySQL ping OK" : "MySQL query OK",
                                elapsed_ms(started));
}
