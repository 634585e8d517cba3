#pragma once

#include "probe.hpp"
#include <chrono>
#include <memory>
#include <string>

struct MysqlTarget {
    std::string host;
    int port = 3306;
    std::string user;
    std::string password;
    std::string database;
    std::chrono::seconds timeout{10};
};

class MysqlClient {
public:
    virtual ~MysqlClient() = default;

    // Connects, then runs query (or pings when empty). Throws std::runtime_error on failure.
    virtual void check(const MysqlTarget& target, const std::string& query) = 0;
};

// MySQL/MariaDB C client library
class NativeMysqlClient : public MysqlClient {
public:
    NativeMysqlClient();
    ~NativeMysqlClient() override;

    void check(const MysqlTarget& target, const std::string& query) override;

    NativeMysqlClient(const NativeMysqlClient&) = delete;
    NativeMysqlClient& operator=(const NativeMysqlClient&) = delete;
};

class MysqlProbe : public Probe {
public:
    MysqlProbe(std::shared_ptr<MysqlClient> client, std::chrono::seconds default_timeout);

    ProbeResult run(const Monitor& monitor) override;

private:
    std::shared_ptr<MysqlClient> client_;
    std::chrono::seconds default_timeout_;
};
