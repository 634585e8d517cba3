#pragma once

#include "probe.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

struct RedisTarget {
    std::string host;
    int port = 6379;
    std::string user;
    std::string password;
    int db = 0;
    std::chrono::seconds timeout{10};
};

class RedisClient {
public:
    virtual ~RedisClient() = default;

    // PING when args is empty, otherwise the raw command. Returns the reply as text.
    // Throws on connection or command errors.
    virtual std::string check(const RedisTarget& target, const std::vector<std::string>& args) = 0;
};

class RedisPlusPlusClient : public RedisClient {
public:
    std::string check(const RedisTarget& target, const std::vector<std::string>& args) override;
};

class RedisProbe : public Probe {
public:
    RedisProbe(std::shared_ptr<RedisClient> client, std::chrono::seconds default_timeout);

    ProbeResult run(const Monitor& monitor) override;

private:
    std::shared_ptr<RedisClient> client_;
    std::chrono::seconds default_timeout_;
};
