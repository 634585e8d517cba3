#include "redis_probe.hpp"
#include "util.hpp"
#include <sw/redis++/redis++.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {
    std::string reply_to_string(redisReply& reply) {
        switch (reply.type) {
            case REDIS_REPLY_STRING:
            case REDIS_REPLY_STATUS:
                return std::string(reply.str, reply.len);
            case REDIS_REPLY_INTEGER:
                return std::to_string(reply.integer);
            case REDIS_REPLY_NIL:
                return "(nil)";
            case REDIS_REPLY_ARRAY:
                return fmt::format("({} elements)", reply.elements);
            default:
                return "OK";
        }
    }
}

std::string RedisPlusPlusClient::check(const RedisTarget& target, const std::vector<std::string>& args) {
    sw::redis::ConnectionOptions connection_opts;
    connection_opts.host = target.host;
    connection_opts.port = target.port;
    connection_opts.db = target.db;
    connection_opts.connect_timeout = target.timeout;
    connection_opts.socket_timeout = target.timeout;
    if (!target.user.empty()) {
        connection_opts.user = target.user;
    }
    if (!target.password.empty()) {
        connection_opts.password = target.password;
    }

    sw::redis::ConnectionPoolOptions pool_opts;
    pool_opts.size = 1;

    sw::redis::Redis redis(connection_opts, pool_opts);
    if (args.empty()) {
        return redis.ping();
    }

    auto reply = redis.command(args.begin(), args.end());
    if (!reply) {
        throw std::runtime_error("Empty reply from Redis");
    }
    return reply_to_string(*reply);
}

RedisProbe::RedisProbe(std::shared_ptr<RedisClient> client, std::chrono::seconds default_timeout)
    : client_(std::move(client)), default_timeout_(default_timeout) {}

ProbeResult RedisProbe::run(const Monitor& monitor) {
    const auto& config = monitor.config;

    RedisTarget target;
    target.host = config.hostname;
    target.port = config.port > 0 ? config.port : 6379;
    target.user = config.username;
    target.password = config.password;
    target.timeout = probe_timeout(monitor, default_timeout_);
    if (!config.database.empty()) {
        try {
            target.db = std::stoi(config.database);
        } catch (const std::exception&) {
            return ProbeResult::failure("Redis database must be a numeric index, got '" + config.database + "'");
        }
    }

    auto args = util::split_whitespace(config.query);
    auto started = std::chrono::steady_clock::now();
    try {
        auto reply = client_->check(target, args);
        return ProbeResult::success(fmt::format("Redis {} - {}", args.empty() ? "PING" : args.front(), reply),
                                    elapsed_ms(started));
    } catch (const std::exception& e) {
        spdlog::debug("Redis check for monitor {} failed: {}", monitor.id, e.what());
        return ProbeResult::failure(e.what(), elapsed_ms(started));
    }
}
