#include "icmp_probe.hpp"
#include "monitor_validation.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <array>
#include <cstdio>
#include <regex>
#include <stdexcept>

PingStats SystemPinger::ping(const std::string& host, int count, std::chrono::seconds deadline) {
    // The host is interpolated into a shell command, so only host-name characters are allowed
    if (!is_safe_hostname(host)) {
        throw std::invalid_argument("Refusing to ping unsafe host name: " + host);
    }

    auto command = fmt::format("ping -n -q -c {} -w {} {} 2>&1", count, deadline.count(), host);
    std::unique_ptr<FILE, decltype(&::pclose)> pipe(::popen(command.c_str(), "r"), &::pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to launch ping");
    }

    std::string output;
    std::array<char, 512> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        output += buffer.data();
    }

    auto stats = parse_output(output);
    if (!stats) {
        throw std::runtime_error("Unexpected ping output: " + util::trim(output));
    }
    return *stats;
}

std::optional<PingStats> SystemPinger::parse_output(const std::string& output) {
    // "4 packets transmitted, 3 received, 25% packet loss, time 3004ms"
    static const std::regex summary_re(
        R"((\d+) packets transmitted, (\d+) (?:packets )?received,.*?([\d.]+)% packet loss)");
    // "rtt min/avg/max/mdev = 0.045/0.061/0.078/0.012 ms" or "round-trip min/avg/max = ..."
    static const std::regex rtt_re(R"(= ([\d.]+)/([\d.]+)/([\d.]+))");

    std::smatch match;
    if (!std::regex_search(output, match, summary_re)) {
        return std::nullopt;
    }

    PingStats stats;
    stats.transmitted = std::stoi(match[1].str());
    stats.received = std::stoi(match[2].str());
    stats.loss_pct = std::stod(match[3].str());

    if (std::regex_search(output, match, rtt_re)) {
        stats.avg_rtt_ms = std::stod(match[2].str());
    }
    return stats;
}

IcmpProbe::IcmpProbe(std::shared_ptr<Pinger> pinger, std::chrono::seconds default_timeout)
    : pinger_(std::move(pinger)), default_timeout_(default_timeout) {}

ProbeResult IcmpProbe::run(const Monitor& monitor) {
    const auto& config = monitor.config;
    int count = config.packet_count > 0 ? config.packet_count : 4;

    auto stats = pinger_->ping(config.hostname, count, probe_timeout(monitor, default_timeout_));

    nlohmann::json details = {
        {"transmitted", stats.transmitted},
        {"received", stats.received},
        {"packetLoss", stats.loss_pct}
    };

    ProbeResult result;
    if (stats.loss_pct <= static_cast<double>(config.max_packet_loss)) {
        result = ProbeResult::success(
            fmt::format("{}/{} packets received, {:.0f}% loss", stats.received, stats.transmitted, stats.loss_pct),
            stats.avg_rtt_ms);
    } else {
        result = ProbeResult::failure(
            fmt::format("{:.0f}% packet loss exceeds limit of {}%", stats.loss_pct, config.max_packet_loss),
            stats.avg_rtt_ms);
    }
    result.details = std::move(details);
    return result;
}
