#include "monitor_store.hpp"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

std::vector<Monitor> read_monitors_file(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Cannot open monitors file: " + path);
    }

    auto document = nlohmann::json::parse(input);
    if (!document.is_array()) {
        throw std::runtime_error("Monitors file must contain a JSON array: " + path);
    }

    std::vector<Monitor> monitors;
    for (std::size_t i = 0; i < document.size(); ++i) {
        try {
            monitors.push_back(Monitor::from_json(document[i]));
        } catch (const std::exception& e) {
            spdlog::error("Skipping monitor #{} in {}: {}", i, path, e.what());
        }
    }
    return monitors;
}
