#pragma once
#include "types.hpp"
#include <string>
#include <vector>

// Returns one message per problem; an empty result means the monitor can be scheduled
std::vector<std::string> validate_monitor(const Monitor& monitor);

// Host names handed to external tools are limited to [A-Za-z0-9.-:]
bool is_safe_hostname(const std::string& hostname);
