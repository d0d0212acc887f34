#pragma once

#include <string>

#include "log.hpp"

// Address of the interface that routes outward, so served endpoints are
// reachable from the LAN. No packet is sent. Falls back to 127.0.0.1.
std::string detect_bind_address(Logger* logger = nullptr);
