#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <span>
#include <string>

// One control command, built from the ctl arguments that follow the program name.
struct Request {
    std::string command;
    nlohmann::json body;
    int timeout_ms = 30000;
    bool raw = false;
};

// Fails with a message suitable for stderr on unknown commands, missing
// arguments and out-of-range options.
std::expected<Request, std::string> build_request(std::span<const std::string> args);
