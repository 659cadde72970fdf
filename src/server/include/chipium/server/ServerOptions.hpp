// Copyright © 2026 The Chipium Authors
//
// This file is part of Chipium.
//
// Chipium is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Chipium is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Chipium.
// If not, see <https://www.gnu.org/licenses/>.

#ifndef CHIPIUM_SERVER_SERVER_OPTIONS_HPP
#define CHIPIUM_SERVER_SERVER_OPTIONS_HPP

#include "chipium/Machine.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace chipium::server {

constexpr uint16_t DEFAULT_GRPC_PORT = 0xC8C8;  // 51400

struct ServerOptions {
    std::string program_filepath;
    std::string address = "0.0.0.0";
    uint16_t port = DEFAULT_GRPC_PORT;
    uint32_t instructions_per_second = 600;
    std::optional<uint32_t> seed;
    bool start_paused = false;
    bool trace = false;
    bool show_help = false;
    bool show_info = false;
};

namespace detail {

inline unsigned long parse_number(const std::string& option, const std::string& text,
                                  unsigned long max_value) {
    size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &consumed, 0);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + text);
    }
    if (consumed != text.size() || text[0] == '-' || value > max_value) {
        throw std::invalid_argument("Invalid value for " + option + ": " + text);
    }
    return value;
}

} // namespace detail

// Parse command-line arguments. Throws std::invalid_argument on bad input.
// --help and --info short-circuit the program argument check.
inline ServerOptions parse_server_options(int argc, const char* const argv[]) {
    ServerOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--info") {
            options.show_info = true;
        } else if (arg == "--port" && has_value) {
            options.port = static_cast<uint16_t>(
                detail::parse_number(arg, argv[++i], 0xFFFF));
        } else if (arg == "--address" && has_value) {
            options.address = argv[++i];
        } else if (arg == "--ips" && has_value) {
            auto ips = detail::parse_number(arg, argv[++i], Machine::MAX_INSTRUCTIONS_PER_SECOND);
            if (ips < Machine::MIN_INSTRUCTIONS_PER_SECOND) {
                throw std::invalid_argument("Invalid value for --ips: " + std::to_string(ips));
            }
            options.instructions_per_second = static_cast<uint32_t>(ips);
        } else if (arg == "--seed" && has_value) {
            options.seed = static_cast<uint32_t>(
                detail::parse_number(arg, argv[++i], 0xFFFFFFFFul));
        } else if (arg == "--paused") {
            options.start_paused = true;
        } else if (arg == "--trace") {
            options.trace = true;
        } else if (!arg.empty() && arg[0] != '-' && options.program_filepath.empty()) {
            options.program_filepath = arg;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (options.program_filepath.empty() && !options.show_help && !options.show_info) {
        throw std::invalid_argument("A program file is required");
    }

    return options;
}

} // namespace chipium::server

#endif // CHIPIUM_SERVER_SERVER_OPTIONS_HPP
