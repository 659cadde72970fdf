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

#ifndef CHIPIUM_SERVER_SERVER_MAIN_HPP
#define CHIPIUM_SERVER_SERVER_MAIN_HPP

#include "chipium/Machine.hpp"
#include "chipium/service/Server.hpp"
#include "chipium/server/ProgramPaths.hpp"
#include "chipium/server/ServerOptions.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace chipium::server {

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int /*signal*/) {
    g_running = false;
}

std::vector<uint8_t> load_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw std::runtime_error("Cannot read file: " + filepath.string());
    }

    return data;
}

} // anonymous namespace

inline void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <program> [options]\n"
              << "\n"
              << "Required:\n"
              << "  <program>            CHIP-8 program filepath (also searched in $"
              << ProgramPaths::ENV_PROGRAM_DIR << ")\n"
              << "\n"
              << "Optional:\n"
              << "  --port <port>        gRPC port (default: " << DEFAULT_GRPC_PORT << ")\n"
              << "  --address <host>     gRPC bind address (default: 0.0.0.0)\n"
              << "  --ips <n>            Instructions per second ("
              << Machine::MIN_INSTRUCTIONS_PER_SECOND << "-"
              << Machine::MAX_INSTRUCTIONS_PER_SECOND << ", default: 600)\n"
              << "  --seed <n>           Random number seed (default: nondeterministic)\n"
              << "  --paused             Start paused\n"
              << "  --trace              Print each instruction to stderr\n"
              << "  --info               Show machine information and exit\n"
              << "  --help               Show this help message\n";
}

inline void print_info(const char* program_name) {
    // JSON output for machine discovery
    std::cout << "{\n"
              << "  \"executable\": \"" << program_name << "\",\n"
              << "  \"machine_type\": \"chip8\",\n"
              << "  \"display_name\": \"CHIP-8\",\n"
              << "  \"version\": \"" << CHIPIUM_VERSION << "\",\n"
              << "  \"memory_size\": " << kMemorySize << ",\n"
              << "  \"program_start\": " << kProgramStart << ",\n"
              << "  \"display_width\": " << kDisplayWidth << ",\n"
              << "  \"display_height\": " << kDisplayHeight << ",\n"
              << "  \"timer_rate_hz\": " << kTimerRateHz << "\n"
              << "}\n";
}

inline int server_main(int argc, char* argv[]) {
    ServerOptions options;
    try {
        options = parse_server_options(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (options.show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (options.show_info) {
        print_info(argv[0]);
        return 0;
    }

    // Set up signal handler
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        auto program_path = ProgramPaths::find_program(options.program_filepath);
        std::cout << "Loading program: " << program_path << "\n";
        auto program = load_file(program_path);
        if (program.size() > kMaxProgramSize) {
            throw std::runtime_error("Program is " + std::to_string(program.size()) +
                                     " bytes, at most " + std::to_string(kMaxProgramSize) +
                                     " fit in memory");
        }

        MachineConfig config;
        config.instructions_per_second = options.instructions_per_second;
        config.seed = options.seed ? *options.seed : std::random_device{}();
        config.trace = options.trace ? &std::cerr : nullptr;

        std::cout << "Initializing CHIP-8 at " << config.instructions_per_second
                  << " instructions per second...\n";
        Machine machine(std::move(program), config);

        if (options.start_paused) {
            machine.pause("started paused");
        }

        // Start gRPC server
        std::cout << "Starting gRPC server on port " << options.port << "...\n";
        chipium::service::Server server(machine, options.address, options.port);
        server.start();

        std::cout << "CHIP-8 running. Press Ctrl+C to stop.\n";

        // Main emulation loop: one frame per 60Hz timer tick
        const auto frame_period = std::chrono::microseconds(1'000'000 / Machine::FRAME_RATE_HZ);
        auto next_frame = std::chrono::steady_clock::now();

        while (g_running) {
            // Block (briefly, so signals are noticed) while paused
            if (!machine.wait_if_paused(std::chrono::milliseconds(100))) {
                next_frame = std::chrono::steady_clock::now();
                continue;
            }

            try {
                machine.run_frame();
            } catch (const std::exception& e) {
                // The machine has paused itself; a client can Reset it
                std::cerr << "Machine halted: " << e.what() << " (reset to continue)\n";
            }

            next_frame += frame_period;
            auto now = std::chrono::steady_clock::now();
            if (now > next_frame + 5 * frame_period) {
                // Fell too far behind; don't try to catch up
                next_frame = now;
            }
            std::this_thread::sleep_until(next_frame);
        }

        std::cout << "\nShutting down...\n";
        server.stop();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

} // namespace chipium::server

#endif // CHIPIUM_SERVER_SERVER_MAIN_HPP
