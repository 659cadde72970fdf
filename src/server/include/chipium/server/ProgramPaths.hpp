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

#ifndef CHIPIUM_SERVER_PROGRAM_PATHS_HPP
#define CHIPIUM_SERVER_PROGRAM_PATHS_HPP

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chipium::server {

// Program file discovery.
//
// 1. Absolute path -> return as-is (after checking existence)
// 2. Path that exists relative to the working directory -> resolve against cwd
// 3. Bare filename -> look in CHIPIUM_PROGRAM_DIR, if set
class ProgramPaths {
public:
    static constexpr const char* ENV_PROGRAM_DIR = "CHIPIUM_PROGRAM_DIR";

    static std::filesystem::path find_program(std::string_view filename) {
        std::filesystem::path filepath(filename);

        // Absolute path - return as-is
        if (filepath.is_absolute()) {
            if (!std::filesystem::exists(filepath)) {
                throw std::runtime_error("Program file not found: " + std::string(filename));
            }
            return filepath;
        }

        // Relative to the working directory
        auto resolved = std::filesystem::current_path() / filepath;
        if (std::filesystem::exists(resolved)) {
            return resolved;
        }

        // Simple filename - look in the program directory
        if (!filepath.has_parent_path()) {
            if (const char* env_dir = std::getenv(ENV_PROGRAM_DIR)) {
                auto program_filepath = std::filesystem::path(env_dir) / filepath;
                if (std::filesystem::exists(program_filepath)) {
                    return program_filepath;
                }
                throw std::runtime_error(
                    "Program file not found: " + std::string(filename) +
                    " (searched in " + resolved.parent_path().string() +
                    " and " + env_dir + ")");
            }
        }

        throw std::runtime_error("Program file not found: " + resolved.string());
    }
};

} // namespace chipium::server

#endif // CHIPIUM_SERVER_PROGRAM_PATHS_HPP
