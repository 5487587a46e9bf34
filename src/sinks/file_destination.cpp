/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file file_destination.cpp
 * @brief Implementation of the file destination and its archive rotation.
 *
 * @details
 * All filesystem calls in the maintenance path use the `std::error_code`
 * overloads: a rotation problem must never prevent the append that follows it.
 */

#include "fanlog/sinks/file_destination.hpp"

#include "fanlog/core/error.hpp"
#include "fanlog/core/time_format.hpp"
#include "fanlog/infra/logger.hpp"
#include "fanlog/infra/string.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace fanlog::sinks {

namespace {

/// @brief Number of `\n` terminated lines in @p path (0 if unreadable).
std::size_t count_lines(const fs::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return 0;
    }
    return static_cast<std::size_t>(std::count(std::istreambuf_iterator<char>(file),
                                               std::istreambuf_iterator<char>(), '\n'));
}

} // namespace

FileDestination::FileDestination(std::string identifier, std::optional<std::string> directory,
                                 std::optional<std::string> file_name,
                                 core::Severity minimum_level)
    : Destination(std::move(identifier), minimum_level), file_name_(std::move(file_name))
{
    if (directory && directory->empty()) {
        throw core::ConfigurationError("File destination directory cannot be empty");
    }
    if (file_name_ && file_name_->empty()) {
        throw core::ConfigurationError("File destination file name cannot be empty");
    }

    std::error_code ec;
    if (directory) {
        directory_ = fs::path(*directory);
    } else {
        directory_ = fs::current_path(ec);
        if (ec) {
            throw core::ConfigurationError("Cannot resolve working directory: " + ec.message());
        }
    }

    if (!fs::exists(directory_, ec)) {
        fs::create_directories(directory_, ec);
        if (ec) {
            throw core::ConfigurationError("Cannot create log directory '" + directory_.string() +
                                           "': " + ec.message());
        }
    }
}

fs::path FileDestination::current_path() const
{
    std::string name;
    if (file_name_) {
        name = *file_name_;
    } else {
        name = core::render_timestamp("yyyy-MM-dd", std::chrono::system_clock::now());
    }

    if (!fs::path(name).has_extension()) {
        name += ".log";
    }
    return directory_ / name;
}

std::string FileDestination::describe() const
{
    return identifier() + ": " + current_path().string();
}

/**
 * @brief Maintenance, then append, under the per-destination write lock.
 */
void FileDestination::do_write(const core::LogEntry& entry)
{
    const fs::path target = current_path();

    if (max_lines_ > 0 || max_bytes_ > 0) {
        maintain(target);
    }

    std::ofstream file(target, std::ios::app);
    if (!file.is_open()) {
        throw core::WriteFailure("Cannot open '" + target.string() + "' for append");
    }

    file << entry.full_line << '\n';
    file.flush();

    if (!file.good()) {
        throw core::WriteFailure("Append to '" + target.string() + "' failed");
    }
}

/**
 * @brief Line limit first; the byte limit is only consulted when the line limit
 * did not trigger, so one write archives at most once.
 */
void FileDestination::maintain(const fs::path& target) noexcept
{
    try {
        std::error_code ec;
        if (!fs::is_regular_file(target, ec)) {
            return;
        }

        const std::size_t max_lines = max_lines_;
        const std::uintmax_t max_bytes = max_bytes_;

        if (max_lines > 0 && count_lines(target) > max_lines - 1) {
            archive(target);
            return;
        }

        if (max_bytes > 0) {
            const std::uintmax_t size = fs::file_size(target, ec);
            if (!ec && size > max_bytes) {
                archive(target);
            }
        }
    } catch (const std::exception& e) {
        try {
            infra::Logger::log(core::Severity::Warn,
                               identifier() + ": maintenance skipped: " + std::string(e.what()));
        } catch (const std::exception&) {
            // Reporting failed as well; the write still goes ahead.
        }
    }
}

/**
 * @brief Renames the live file to `<base>_<seq>.<ext>`.
 *
 * `seq` counts every regular file named `<base>*<ext>`, the live file included,
 * so the first archive of `app.log` is `app_001.log`.
 */
void FileDestination::archive(const fs::path& target) noexcept
{
    try {
        const std::string base = target.stem().string();
        const std::string ext = target.extension().string();

        std::error_code ec;
        std::size_t seq = 0;
        for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) {
                continue;
            }
            const std::string name = it->path().filename().string();
            if (infra::String::starts_with(name, base) && infra::String::ends_with(name, ext)) {
                ++seq;
            }
        }
        if (ec) {
            infra::Logger::log(core::Severity::Warn,
                               identifier() + ": cannot scan '" + directory_.string() +
                                   "': " + ec.message());
            return;
        }

        std::ostringstream name;
        name << base << "_" << std::setw(3) << std::setfill('0') << seq << ext;
        const fs::path destination = directory_ / name.str();

        if (fs::exists(destination, ec)) {
            fs::remove(destination, ec);
            if (ec) {
                infra::Logger::log(core::Severity::Warn, identifier() + ": cannot replace '" +
                                                             destination.string() +
                                                             "': " + ec.message());
                return;
            }
        }

        fs::rename(target, destination, ec);
        if (ec) {
            infra::Logger::log(core::Severity::Warn, identifier() + ": archive of '" +
                                                         target.string() +
                                                         "' failed: " + ec.message());
        }
    } catch (const std::exception& e) {
        // Allocation failures; the live file is still untouched at this point.
        try {
            infra::Logger::log(core::Severity::Warn,
                               identifier() + ": archive aborted: " + std::string(e.what()));
        } catch (const std::exception&) {
        }
    }
}

} // namespace fanlog::sinks
