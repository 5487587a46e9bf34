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
 * @file file_destination.hpp
 * @brief Append-only text file destination with size/line based archiving.
 *
 * @details
 * Each entry's full line is appended to `<directory>/<name>.log`. When a
 * rotation policy is configured, the live file is archived (renamed to
 * `<base>_<seq>.<ext>`) before the write that would take it past the limit.
 */

#pragma once

#include "fanlog/sinks/destination.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fanlog::sinks {

/**
 * @class FileDestination
 * @brief Writes full lines to a log file in a directory.
 *
 * **Rotation policy** (checked before every write when either limit is set):
 * 1. `max_lines > 0`: the file is archived once it already holds
 *    `max_lines` lines or more, so the archived file holds at most `max_lines`.
 * 2. `max_bytes > 0`, when step 1 did not archive: the file is archived once it
 *    is larger than `max_bytes`.
 *
 * Archive names are `<base>_<seq>.<ext>` where `seq` is the number of files in
 * the directory matching `<base>*<ext>`, zero-padded to 3 digits. A failed
 * rotation leaves the live file untouched; the entry is appended regardless.
 */
class FileDestination : public Destination {
  public:
    /**
     * @param identifier Registry key.
     * @param directory Target directory; the process working directory when
     * absent. Created if it does not exist.
     * @param file_name File name; today's date (`yyyy-MM-dd`) when absent,
     * re-evaluated at every write. `.log` is appended if the name has no extension.
     * @param minimum_level Lowest severity written.
     * @throws core::ConfigurationError on an empty identifier, an empty directory
     * string, an empty file name, or a directory that cannot be created.
     */
    explicit FileDestination(std::string identifier,
                             std::optional<std::string> directory = std::nullopt,
                             std::optional<std::string> file_name = std::nullopt,
                             core::Severity minimum_level = core::Severity::Info);

    /// @brief Line limit of the live file; 0 disables the policy.
    void set_max_lines(std::size_t max_lines) noexcept { max_lines_ = max_lines; }
    std::size_t max_lines() const noexcept { return max_lines_; }

    /// @brief Byte limit of the live file; 0 disables the policy.
    void set_max_bytes(std::uintmax_t max_bytes) noexcept { max_bytes_ = max_bytes; }
    std::uintmax_t max_bytes() const noexcept { return max_bytes_; }

    const std::filesystem::path& directory() const noexcept { return directory_; }

    /// @brief Path the next entry will be appended to.
    std::filesystem::path current_path() const;

    std::string describe() const override;

  private:
    void do_write(const core::LogEntry& entry) override;

    /// @brief Applies the rotation policy to @p target. Never throws.
    void maintain(const std::filesystem::path& target) noexcept;

    /// @brief Renames @p target to its next archive name; a failure leaves it in place.
    void archive(const std::filesystem::path& target) noexcept;

    std::filesystem::path directory_;
    std::optional<std::string> file_name_;
    std::atomic<std::size_t> max_lines_{0};
    std::atomic<std::uintmax_t> max_bytes_{0};
};

} // namespace fanlog::sinks
