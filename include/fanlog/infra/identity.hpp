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
 * @file identity.hpp
 * @brief Read-once process identity attached to identity-aware destinations.
 */

#pragma once

#include <string>

namespace fanlog::infra {

/**
 * @struct ProcessIdentity
 * @brief Application, host and user names of the running process.
 *
 * The database, e-mail and event log destinations stamp every entry they deliver
 * with these values. Each field falls back to `"unknown"` when the platform
 * cannot provide it.
 */
struct ProcessIdentity {
    std::string app_name;
    std::string machine_name;
    std::string user_name;

    /**
     * @brief Returns the identity of the current process.
     *
     * Resolved once on first call (thread-safe static initialization); later
     * calls return the cached value.
     *
     * - `app_name`: basename of `/proc/self/exe` without extension, else
     *   `program_invocation_short_name`.
     * - `machine_name`: `gethostname(2)`.
     * - `user_name`: `getpwuid(geteuid())`, else `$USER`.
     */
    static const ProcessIdentity& current();
};

} // namespace fanlog::infra
