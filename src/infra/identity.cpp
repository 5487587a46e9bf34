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
 * @file identity.cpp
 * @brief POSIX lookups for the process identity.
 */

#include "fanlog/infra/identity.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace fanlog::infra {

namespace {

const char* const kUnknown = "unknown";

std::string resolve_app_name()
{
    std::error_code ec;
    const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty()) {
        return exe.stem().string();
    }

    if (program_invocation_short_name && *program_invocation_short_name) {
        return fs::path(program_invocation_short_name).stem().string();
    }
    return kUnknown;
}

std::string resolve_machine_name()
{
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) == 0 && buffer[0] != '\0') {
        return buffer;
    }
    return kUnknown;
}

std::string resolve_user_name()
{
    if (const passwd* pw = getpwuid(geteuid()); pw && pw->pw_name) {
        return pw->pw_name;
    }
    if (const char* env = std::getenv("USER"); env && *env) {
        return env;
    }
    return kUnknown;
}

} // namespace

const ProcessIdentity& ProcessIdentity::current()
{
    static const ProcessIdentity identity{resolve_app_name(), resolve_machine_name(),
                                          resolve_user_name()};
    return identity;
}

} // namespace fanlog::infra
