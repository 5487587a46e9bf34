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
 * @file email_destination.cpp
 * @brief Notification mail composition and validation.
 */

#include "fanlog/sinks/email_destination.hpp"

#include "fanlog/core/error.hpp"
#include "fanlog/core/time_format.hpp"
#include "fanlog/infra/string.hpp"

#include <algorithm>

namespace fanlog::sinks {

void MailSettings::validate() const
{
    if (infra::String::trim(smtp_server).empty()) {
        throw core::ConfigurationError("SMTP server cannot be empty");
    }
    if (smtp_port < 1 || smtp_port > 65535) {
        throw core::ConfigurationError("SMTP port " + std::to_string(smtp_port) +
                                       " is out of range (1-65535)");
    }
    if (infra::String::trim(sender).empty()) {
        throw core::ConfigurationError("Mail sender cannot be empty");
    }

    const bool has_recipient =
        std::any_of(recipients.begin(), recipients.end(),
                    [](const std::string& r) { return !infra::String::trim(r).empty(); });
    if (!has_recipient) {
        throw core::ConfigurationError("At least one mail recipient is required");
    }
}

EmailDestination::EmailDestination(std::string identifier, MailSettings settings,
                                   MailTransport transport, core::Severity minimum_level,
                                   infra::ProcessIdentity identity)
    : Destination(std::move(identifier), minimum_level), settings_(std::move(settings)),
      transport_(std::move(transport)), identity_(std::move(identity))
{
    settings_.validate();

    if (!transport_) {
        throw core::ConfigurationError("Email destination requires a mail transport");
    }
}

MailMessage EmailDestination::make_message(const core::LogEntry& entry) const
{
    MailMessage mail;
    mail.smtp_server = settings_.smtp_server;
    mail.smtp_port = settings_.smtp_port;
    mail.from = settings_.sender;

    for (const auto& recipient : settings_.recipients) {
        std::string r = infra::String::trim(recipient);
        if (!r.empty()) {
            mail.to.push_back(std::move(r));
        }
    }

    mail.subject = std::string("[") + core::short_code(entry.level) + "] " +
                   core::to_string(core::category(entry.level)) + " - " + identity_.app_name +
                   " on " + identity_.machine_name;

    mail.body = entry.formatted_body;
    if (!mail.body.empty() && mail.body.back() != '\n') {
        mail.body += '\n';
    }
    mail.body += "\n--\n";
    mail.body += "App: " + identity_.app_name + "\n";
    mail.body += "Machine: " + identity_.machine_name + "\n";
    mail.body += "User: " + identity_.user_name + "\n";
    mail.body += "Time: " + core::render_timestamp(core::kDefaultTimeFormat, entry.timestamp) + "\n";
    return mail;
}

std::string EmailDestination::describe() const
{
    return identifier() + ": " + settings_.smtp_server + ":" + std::to_string(settings_.smtp_port);
}

void EmailDestination::do_write(const core::LogEntry& entry)
{
    if (!transport_(make_message(entry))) {
        throw core::WriteFailure("Mail transport to '" + settings_.smtp_server + "' failed");
    }
}

} // namespace fanlog::sinks
