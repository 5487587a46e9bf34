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
 * @file email_destination.hpp
 * @brief E-mail notification destination.
 */

#pragma once

#include "fanlog/infra/identity.hpp"
#include "fanlog/sinks/destination.hpp"

#include <functional>
#include <string>
#include <vector>

namespace fanlog::sinks {

/**
 * @struct MailSettings
 * @brief SMTP relay and addressing of notification mails.
 */
struct MailSettings {
    std::string smtp_server;
    int smtp_port = 25;
    std::string sender;
    std::vector<std::string> recipients;

    /**
     * @throws core::ConfigurationError if the server or sender is empty, the port
     * is outside [1,65535], or there is no non-empty recipient.
     */
    void validate() const;
};

/**
 * @struct MailMessage
 * @brief One notification, ready for the transport.
 */
struct MailMessage {
    std::string smtp_server;
    int smtp_port = 25;
    std::string from;
    std::vector<std::string> to;
    std::string subject;
    std::string body;
};

/// @brief Delivery primitive (an SMTP client). Returns false on failure.
using MailTransport = std::function<bool(const MailMessage&)>;

/**
 * @class EmailDestination
 * @brief Sends one mail per qualifying entry.
 *
 * Subject: `[<code>] <category> - <app> on <machine>`.
 * Body: the formatted body followed by an identity footer and the timestamp.
 */
class EmailDestination : public Destination {
  public:
    EmailDestination(std::string identifier, MailSettings settings, MailTransport transport,
                     core::Severity minimum_level = core::Severity::Critical,
                     infra::ProcessIdentity identity = infra::ProcessIdentity::current());

    const MailSettings& settings() const noexcept { return settings_; }

    MailMessage make_message(const core::LogEntry& entry) const;

    /// @brief `"<id>: <server>:<port>"`.
    std::string describe() const override;

  private:
    void do_write(const core::LogEntry& entry) override;

    MailSettings settings_;
    MailTransport transport_;
    const infra::ProcessIdentity identity_;
};

} // namespace fanlog::sinks
