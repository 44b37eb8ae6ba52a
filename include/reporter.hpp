#pragma once

#include <cstdint>
#include <string>

#include "http_client.hpp"
#include "sync_outcome.hpp"

/**
 * Delivers a run report to a human.
 */
class Reporter
{
public:
    virtual ~Reporter() = default;

    /**
     * Send one message.
     *
     * @param text Message in Telegram MarkdownV2 markup
     * @throws ReportError if delivery fails
     */
    virtual void send(const std::string &text) = 0;
};

/**
 * Telegram MarkdownV2 rendering of run reports.
 */
class ReportFormatter
{
public:
    // Characters MarkdownV2 requires to be escaped in plain text
    static constexpr const char *ESCAPE_CHARS = "\\!\"#$%&'()*+,./:;<=>?@[]^_`{|}~-";

    /**
     * Prefix every MarkdownV2 special character with a backslash.
     * Example: "a_b.mp4" -> "a\_b\.mp4"
     */
    static std::string escape(const std::string &text);

    /**
     * Render the downloaded files and errors as a bulleted message.
     * Sections without entries are left out.
     */
    static std::string format(const SyncOutcome &outcome);
};

/**
 * Send the outcome through reporter unless there is nothing to say.
 *
 * @return true if a message was sent
 * @throws ReportError if delivery fails
 */
bool flushReport(Reporter &reporter, const SyncOutcome &outcome);

/**
 * Reporter talking to the Telegram Bot API.
 */
class TelegramReporter : public Reporter
{
public:
    /**
     * @param transport Transport without remote store credentials
     * @param token Bot token
     * @param chatId Chat that receives the reports
     */
    TelegramReporter(HttpTransport &transport, std::string token, std::int64_t chatId);

    /**
     * Check the bot token with getMe.
     *
     * @throws ReportError if the token is rejected or the API is unreachable
     */
    void verify();

    void send(const std::string &text) override;

    static constexpr const char *API_BASE = "https://api.telegram.org";

private:
    HttpTransport &transport_;
    std::string token_;
    std::int64_t chatId_;

    std::string methodUrl(const char *method) const;

    // Hide the bot token in messages that quote request URLs
    std::string redact(std::string text) const;

    /**
     * Decode a Bot API response and throw unless it says "ok": true.
     */
    void checkResponse(const char *method, bool transportOk, const std::string &body) const;
};
