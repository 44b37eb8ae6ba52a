#include "reporter.hpp"

#include <cstring>
#include <memory>

#include <fmt/core.h>
#include <json/json.h>
#include <spdlog/spdlog.h>

#include "errors.hpp"

std::string ReportFormatter::escape(const std::string &text)
{
    std::string out;
    out.reserve(text.size());

    for (char c : text)
    {
        if (c != '\0' && std::strchr(ESCAPE_CHARS, c) != nullptr)
        {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string ReportFormatter::format(const SyncOutcome &outcome)
{
    std::string m = "*Synchronisation complete*\n";

    if (!outcome.files().empty())
    {
        m += "\n*Files downloaded:*\n";
        for (const auto &f : outcome.files())
        {
            m += fmt::format("\\- {}\n", escape(f));
        }
    }

    if (!outcome.errors().empty())
    {
        m += "\n*Errors occurred:*\n";
        for (const auto &e : outcome.errors())
        {
            m += fmt::format("\\- {}\n", escape(e.message));
        }
    }

    return m;
}

bool flushReport(Reporter &reporter, const SyncOutcome &outcome)
{
    if (outcome.empty())
    {
        spdlog::debug("Nothing to report");
        return false;
    }

    reporter.send(ReportFormatter::format(outcome));
    spdlog::info("Report sent: {} file(s), {} error(s)", outcome.files().size(), outcome.errors().size());
    return true;
}

TelegramReporter::TelegramReporter(HttpTransport &transport, std::string token, std::int64_t chatId)
    : transport_(transport), token_(std::move(token)), chatId_(chatId)
{
}

std::string TelegramReporter::methodUrl(const char *method) const
{
    return fmt::format("{}/bot{}/{}", API_BASE, token_, method);
}

std::string TelegramReporter::redact(std::string text) const
{
    if (token_.empty())
    {
        return text;
    }
    for (size_t pos = text.find(token_); pos != std::string::npos; pos = text.find(token_, pos))
    {
        text.replace(pos, token_.size(), "<token>");
    }
    return text;
}

void TelegramReporter::verify()
{
    if (token_.empty())
    {
        throw ReportError("telegram token is not set");
    }

    std::string body;
    bool ok = fetchString(transport_, methodUrl("getMe"), body);
    checkResponse("getMe", ok, body);
}

void TelegramReporter::send(const std::string &text)
{
    Json::Value request;
    request["chat_id"] = Json::Int64(chatId_);
    request["text"] = text;
    request["parse_mode"] = "MarkdownV2";

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";

    std::string response;
    bool ok = transport_.postJson(methodUrl("sendMessage"), Json::writeString(writer, request), response);
    checkResponse("sendMessage", ok, response);
}

void TelegramReporter::checkResponse(const char *method, bool transportOk, const std::string &body) const
{
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    bool parsed = reader->parse(body.data(), body.data() + body.size(), &root, &errors) && root.isObject();

    // The API explains rejections in the body, prefer that over the bare status
    if (parsed && !(root["ok"].isBool() && root["ok"].asBool()))
    {
        throw ReportError(fmt::format("telegram {} failed: {}", method,
                                      root.get("description", "no description").asString()));
    }
    if (!transportOk)
    {
        throw ReportError(fmt::format("telegram {} failed: {}", method, redact(transport_.getLastError())));
    }
    if (!parsed)
    {
        throw ReportError(fmt::format("telegram {} returned an unreadable response: {}", method, errors));
    }
}
