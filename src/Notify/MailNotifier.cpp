#include "MailNotifier.h"
#include <algorithm>
#include <cstring>
#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <utility>

namespace {
struct sUploadState {
    std::string payload;
    size_t offset = 0;
};

auto readPayload(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* state = static_cast<sUploadState*>(userdata);
    auto count = std::min(size * nitems, state->payload.size() - state->offset);
    std::memcpy(buffer, state->payload.data() + state->offset, count);
    state->offset += count;
    return count;
}

// Normalise bare \n to \r\n for the wire
auto toCrlf(const std::string& text) -> std::string {
    std::string result;
    result.reserve(text.size() + text.size() / 16);
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) {
            result += '\r';
        }
        result += text[i];
    }
    return result;
}
}

auto sMailMessage::render(const std::string& sender) const -> std::string {
    // A line break in a header value would start a new header
    for (const auto* header : {&sender, &to, &subject}) {
        if (header->find_first_of("\r\n") != std::string::npos) {
            throw eNotificationError("Mail header contains a line break: " + *header);
        }
    }

    return toCrlf("From: " + sender + "\nTo: " + to + "\nSubject: " + subject + "\n\n" + body);
}

MailNotifier::MailNotifier(sMailSettings settings) : settings(std::move(settings)) {
}

auto MailNotifier::completedMessage(const std::string& email, const std::string& downloadUrl) const -> sMailMessage {
    return {
            .to = email,
            .subject = "Your requested archive is ready to download",
            .body = "You can now download your archive via the link below; please note that the link is valid only "
                    "for 24 hours.\n" + downloadUrl + "\n\nPlease contact Research Data Services (RDS) at "
                    + settings.contactEmail + " if you need any assistance.\n"
    };
}

auto MailNotifier::failedMessage(const std::string& email, const std::string& collection) const -> sMailMessage {
    return {
            .to = email,
            .subject = "Failed on retrieving your requested archive",
            .body = "We encountered an issue when retrieving your requested archive:\n\n" + collection
                    + "\n\nPlease contact Research Data Services (RDS) at " + settings.contactEmail
                    + " for assistance.\n"
    };
}

auto MailNotifier::cancelledMessage(const std::string& email, const std::string& collection) const -> sMailMessage {
    return {
            .to = email,
            .subject = "Cancelled your request for archive",
            .body = "SDS is currently processing its maximum number of requests. The system has cancelled your "
                    "request.\n\nPlease resubmit your request for " + collection
                    + " at a later time.\n\nPlease contact Research Data Services (RDS) at " + settings.contactEmail
                    + " if you need any assistance.\n"
    };
}

void MailNotifier::notifyCompleted(const std::string& email, const std::string& /*collection*/,
                                   const std::string& downloadUrl) {
    send(completedMessage(email, downloadUrl));
}

void MailNotifier::notifyFailed(const std::string& email, const std::string& collection) {
    send(failedMessage(email, collection));
}

void MailNotifier::notifyCancelled(const std::string& email, const std::string& collection) {
    send(cancelledMessage(email, collection));
}

void MailNotifier::send(const sMailMessage& message) const {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw eNotificationError("curl_easy_init failed");
    }

    auto url = settings.smtpServer.find("://") == std::string::npos
            ? "smtp://" + settings.smtpServer
            : settings.smtpServer;

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> recipients(
            curl_slist_append(nullptr, ("<" + message.to + ">").c_str()),
            &curl_slist_free_all
    );

    auto from = "<" + settings.sender + ">";
    sUploadState upload{.payload = message.render(settings.sender)};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, from.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients.get());
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readPayload);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &upload);
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 120L);

    auto result = curl_easy_perform(curl.get());
    if (result != CURLE_OK) {
        throw eNotificationError(
                "Unable to send \"" + message.subject + "\" to " + message.to + " via " + url + ": "
                + curl_easy_strerror(result)
        );
    }

    std::cout << "MAIL: Sent \"" << message.subject << "\" to " << message.to << std::endl;
}
