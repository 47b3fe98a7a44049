//
// Plain text requester notifications through an SMTP relay
//

#ifndef SDS_ARCHIVE_SERVER_MAILNOTIFIER_H
#define SDS_ARCHIVE_SERVER_MAILNOTIFIER_H

#include "../Interfaces/INotifier.h"
#include <string>

struct sMailSettings {
    std::string smtpServer;
    std::string sender;
    std::string contactEmail;
};

struct sMailMessage {
    // RFC 5322 text with From, To and Subject headers and CRLF line endings. Throws eNotificationError if a
    // header value contains a line break.
    [[nodiscard]] auto render(const std::string& sender) const -> std::string;

    std::string to;
    std::string subject;
    std::string body;
};

class MailNotifier : public INotifier {
public:
    explicit MailNotifier(sMailSettings settings);

    void notifyCompleted(const std::string& email, const std::string& collection,
                         const std::string& downloadUrl) override;
    void notifyFailed(const std::string& email, const std::string& collection) override;
    void notifyCancelled(const std::string& email, const std::string& collection) override;

    [[nodiscard]] auto completedMessage(const std::string& email, const std::string& downloadUrl) const
            -> sMailMessage;
    [[nodiscard]] auto failedMessage(const std::string& email, const std::string& collection) const -> sMailMessage;
    [[nodiscard]] auto cancelledMessage(const std::string& email, const std::string& collection) const
            -> sMailMessage;

private:
    void send(const sMailMessage& message) const;

    sMailSettings settings;
};

#endif //SDS_ARCHIVE_SERVER_MAILNOTIFIER_H
