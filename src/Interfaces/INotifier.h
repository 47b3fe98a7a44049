//
// Interface for the requester notifications sent by the worker
//

#ifndef SDS_ARCHIVE_SERVER_I_NOTIFIER_H
#define SDS_ARCHIVE_SERVER_I_NOTIFIER_H

#include <stdexcept>
#include <string>

class eNotificationError : public std::runtime_error {
public:
    explicit eNotificationError(const std::string& what) : std::runtime_error(what) {}
};

class INotifier {
public:
    virtual ~INotifier() = default;

    // All three throw eNotificationError if the message could not be handed to the relay
    virtual void notifyCompleted(const std::string& email, const std::string& collection,
                                 const std::string& downloadUrl) = 0;
    virtual void notifyFailed(const std::string& email, const std::string& collection) = 0;
    virtual void notifyCancelled(const std::string& email, const std::string& collection) = 0;
};

#endif //SDS_ARCHIVE_SERVER_I_NOTIFIER_H
