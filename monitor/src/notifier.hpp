#pragma once

#include <string>

// Delivery channel for transition messages. send() reports success; callers
// log failures and move on.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual bool send(const std::string& message, const std::string& title) = 0;
};

// Used when no push credentials are configured
class LogOnlyNotifier : public Notifier {
public:
    bool send(const std::string& message, const std::string& title) override;
};
