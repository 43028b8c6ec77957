#pragma once

#include "notifier.hpp"
#include <optional>
#include <string>

struct PushoverCredentials {
    std::string app_key;
    std::string user_key;
};

class PushoverNotifier : public Notifier {
public:
    PushoverNotifier(PushoverCredentials credentials, int timeout_seconds);

    bool send(const std::string& message, const std::string& title) override;

    // key=value lines; [section] headers and #/; comments are skipped.
    // Returns nullopt unless both keys are present.
    static std::optional<PushoverCredentials> parse_credentials(const std::string& text);
    static std::optional<PushoverCredentials> load_credentials(const std::string& path);

private:
    PushoverCredentials credentials_;
    int timeout_seconds_;
};
