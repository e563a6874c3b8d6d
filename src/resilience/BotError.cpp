#include "resilience/BotError.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace dcabot {
namespace resilience {

namespace {
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool containsAny(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}
}

const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NETWORK: return "NETWORK";
        case ErrorCategory::TIMEOUT: return "TIMEOUT";
        case ErrorCategory::TEMPORARY: return "TEMPORARY";
        case ErrorCategory::RATE_LIMIT: return "RATE_LIMIT";
        case ErrorCategory::ORDER: return "ORDER";
        case ErrorCategory::POSITION: return "POSITION";
        case ErrorCategory::STRATEGY: return "STRATEGY";
        case ErrorCategory::CREDENTIALS: return "CREDENTIALS";
        case ErrorCategory::VALIDATION: return "VALIDATION";
        case ErrorCategory::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

const char* toString(RecoveryAction action) {
    switch (action) {
        case RecoveryAction::RETRY: return "RETRY";
        case RecoveryAction::SKIP: return "SKIP";
        case RecoveryAction::STOP: return "STOP";
        case RecoveryAction::WAIT: return "WAIT";
    }
    return "UNKNOWN";
}

bool isRetryableCategory(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::FATAL:
        case ErrorCategory::CREDENTIALS:
        case ErrorCategory::VALIDATION:
            return false;
        default:
            return true;
    }
}

BotError::BotError(ErrorCategory category, const std::string& message, int code)
    : BotError(category, message, isRetryableCategory(category), code) {}

BotError::BotError(ErrorCategory category, const std::string& message, bool retryable, int code)
    : std::runtime_error(message)
    , category_(category)
    , retryable_(retryable)
    , code_(code) {}

bool BotError::isFatal() const {
    return category_ == ErrorCategory::FATAL || category_ == ErrorCategory::CREDENTIALS;
}

RecoveryAction BotError::recoveryAction() const {
    switch (category_) {
        case ErrorCategory::FATAL:
        case ErrorCategory::CREDENTIALS:
            return RecoveryAction::STOP;
        case ErrorCategory::RATE_LIMIT:
            return RecoveryAction::WAIT;
        case ErrorCategory::VALIDATION:
            return RecoveryAction::SKIP;
        case ErrorCategory::ORDER:
        case ErrorCategory::POSITION:
            return retryable_ ? RecoveryAction::RETRY : RecoveryAction::SKIP;
        default:
            return RecoveryAction::RETRY;
    }
}

BotError BotError::withContext(const std::string& component, const std::string& operation) const {
    BotError copy(*this);
    copy.component_ = component;
    copy.operation_ = operation;
    return copy;
}

BotError categorizeError(const std::exception& error,
                         const std::string& component,
                         const std::string& operation) {
    if (const auto* bot_error = dynamic_cast<const BotError*>(&error)) {
        if (bot_error->component().empty()) {
            return bot_error->withContext(component, operation);
        }
        return *bot_error;
    }

    const std::string message = error.what();
    const std::string msg = toLower(message);
    ErrorCategory category = ErrorCategory::TEMPORARY;
    bool retryable = true;

    if (containsAny(msg, {"timeout", "timed out", "deadline"})) {
        category = ErrorCategory::TIMEOUT;
    } else if (containsAny(msg, {"connection", "network", "dns", "dial"})) {
        category = ErrorCategory::NETWORK;
    } else if (containsAny(msg, {"api key", "api secret", "authentication", "unauthorized"})) {
        category = ErrorCategory::CREDENTIALS;
        retryable = false;
    } else if (containsAny(msg, {"rate limit", "too many requests"})) {
        category = ErrorCategory::RATE_LIMIT;
    } else if (containsAny(msg, {"insufficient", "balance"})) {
        category = ErrorCategory::ORDER;
        retryable = false;
    } else if (containsAny(msg, {"invalid", "constraint", "minimum", "maximum"})) {
        category = ErrorCategory::VALIDATION;
        retryable = false;
    }

    return BotError(category, message, retryable, 0).withContext(component, operation);
}

} // namespace resilience
} // namespace dcabot
