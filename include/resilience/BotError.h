#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace dcabot {
namespace resilience {

enum class ErrorCategory {
    NETWORK,
    TIMEOUT,
    TEMPORARY,
    RATE_LIMIT,
    ORDER,
    POSITION,
    STRATEGY,
    CREDENTIALS,
    VALIDATION,
    FATAL
};

enum class RecoveryAction { RETRY, SKIP, STOP, WAIT };

const char* toString(ErrorCategory category);
const char* toString(RecoveryAction action);

bool isRetryableCategory(ErrorCategory category);

class BotError : public std::runtime_error {
public:
    BotError(ErrorCategory category, const std::string& message, int code = 0);
    BotError(ErrorCategory category, const std::string& message, bool retryable, int code);

    ErrorCategory category() const { return category_; }
    bool retryable() const { return retryable_; }
    int code() const { return code_; }
    const std::string& component() const { return component_; }
    const std::string& operation() const { return operation_; }

    // 자격 증명 오류는 재시도해도 나아지지 않으므로 치명으로 취급
    bool isFatal() const;
    RecoveryAction recoveryAction() const;

    BotError withContext(const std::string& component, const std::string& operation) const;

private:
    ErrorCategory category_;
    bool retryable_;
    int code_;
    std::string component_;
    std::string operation_;
};

// 정지 신호로 대기가 끊긴 경우. 오류 통계에는 넣지 않는다.
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& operation)
        : std::runtime_error("operation cancelled: " + operation) {}
};

// BotError 는 그대로, 나머지는 메시지 문자열로 분류
BotError categorizeError(const std::exception& error,
                         const std::string& component,
                         const std::string& operation);

} // namespace resilience
} // namespace dcabot
