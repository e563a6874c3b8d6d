#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace dcabot {

class Config {
public:
    static Config& getInstance();

    // 파일이 없으면 경고 후 기본값 유지, JSON 문법 오류는 예외
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // 범위를 벗어난 값이면 BotError(VALIDATION)
    void validate() const;

    std::string getApiKey() const { return api_key_; }
    std::string getApiSecret() const { return api_secret_; }
    bool hasCredentials() const { return !api_key_.empty() && !api_secret_.empty(); }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    std::string getLogLevel() const { return engine_config_.logging.level; }
    std::string getLogDir() const { return engine_config_.logging.dir; }

    void resetToDefaults();

private:
    Config() = default;

    std::string api_key_;
    std::string api_secret_;
    engine::EngineConfig engine_config_;
};

} // namespace dcabot
