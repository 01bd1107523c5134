#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/PipelineConfig.h"

namespace pricelens {

class Config {
public:
    static Config& getInstance();

    // 파일이 없거나 파싱에 실패하면 기본값 유지 (false 반환)
    bool load(const std::string& config_path);
    void applyJson(const nlohmann::json& j);

    engine::PipelineConfig getPipelineConfig() const { return pipeline_config_; }
    void setPipelineConfig(const engine::PipelineConfig& cfg) { pipeline_config_ = cfg; }

    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }
    double getInitialEquity() const { return initial_equity_; }
    std::vector<std::string> getSymbols() const { return symbols_; }

    // 테스트용: 기본값으로 되돌림
    void reset();

private:
    Config() = default;

    engine::PipelineConfig pipeline_config_;
    std::string log_dir_ = "logs";
    std::string log_level_ = "info";
    double initial_equity_ = 100000.0;
    std::vector<std::string> symbols_;
};

} // namespace pricelens
