#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace adaptiverisk {

std::string Config::normalizeWindowLabel(std::string label) {
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return label;
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::string& path) {
    std::filesystem::path config_path(path);
    if (!config_path.is_absolute() && !std::filesystem::exists(config_path)) {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    LOG_INFO("Config path: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} (using defaults)", config_path.string());
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_WARN("Config file could not be opened: {}", config_path.string());
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        applyJson(j);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config parse error: {}", e.what());
        return false;
    }

    LOG_INFO("Config loaded: capital={:.2f}, slippage={:.3f}%, commission={:.2f}",
             simulation_.initial_capital, simulation_.slippage_pct, simulation_.commission);
    return true;
}

void Config::applyJson(const nlohmann::json& j) {
    if (j.contains("simulation")) {
        const auto& s = j["simulation"];
        simulation_.initial_capital = s.value("initial_capital", simulation_.initial_capital);
        simulation_.slippage_pct = s.value("slippage_pct", simulation_.slippage_pct);
        simulation_.commission = s.value("commission", simulation_.commission);
        simulation_.lookback_bars = s.value("lookback_bars", simulation_.lookback_bars);
    }

    if (j.contains("risk")) {
        const auto& r = j["risk"];
        risk_defaults_.auto_trade_confidence_threshold =
            r.value("auto_trade_confidence_threshold", risk_defaults_.auto_trade_confidence_threshold);
        risk_defaults_.max_position_size_pct =
            r.value("max_position_size_pct", risk_defaults_.max_position_size_pct);
        risk_defaults_.max_portfolio_exposure_pct =
            r.value("max_portfolio_exposure_pct", risk_defaults_.max_portfolio_exposure_pct);
        risk_defaults_.daily_loss_limit_pct =
            r.value("daily_loss_limit_pct", risk_defaults_.daily_loss_limit_pct);
        risk_defaults_.min_risk_reward_ratio =
            r.value("min_risk_reward_ratio", risk_defaults_.min_risk_reward_ratio);
        risk_defaults_.learning_aggression =
            r.value("learning_aggression", risk_defaults_.learning_aggression);
    }

    if (j.contains("calibration")) {
        const auto& c = j["calibration"];
        calibration_.min_samples = c.value("min_samples", calibration_.min_samples);
        calibration_.apply_window = normalizeWindowLabel(c.value("apply_window", calibration_.apply_window));
        if (c.contains("windows") && c["windows"].is_object()) {
            calibration_.windows.clear();
            for (const auto& [label, days] : c["windows"].items()) {
                if (!days.is_number_integer() || days.get<int>() <= 0) {
                    LOG_WARN("Ignoring calibration window {}: days must be a positive integer", label);
                    continue;
                }
                calibration_.windows.push_back({normalizeWindowLabel(label), days.get<int>()});
            }
            std::sort(calibration_.windows.begin(), calibration_.windows.end(),
                      [](const engine::CalibrationWindow& a, const engine::CalibrationWindow& b) {
                          return a.days < b.days;
                      });
        }
    }

    if (j.contains("storage")) {
        storage_.parameter_file = j["storage"].value("parameter_file", storage_.parameter_file);
    }

    if (j.contains("logging")) {
        logging_.level = j["logging"].value("level", logging_.level);
        logging_.directory = j["logging"].value("directory", logging_.directory);
    }
}

} // namespace adaptiverisk
