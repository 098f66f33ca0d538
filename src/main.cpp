#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "common/TimeUtils.h"
#include "backtest/BacktestEngine.h"
#include "backtest/FileMarketDataProvider.h"
#include "core/model/ReportSchema.h"
#include "core/state/ParameterRepositoryJson.h"
#include "engine/CalibrationAnalyzer.h"
#include "engine/LotMatcher.h"
#include "engine/RiskParameterStore.h"
#include "strategy/RangeReversalStrategy.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace adaptiverisk;

namespace {

void printUsage() {
    std::cout
        << "Usage:\n"
        << "  adaptiverisk --backtest <data_dir> --symbols A,B [--start YYYY-MM-DD] [--end YYYY-MM-DD]\n"
        << "               [--initial-capital N] [--json] [--output file]\n"
        << "  adaptiverisk --calibrate <trades.json> [--now <ms>] [--apply [short|medium|long]] [--json]\n"
        << "  adaptiverisk --params [--json]\n"
        << "Common: [--config path]\n";
}

std::vector<std::string> splitCsv(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        const size_t comma = csv.find(',', start);
        std::string token = (comma == std::string::npos)
            ? csv.substr(start)
            : csv.substr(start, comma - start);
        const auto first = token.find_first_not_of(" \t");
        if (first != std::string::npos) {
            const auto last = token.find_last_not_of(" \t");
            out.push_back(token.substr(first, last - first + 1));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

struct CliOptions {
    std::string mode;
    std::string target;
    std::string config_path = "config/config.json";
    std::vector<std::string> symbols;
    std::string start_date;
    std::string end_date;
    std::string output_path;
    std::string apply_window;
    bool apply = false;
    bool json_mode = false;
    double initial_capital = -1.0;
    TimestampMs now_ms = 0;
};

// Returns false on a malformed command line.
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    if (argc < 2) {
        return false;
    }
    opts.mode = argv[1];
    int i = 2;
    if (opts.mode == "--backtest" || opts.mode == "--calibrate") {
        if (argc < 3) {
            return false;
        }
        opts.target = argv[2];
        i = 3;
    } else if (opts.mode != "--params") {
        return false;
    }

    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = (i + 1 < argc);
        if (arg == "--json") {
            opts.json_mode = true;
        } else if (arg == "--config" && has_value) {
            opts.config_path = argv[++i];
        } else if (arg == "--symbols" && has_value) {
            opts.symbols = splitCsv(argv[++i]);
        } else if (arg == "--start" && has_value) {
            opts.start_date = argv[++i];
        } else if (arg == "--end" && has_value) {
            opts.end_date = argv[++i];
        } else if (arg == "--output" && has_value) {
            opts.output_path = argv[++i];
        } else if (arg == "--initial-capital" && has_value) {
            try {
                opts.initial_capital = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --initial-capital value. Ignored.\n";
            }
        } else if (arg == "--now" && has_value) {
            try {
                opts.now_ms = utils::toMsTimestamp(std::stoll(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid --now value. Using current time.\n";
            }
        } else if (arg == "--apply") {
            opts.apply = true;
            if (has_value && argv[i + 1][0] != '-') {
                opts.apply_window = Config::normalizeWindowLabel(argv[++i]);
            }
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::shared_ptr<engine::RiskParameterStore> openParameterStore(const Config& config) {
    std::filesystem::path param_path(config.getStorageConfig().parameter_file);
    if (!param_path.is_absolute()) {
        param_path = utils::PathUtils::resolveRelativePath(param_path.string());
    }
    auto repository = std::make_shared<core::ParameterRepositoryJson>(param_path);
    return std::make_shared<engine::RiskParameterStore>(config.getRiskDefaults(), repository);
}

bool writeOutput(const std::string& path, const std::string& body) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Cannot write output file: {}", path);
        return false;
    }
    out << body << "\n";
    return true;
}

int runBacktest(const CliOptions& opts, Config& config) {
    if (opts.symbols.empty()) {
        std::cerr << "--backtest requires --symbols\n";
        return 1;
    }
    if (!std::filesystem::is_directory(opts.target)) {
        std::cerr << "Data directory not found: " << opts.target << "\n";
        return 1;
    }
    if (opts.initial_capital > 0.0) {
        config.setInitialCapital(opts.initial_capital);
    }

    const auto sim_config = config.getSimulationConfig();
    LOG_INFO("Starting Backtest Mode with data dir: {}", opts.target);

    backtest::FileMarketDataProvider provider(opts.target);
    backtest::BacktestEngine bt_engine;
    bt_engine.init(sim_config);
    bt_engine.loadData(provider, opts.symbols, opts.start_date, opts.end_date);

    strategy::RangeReversalStrategy demo(static_cast<size_t>(std::max(1, sim_config.lookback_bars)));
    if (!bt_engine.run(demo)) {
        std::cerr << "Backtest could not run: no bars for " << opts.symbols.front() << "\n";
        return 1;
    }

    const auto result = bt_engine.getResult();
    const auto j = core::schema::toJson(result);
    if (!opts.output_path.empty() && !writeOutput(opts.output_path, j.dump(2))) {
        return 1;
    }
    if (opts.json_mode) {
        std::cout << j.dump() << "\n";
        return 0;
    }

    std::cout << "\nBacktest result\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Initial capital: " << result.initial_capital << "\n";
    std::cout << "Final value:     " << result.final_value << "\n";
    std::cout << "Total return:    " << result.total_return << " (" << result.total_return_pct << "%)\n";
    std::cout << "Sharpe ratio:    " << result.sharpe_ratio << "\n";
    std::cout << "Max drawdown:    " << result.max_drawdown << "%\n";
    std::cout << "Win rate:        " << (result.win_rate * 100.0) << "%\n";
    std::cout << "Profit factor:   " << j["profit_factor"].dump() << "\n";
    std::cout << "Closed trades:   " << result.total_trades << "\n";
    std::cout << "Avg trade P&L:   " << result.avg_trade_pnl << "\n";
    std::cout << "Trading days:    " << result.trading_days << "\n";
    std::cout << "---------------------------------------------\n";
    return 0;
}

bool loadClosedTrades(const std::string& path, std::vector<ClosedTrade>& closed) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "Cannot open trades file: " << path << "\n";
        return false;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Trades file is not valid JSON: " << e.what() << "\n";
        return false;
    }

    // Either a report ({"trade_history": [...]}) or a bare array
    const nlohmann::json items = raw.is_object() ? raw.value("trade_history", nlohmann::json::array()) : raw;
    if (!items.is_array()) {
        std::cerr << "Trades file must hold a JSON array\n";
        return false;
    }

    std::vector<SimulatedTrade> fills;
    int skipped = 0;
    try {
        for (const auto& item : items) {
            ClosedTrade ct;
            SimulatedTrade st;
            if (core::schema::fromJson(item, ct)) {
                closed.push_back(ct);
            } else if (core::schema::fromJson(item, st)) {
                fills.push_back(st);
            } else {
                ++skipped;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Malformed trade entry: " << e.what() << "\n";
        return false;
    }

    if (!fills.empty()) {
        const auto matched = engine::LotMatcher::closeTrades(fills);
        closed.insert(closed.end(), matched.begin(), matched.end());
    }
    if (skipped > 0) {
        LOG_WARN("Skipped {} unrecognized trade entries in {}", skipped, path);
    }
    LOG_INFO("Loaded {} closed trades from {}", closed.size(), path);
    return true;
}

int runCalibrate(const CliOptions& opts, Config& config) {
    std::vector<ClosedTrade> closed;
    if (!loadClosedTrades(opts.target, closed)) {
        return 1;
    }

    auto store = openParameterStore(config);
    engine::CalibrationAnalyzer analyzer(config.getCalibrationConfig());
    const TimestampMs now = (opts.now_ms > 0) ? opts.now_ms : utils::nowMs();
    const double current = store->get(engine::params::AUTO_TRADE_CONFIDENCE_THRESHOLD);
    const auto windows = analyzer.analyzeWindows(closed, now, current);

    nlohmann::json out;
    out["current_threshold"] = current;
    out["windows"] = nlohmann::json::array();
    for (const auto& w : windows) {
        out["windows"].push_back(core::schema::toJson(w));
    }

    if (opts.apply) {
        const std::string label = opts.apply_window.empty()
            ? config.getCalibrationConfig().apply_window
            : opts.apply_window;
        const auto it = std::find_if(windows.begin(), windows.end(),
                                     [&](const engine::WindowAnalysis& w) { return w.label == label; });
        if (it == windows.end()) {
            std::cerr << "Unknown calibration window: " << label << "\n";
            return 1;
        }
        const auto applied = analyzer.applySuggestion(*store, it->suggestion);
        nlohmann::json a;
        a["window"] = label;
        if (!applied) {
            a["status"] = "NO_CHANGE";
        } else {
            a["status"] = core::parameterUpdateStatusToString(applied->status);
            a["old_value"] = applied->old_value;
            a["new_value"] = applied->new_value;
            a["persisted"] = applied->persisted;
            if (!applied->ok()) {
                a["message"] = applied->message;
            }
        }
        out["applied"] = a;
    }

    if (opts.json_mode) {
        std::cout << out.dump() << "\n";
        return 0;
    }

    std::cout << "\nCalibration (threshold " << std::fixed << std::setprecision(2) << current << ")\n";
    std::cout << "---------------------------------------------\n";
    for (const auto& w : windows) {
        const auto& c = w.report.calibration;
        std::cout << std::setw(7) << std::left << w.label << std::right
                  << " trades=" << w.report.total_trades
                  << " win=" << std::setprecision(1) << (w.report.win_rate * 100.0) << "%"
                  << " | high " << c.high.count << " @ " << (c.high.win_rate * 100.0) << "%"
                  << " | low " << c.low.count << " @ " << (c.low.win_rate * 100.0) << "%"
                  << " | calibrated=" << (c.is_well_calibrated ? "yes" : "no")
                  << " | suggest " << std::setprecision(2) << w.suggestion.suggested_threshold
                  << (w.suggestion.should_change ? " *" : "") << "\n";
    }
    if (out.contains("applied")) {
        std::cout << "Applied: " << out["applied"].dump() << "\n";
    }
    std::cout << "---------------------------------------------\n";
    return 0;
}

int runParams(const CliOptions& opts, Config& config) {
    auto store = openParameterStore(config);
    nlohmann::json out = nlohmann::json::array();
    for (const auto& name : engine::RiskParameterStore::knownNames()) {
        const auto record = store->record(name);
        if (record) {
            out.push_back(core::schema::toJson(*record));
        }
    }

    if (opts.json_mode) {
        std::cout << out.dump() << "\n";
        return 0;
    }
    std::cout << "\nRisk parameters\n";
    std::cout << "---------------------------------------------\n";
    for (const auto& item : out) {
        std::cout << std::setw(34) << std::left << item["name"].get<std::string>() << std::right
                  << item["value"].get<double>()
                  << "  (" << item["change_reason"].get<std::string>() << ")\n";
    }
    std::cout << "---------------------------------------------\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    try {
        auto& config = Config::getInstance();
        config.load(opts.config_path);

        const auto logging = config.getLoggingConfig();
        Logger::getInstance().initialize(logging.directory, logging.level, !opts.json_mode);

        // Config::load ran before the logger existed; report what was picked up.
        LOG_INFO("Config: capital={:.2f}, slippage={:.3f}%, parameter file={}",
                 config.getSimulationConfig().initial_capital,
                 config.getSimulationConfig().slippage_pct,
                 config.getStorageConfig().parameter_file);

        if (opts.mode == "--backtest") {
            return runBacktest(opts, config);
        }
        if (opts.mode == "--calibrate") {
            return runCalibrate(opts, config);
        }
        return runParams(opts, config);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
