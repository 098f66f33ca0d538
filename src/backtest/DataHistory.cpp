#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace adaptiverisk {
namespace backtest {

namespace {
double readNumber(const nlohmann::json& item, const char* long_key, const char* short_key) {
    if (item.contains(long_key)) return item[long_key].get<double>();
    if (item.contains(short_key)) return item[short_key].get<double>();
    return 0.0;
}
}

std::vector<PriceBar> DataHistory::loadCSV(const std::string& file_path, const std::string& symbol) {
    std::vector<PriceBar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // UTF-8 BOM on the first cell
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    int skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row.
            continue;
        }

        try {
            PriceBar bar;
            bar.symbol = symbol;
            bar.timestamp = utils::toMsTimestamp(std::stoll(row[0]));
            bar.open = std::stod(row[1]);
            bar.high = std::stod(row[2]);
            bar.low = std::stod(row[3]);
            bar.close = std::stod(row[4]);
            bar.volume = static_cast<long long>(std::stod(row[5]));
            bars.push_back(bar);
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    std::stable_sort(bars.begin(), bars.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.timestamp < b.timestamp;
    });

    LOG_INFO("Loaded {} bars for {} from {} (skipped {})", bars.size(), symbol, file_path, skipped);
    return bars;
}

std::vector<PriceBar> DataHistory::loadJSON(const std::string& file_path, const std::string& symbol) {
    std::vector<PriceBar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return bars;
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            LOG_ERROR("Expected a JSON array of bars: {}", file_path);
            return bars;
        }
        for (const auto& item : j) {
            PriceBar bar;
            bar.symbol = symbol;
            if (item.contains("timestamp")) bar.timestamp = item["timestamp"].get<long long>();
            else if (item.contains("t")) bar.timestamp = item["t"].get<long long>();
            bar.timestamp = utils::toMsTimestamp(bar.timestamp);

            bar.open = readNumber(item, "open", "o");
            bar.high = readNumber(item, "high", "h");
            bar.low = readNumber(item, "low", "l");
            bar.close = readNumber(item, "close", "c");
            bar.volume = static_cast<long long>(readNumber(item, "volume", "v"));
            bars.push_back(bar);
        }
        std::stable_sort(bars.begin(), bars.end(), [](const PriceBar& a, const PriceBar& b) {
            return a.timestamp < b.timestamp;
        });
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        bars.clear();
    }

    LOG_INFO("Loaded {} bars for {} from {}", bars.size(), symbol, file_path);
    return bars;
}

std::vector<PriceBar> DataHistory::filterByDate(const std::vector<PriceBar>& bars,
                                                const std::string& start_date,
                                                const std::string& end_date) {
    TimestampMs lower = 0;
    TimestampMs upper = 0;
    const bool has_lower = !start_date.empty();
    const bool has_upper = !end_date.empty();

    if (has_lower && !utils::parseDate(start_date, lower)) {
        LOG_WARN("Ignoring malformed start date: {}", start_date);
        return filterByDate(bars, "", end_date);
    }
    if (has_upper) {
        if (!utils::parseDate(end_date, upper)) {
            LOG_WARN("Ignoring malformed end date: {}", end_date);
            return filterByDate(bars, start_date, "");
        }
        // Inclusive of the whole end day
        upper += utils::MS_PER_DAY;
    }

    std::vector<PriceBar> filtered;
    for (const auto& bar : bars) {
        if (has_lower && bar.timestamp < lower) continue;
        if (has_upper && bar.timestamp >= upper) continue;
        filtered.push_back(bar);
    }
    return filtered;
}

} // namespace backtest
} // namespace adaptiverisk
