#include "core/state/ParameterRepositoryJson.h"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace adaptiverisk {
namespace core {

namespace {
constexpr int kSchemaVersion = 1;
}

ParameterRepositoryJson::ParameterRepositoryJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<double> ParameterRepositoryJson::getParameter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto records = readFile();
    auto it = records.find(name);
    if (it == records.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

bool ParameterRepositoryJson::updateParameter(const std::string& name, double value, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto records = readFile();

    RiskParameter& record = records[name];
    if (record.name.empty()) {
        record.name = name;
    } else {
        record.previous_value = record.value;
    }
    record.value = value;
    record.change_reason = reason;
    record.updated_at = utils::nowMs();

    return writeFile(records);
}

std::map<std::string, double> ParameterRepositoryJson::getAllParameters() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, double> values;
    for (const auto& [name, record] : readFile()) {
        values[name] = record.value;
    }
    return values;
}

std::map<std::string, RiskParameter> ParameterRepositoryJson::loadRecords() {
    std::lock_guard<std::mutex> lock(mutex_);
    return readFile();
}

std::map<std::string, RiskParameter> ParameterRepositoryJson::readFile() const {
    std::map<std::string, RiskParameter> records;
    if (!std::filesystem::exists(file_path_)) {
        return records;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("Parameter file could not be opened: {}", file_path_.string());
        return records;
    }

    try {
        nlohmann::json raw;
        in >> raw;
        const auto params = raw.value("parameters", nlohmann::json::object());
        for (const auto& [name, item] : params.items()) {
            RiskParameter record;
            record.name = name;
            record.value = item.value("value", 0.0);
            if (item.contains("previous_value") && item["previous_value"].is_number()) {
                record.previous_value = item["previous_value"].get<double>();
            }
            record.change_reason = item.value("change_reason", std::string());
            record.updated_at = item.value("updated_at", 0LL);
            records[name] = record;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Parameter file is corrupt: {} - {}", file_path_.string(), e.what());
        records.clear();
    }
    return records;
}

bool ParameterRepositoryJson::writeFile(const std::map<std::string, RiskParameter>& records) const {
    nlohmann::json raw;
    raw["schema_version"] = kSchemaVersion;
    raw["saved_at_ms"] = utils::nowMs();
    raw["parameters"] = nlohmann::json::object();
    for (const auto& [name, record] : records) {
        nlohmann::json item;
        item["value"] = record.value;
        if (record.previous_value.has_value()) {
            item["previous_value"] = *record.previous_value;
        } else {
            item["previous_value"] = nullptr;
        }
        item["change_reason"] = record.change_reason;
        item["updated_at"] = record.updated_at;
        raw["parameters"][name] = item;
    }

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create parameter directory {}: {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Cannot write parameter file: {}", tmp_path.string());
            return false;
        }
        out << raw.dump(2);
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // Windows can fail rename over existing file; fallback to copy+remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        LOG_ERROR("Cannot replace parameter file {}: {}", file_path_.string(), ec.message());
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace adaptiverisk
