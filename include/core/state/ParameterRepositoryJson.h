#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

#include "core/contracts/IParameterRepository.h"

namespace adaptiverisk {
namespace core {

class ParameterRepositoryJson : public IParameterRepository {
public:
    explicit ParameterRepositoryJson(std::filesystem::path file_path);

    std::optional<double> getParameter(const std::string& name) override;
    bool updateParameter(const std::string& name, double value, const std::string& reason) override;
    std::map<std::string, double> getAllParameters() override;
    std::map<std::string, RiskParameter> loadRecords() override;

private:
    std::map<std::string, RiskParameter> readFile() const;
    bool writeFile(const std::map<std::string, RiskParameter>& records) const;

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace adaptiverisk
