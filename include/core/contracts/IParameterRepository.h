#pragma once

#include <map>
#include <optional>
#include <string>

#include "core/model/EngineTypes.h"

namespace adaptiverisk {
namespace core {

class IParameterRepository {
public:
    virtual ~IParameterRepository() = default;

    virtual std::optional<double> getParameter(const std::string& name) = 0;
    virtual bool updateParameter(const std::string& name, double value, const std::string& reason) = 0;
    virtual std::map<std::string, double> getAllParameters() = 0;

    // Full records including the audit fields of the last change.
    virtual std::map<std::string, RiskParameter> loadRecords() = 0;
};

} // namespace core
} // namespace adaptiverisk
