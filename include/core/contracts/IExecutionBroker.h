#pragma once

#include "core/model/EngineTypes.h"

namespace adaptiverisk {
namespace core {

class IExecutionBroker {
public:
    virtual ~IExecutionBroker() = default;

    virtual BrokerFill submit(const OrderIntent& intent) = 0;
};

} // namespace core
} // namespace adaptiverisk
