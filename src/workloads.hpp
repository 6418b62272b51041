#pragma once
#include <memory>
#include "broadcast.hpp"
#include "counter.hpp"
#include "echo.hpp"
#include "kv_counter.hpp"
#include "node.hpp"
#include "unique_id.hpp"
#include "workload.hpp"

// Factory function for creating workloads from the command line
inline std::unique_ptr<Workload> make_workload(WorkloadType type, Node& node) {
    switch (type) {
        case WorkloadType::UniqueIds:
            return std::make_unique<UniqueIdWorkload>(node);
        case WorkloadType::Broadcast:
            return std::make_unique<BroadcastEngine>(node, node.config().broadcast);
        case WorkloadType::Counter:
            return std::make_unique<CounterCrdt>(node, node.config().counter);
        case WorkloadType::KvCounter:
            return std::make_unique<KvCounter>(node);
        case WorkloadType::Echo:
        default:
            return std::make_unique<EchoWorkload>(node);
    }
}
