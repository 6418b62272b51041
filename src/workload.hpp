#pragma once
#include <string>

// Abstract base class for workloads. A workload registers its handlers and
// timers on the Node in its constructor and must outlive the node's loop.
class Workload {
public:
    Workload() = default;
    virtual ~Workload() = default;

    Workload(const Workload&) = delete;
    Workload& operator=(const Workload&) = delete;

    // Human-readable workload name for logs
    virtual const char* type_name() const = 0;
};

enum class WorkloadType {
    Echo,
    UniqueIds,
    Broadcast,
    Counter,
    KvCounter
};

inline bool parse_workload(const std::string& name, WorkloadType& out) {
    if (name == "echo") out = WorkloadType::Echo;
    else if (name == "unique-ids" || name == "unique_ids") out = WorkloadType::UniqueIds;
    else if (name == "broadcast") out = WorkloadType::Broadcast;
    else if (name == "counter" || name == "g-counter") out = WorkloadType::Counter;
    else if (name == "seq-kv-counter") out = WorkloadType::KvCounter;
    else return false;
    return true;
}
