#pragma once
#include <functional>
#include <string>
#include <vector>

namespace gbmbridge {

    // Identifier the runtime gives its coordinating process. The coordinator
    // never trains.
    constexpr const char* kDriverId = "driver";

    struct WorkerEntry {
        std::string worker_id;   // integer string, or kDriverId
        std::string host;
    };

    // Identity of the unit of work a partition function runs in.
    struct TaskContext {
        std::string executor_id;
        int partition_index = 0;
    };

    // Live registry of the runtime's execution contexts. Read-only here.
    class WorkerDirectory {
    public:
        virtual ~WorkerDirectory() = default;

        virtual std::vector<WorkerEntry> list_entries() const = 0;
        virtual std::string current_worker_id() const = 0;
    };

    // Runs fn once per data partition, independently, and collects every
    // partition's result. Returning is the synchronization point.
    class PartitionExecutor {
    public:
        using PartitionFn = std::function<std::string(const TaskContext&)>;

        virtual ~PartitionExecutor() = default;

        virtual std::vector<std::string> map_partitions(const PartitionFn& fn) = 0;
    };

} // namespace gbmbridge
