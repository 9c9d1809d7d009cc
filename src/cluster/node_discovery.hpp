#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"
#include "cluster/worker_directory.hpp"

namespace gbmbridge {

    enum class TopologyKind {
        Cluster,  // endpoints come from the worker directory
        Local     // one synthetic endpoint per partition on a single host
    };

    struct ClusterTopology {
        TopologyKind kind = TopologyKind::Cluster;
        std::string nodes;   // sorted, distinct, comma-joined host:port list
        int count = 0;       // number of distinct endpoints
    };

    // Parse a worker identifier as a base-10 int; throws InvalidWorkerIdError.
    int parse_worker_id(const std::string& id);

    // Executor id when running on a real executor, the partition index when
    // the task runs inside the coordinator (local execution).
    int resolve_worker_id(const TaskContext& ctx);

    // host:(default_port + id) for every non-coordinator entry, in directory order.
    // Throws PortOutOfRangeError if a port falls outside [0, 65535].
    std::vector<Endpoint> list_endpoints(const WorkerDirectory& directory, int default_port);

    // Local fallback: one endpoint per partition, all on the directory's first host.
    std::vector<Endpoint> list_endpoints_from_partitions(const WorkerDirectory& directory,
        PartitionExecutor& executor,
        int default_port);

    // Number of non-coordinator entries, or the whole directory size when the
    // directory lists only the coordinator.
    int count_executors(const WorkerDirectory& directory, int default_port);

    // Sort by host:port, drop duplicates, join with commas.
    std::string join_endpoints(std::vector<Endpoint> endpoints, int* distinct_count = nullptr);

    // Cluster endpoints if the directory has any, otherwise the partition
    // fallback. Throws EmptyTopologyError if neither produces an endpoint.
    ClusterTopology resolve_cluster_topology(const WorkerDirectory& directory,
        PartitionExecutor& executor,
        int default_port);

    const char* topology_kind_name(TopologyKind kind);

} // namespace gbmbridge
