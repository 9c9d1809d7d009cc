#include "cluster/node_discovery.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace gbmbridge {

    static bool is_driver(const std::string& id) { return id == kDriverId; }

    // "host:port" back to an Endpoint (host may itself contain ':').
    static Endpoint parse_endpoint(const std::string& s) {
        const size_t colon = s.rfind(':');
        if (colon == std::string::npos) throw BridgeError("Malformed endpoint: '" + s + "'");
        Endpoint e;
        e.host = s.substr(0, colon);
        const char* first = s.data() + colon + 1;
        const char* last = s.data() + s.size();
        auto res = std::from_chars(first, last, e.port);
        if (res.ec != std::errc() || res.ptr != last) throw BridgeError("Malformed endpoint: '" + s + "'");
        return e;
    }

    static constexpr int64_t kMaxPort = 65535;

    static Endpoint make_endpoint(const std::string& host, int default_port, int worker_id) {
        const int64_t port = (int64_t)default_port + (int64_t)worker_id;
        if (port < 0 || port > kMaxPort) throw PortOutOfRangeError(host, port);
        return Endpoint{ host, (int)port };
    }

    int parse_worker_id(const std::string& id) {
        int value = 0;
        const char* first = id.data();
        const char* last = id.data() + id.size();
        auto res = std::from_chars(first, last, value);
        if (id.empty() || res.ec != std::errc() || res.ptr != last) {
            throw InvalidWorkerIdError(id);
        }
        return value;
    }

    int resolve_worker_id(const TaskContext& ctx) {
        // Inside the coordinator there is no executor identity; each partition
        // stands in for a worker.
        if (is_driver(ctx.executor_id)) return ctx.partition_index;
        return parse_worker_id(ctx.executor_id);
    }

    std::vector<Endpoint> list_endpoints(const WorkerDirectory& directory, int default_port) {
        std::vector<Endpoint> out;
        for (const auto& entry : directory.list_entries()) {
            if (is_driver(entry.worker_id)) continue;
            out.push_back(make_endpoint(entry.host, default_port, parse_worker_id(entry.worker_id)));
        }
        return out;
    }

    std::vector<Endpoint> list_endpoints_from_partitions(const WorkerDirectory& directory,
        PartitionExecutor& executor,
        int default_port)
    {
        const auto entries = directory.list_entries();
        if (entries.empty()) throw EmptyTopologyError();
        const std::string host = entries.front().host;

        auto collected = executor.map_partitions([host, default_port](const TaskContext& ctx) {
            return make_endpoint(host, default_port, resolve_worker_id(ctx)).str();
        });

        std::vector<Endpoint> out;
        out.reserve(collected.size());
        for (const auto& s : collected) out.push_back(parse_endpoint(s));
        return out;
    }

    int count_executors(const WorkerDirectory& directory, int default_port) {
        const auto executors = list_endpoints(directory, default_port);
        if (!executors.empty()) return (int)executors.size();
        // Single process: every directory entry is the coordinator.
        return (int)directory.list_entries().size();
    }

    std::string join_endpoints(std::vector<Endpoint> endpoints, int* distinct_count) {
        std::vector<std::string> names;
        names.reserve(endpoints.size());
        for (const auto& e : endpoints) names.push_back(e.str());
        std::sort(names.begin(), names.end());
        names.erase(std::unique(names.begin(), names.end()), names.end());

        std::string joined;
        for (size_t i = 0; i < names.size(); ++i) {
            if (i) joined += ",";
            joined += names[i];
        }
        if (distinct_count) *distinct_count = (int)names.size();
        return joined;
    }

    static int count_items(const std::string& joined) {
        if (joined.empty()) return 0;
        int n = 0;
        std::istringstream in(joined);
        std::string item;
        while (std::getline(in, item, ',')) ++n;
        return n;
    }

    ClusterTopology resolve_cluster_topology(const WorkerDirectory& directory,
        PartitionExecutor& executor,
        int default_port)
    {
        ClusterTopology T;
        std::vector<Endpoint> endpoints = list_endpoints(directory, default_port);

        if (!endpoints.empty()) {
            T.kind = TopologyKind::Cluster;
            T.nodes = join_endpoints(std::move(endpoints), &T.count);
        }
        else {
            T.kind = TopologyKind::Local;
            T.nodes = join_endpoints(list_endpoints_from_partitions(directory, executor, default_port));
            T.count = count_items(T.nodes);
        }

        if (T.count == 0) throw EmptyTopologyError();
        return T;
    }

    const char* topology_kind_name(TopologyKind kind) {
        switch (kind) {
        case TopologyKind::Cluster: return "cluster";
        case TopologyKind::Local:   return "local";
        }
        return "unknown";
    }

} // namespace gbmbridge
