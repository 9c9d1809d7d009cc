#undef NDEBUG
#include <mpi.h>
#include <cassert>
#include <iostream>
#include <string>

#include "cluster/mpi_runtime.hpp"
#include "cluster/node_discovery.hpp"

using namespace gbmbridge;

// Run as a single process.

void test_directory_without_driver() {
    MpiWorkerDirectory dir(MPI_COMM_WORLD, -1);
    auto entries = dir.list_entries();
    assert(entries.size() == 1);
    assert(entries[0].worker_id == "0");
    assert(!entries[0].host.empty());
    assert(dir.current_worker_id() == "0");

    MpiPartitionExecutor executor(MPI_COMM_WORLD, dir, 2);
    ClusterTopology T = resolve_cluster_topology(dir, executor, 500);
    assert(T.kind == TopologyKind::Cluster);
    assert(T.nodes == entries[0].host + ":500");
    assert(T.count == 1);

    std::cout << "directory without driver tests passed!" << std::endl;
}

void test_driver_only_falls_back_to_partitions() {
    MpiWorkerDirectory dir(MPI_COMM_WORLD, 0);
    auto entries = dir.list_entries();
    assert(entries.size() == 1);
    assert(entries[0].worker_id == kDriverId);

    MpiPartitionExecutor executor(MPI_COMM_WORLD, dir, 3);
    ClusterTopology T = resolve_cluster_topology(dir, executor, 500);
    const std::string& h = entries[0].host;
    assert(T.kind == TopologyKind::Local);
    assert(T.nodes == h + ":500," + h + ":501," + h + ":502");
    assert(T.count == 3);

    std::cout << "driver-only fallback tests passed!" << std::endl;
}

void test_executor_gathers_in_partition_order() {
    MpiWorkerDirectory dir(MPI_COMM_WORLD, 0);
    MpiPartitionExecutor executor(MPI_COMM_WORLD, dir, 4);
    auto out = executor.map_partitions([](const TaskContext& ctx) {
        return ctx.executor_id + "/" + std::to_string(ctx.partition_index);
    });
    assert(out.size() == 4);
    for (int p = 0; p < 4; ++p) {
        assert(out[(size_t)p] == std::string(kDriverId) + "/" + std::to_string(p));
    }

    // Empty strings survive the byte exchange.
    auto blanks = executor.map_partitions([](const TaskContext&) { return std::string(); });
    assert(blanks.size() == 4);
    for (const auto& s : blanks) assert(s.empty());

    std::cout << "executor gather tests passed!" << std::endl;
}

void test_bad_driver_rank() {
    bool threw = false;
    try { MpiWorkerDirectory dir(MPI_COMM_WORLD, 5); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    std::cout << "driver rank range tests passed!" << std::endl;
}

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);
    int world = 1;
    MPI_Comm_size(MPI_COMM_WORLD, &world);
    assert(world == 1);

    test_directory_without_driver();
    test_driver_only_falls_back_to_partitions();
    test_executor_gathers_in_partition_order();
    test_bad_driver_rank();

    MPI_Finalize();
    return 0;
}
