#include <mpi.h>
#include <iostream>
#include <string>
#include "config/bridge_config.hpp"
#include "cluster/mpi_runtime.hpp"
#include "cluster/node_discovery.hpp"
#include "io/shard_reader.hpp"
#include "native/dataset_builder.hpp"
#include "native/lightgbm_engine.hpp"

using gbmbridge::BridgeConfig;
using gbmbridge::ClusterTopology;
using gbmbridge::DatasetHandle;
using gbmbridge::LightGbmEngine;
using gbmbridge::MpiPartitionExecutor;
using gbmbridge::MpiWorkerDirectory;
using gbmbridge::ShardLayout;
using gbmbridge::ShardReadResult;
using gbmbridge::ShardReader;
using gbmbridge::TopologyKind;

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank = 0, world = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &world);

    if (argc < 3) {
        if (rank == 0) {
            std::cerr << "Usage: gbmbridge_dataset <shard.h5> <config.json>\n";
        }
        MPI_Finalize();
        return 1;
    }

    try {
        const std::string shard_path = argv[1];
        const std::string cfg_path = argv[2];

        BridgeConfig cfg = gbmbridge::load_bridge_config(cfg_path);

        // Topology
        MpiWorkerDirectory directory(MPI_COMM_WORLD, cfg.driver_rank);
        MpiPartitionExecutor executor(MPI_COMM_WORLD, directory, cfg.partitions_per_rank);
        ClusterTopology topo = gbmbridge::resolve_cluster_topology(directory, executor, cfg.default_listen_port);
        const int n_executors = gbmbridge::count_executors(directory, cfg.default_listen_port);

        if (rank == 0) {
            std::cout << "topology=" << gbmbridge::topology_kind_name(topo.kind)
                << " | machines=" << topo.nodes
                << " | num_machines=" << topo.count
                << " | executors=" << n_executors << "\n";
        }

        const bool coordinator_only = (rank == cfg.driver_rank && world > 1);
        MPI_Comm train_comm = MPI_COMM_NULL;
        MPI_Comm_split(MPI_COMM_WORLD, coordinator_only ? MPI_UNDEFINED : 0, rank, &train_comm);
        if (train_comm == MPI_COMM_NULL) {
            MPI_Finalize();
            return 0;
        }

        ShardReader reader(train_comm);
        ShardReadResult S = reader.read(shard_path, cfg);
        MPI_Comm_free(&train_comm);

        LightGbmEngine engine;

        // Bin boundaries are agreed over the socket network when several
        // machines train together.
        const bool networked = (topo.kind == TopologyKind::Cluster && topo.count > 1);
        if (networked) {
            const int worker_id = gbmbridge::parse_worker_id(directory.current_worker_id());
            engine.network_init(topo.nodes, cfg.default_listen_port + worker_id, topo.count);
        }

        DatasetHandle dataset = (S.layout == ShardLayout::Dense)
            ? gbmbridge::build_dense_dataset(engine, S.dense)
            : gbmbridge::build_csr_dataset(engine, S.sparse);

        std::cout << "[rank " << rank << "/" << world << "] "
            << (S.layout == ShardLayout::Dense ? "dense" : "csr") << " dataset rows ["
            << S.row0 << ", " << S.row1 << ") | num_data " << engine.num_data(dataset)
            << " | num_feature " << engine.num_feature(dataset)
            << " | labels " << S.labels_local.size() << "\n";

        engine.free_dataset(dataset);
        if (networked) engine.network_free();
    }
    catch (const std::exception& e) {
        std::cerr << "[rank " << rank << "] Error: " << e.what() << "\n";
        MPI_Abort(MPI_COMM_WORLD, 2);
    }

    MPI_Finalize();
    return 0;
}
