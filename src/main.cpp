#include <mpi.h>
#include <iostream>
#include <string>
#include "config/bridge_config.hpp"
#include "cluster/mpi_runtime.hpp"
#include "cluster/node_discovery.hpp"
#include "io/shard_reader.hpp"
#include "native/dataset_builder.hpp"

using gbmbridge::BridgeConfig;
using gbmbridge::ClusterTopology;
using gbmbridge::MpiPartitionExecutor;
using gbmbridge::MpiWorkerDirectory;
using gbmbridge::ShardLayout;
using gbmbridge::ShardReadResult;
using gbmbridge::ShardReader;

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank = 0, world = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &world);

    if (argc < 3) {
        if (rank == 0) {
            std::cerr << "Usage: gbmbridge_nodes <shard.h5> <config.json>\n";
        }
        MPI_Finalize();
        return 1;
    }

    try {
        const std::string shard_path = argv[1];
        const std::string cfg_path = argv[2];

        BridgeConfig cfg = gbmbridge::load_bridge_config(cfg_path);
        if (rank == 0) {
            std::cout << "Listen port base: " << cfg.default_listen_port
                << " | driver rank: " << cfg.driver_rank
                << " | partitions/rank: " << cfg.partitions_per_rank << "\n";
        }

        // Topology
        MpiWorkerDirectory directory(MPI_COMM_WORLD, cfg.driver_rank);
        MpiPartitionExecutor executor(MPI_COMM_WORLD, directory, cfg.partitions_per_rank);
        ClusterTopology topo = gbmbridge::resolve_cluster_topology(directory, executor, cfg.default_listen_port);

        if (rank == 0) {
            std::cout << "topology=" << gbmbridge::topology_kind_name(topo.kind) << "\n"
                << "machines=" << topo.nodes << "\n"
                << "num_machines=" << topo.count << "\n";
        }
        if (cfg.verbose) {
            std::cout << "[rank " << rank << "/" << world << "] worker id "
                << directory.current_worker_id() << "\n";
        }

        // The coordinator holds no training shard unless it is the only process.
        const bool coordinator_only = (rank == cfg.driver_rank && world > 1);
        MPI_Comm train_comm = MPI_COMM_NULL;
        MPI_Comm_split(MPI_COMM_WORLD, coordinator_only ? MPI_UNDEFINED : 0, rank, &train_comm);
        if (train_comm == MPI_COMM_NULL) {
            MPI_Finalize();
            return 0;
        }

        // Shard
        ShardReader reader(train_comm);
        ShardReadResult S = reader.read(shard_path, cfg);
        MPI_Comm_free(&train_comm);
        const int64_t local_rows = S.row1 - S.row0;

        if (local_rows == 0) {
            std::cout << "[rank " << rank << "/" << world << "] empty shard\n";
        }
        else if (S.layout == ShardLayout::Dense) {
            const int32_t n_cols = gbmbridge::validate_dense_rows(S.dense);
            std::cout << "[rank " << rank << "/" << world << "] dense rows ["
                << S.row0 << ", " << S.row1 << ") x " << n_cols
                << " | buffer " << local_rows * n_cols << " doubles"
                << " | labels " << S.labels_local.size() << "\n";
        }
        else {
            const int32_t n_cols = gbmbridge::validate_sparse_rows(S.sparse);
            const auto indptr = gbmbridge::compute_row_pointers(S.sparse);
            std::cout << "[rank " << rank << "/" << world << "] csr rows ["
                << S.row0 << ", " << S.row1 << ") x " << n_cols
                << " | nnz " << indptr.back()
                << " | indptr length " << indptr.size()
                << " | labels " << S.labels_local.size() << "\n";
        }
    }
    catch (const std::exception& e) {
        std::cerr << "[rank " << rank << "] Error: " << e.what() << "\n";
        MPI_Abort(MPI_COMM_WORLD, 2);
    }

    MPI_Finalize();
    return 0;
}
