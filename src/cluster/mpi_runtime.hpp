#pragma once
#include <mpi.h>
#include <string>
#include <vector>
#include "cluster/worker_directory.hpp"

namespace gbmbridge {

	// Worker directory over an MPI communicator. Every rank contributes its
	// processor name; the rank equal to driver_rank (if any) is the coordinator.
	class MpiWorkerDirectory : public WorkerDirectory {
	public:
		MpiWorkerDirectory(MPI_Comm comm, int driver_rank = -1);

		std::vector<WorkerEntry> list_entries() const override;
		std::string current_worker_id() const override;

		int rank() const { return rank_; }
		int world() const { return world_; }

	private:
		MPI_Comm comm_;
		int rank_ = 0;
		int world_ = 1;
		int driver_rank_ = -1;
		std::vector<WorkerEntry> entries_;   // rank order
	};

	// Runs the partitions [first_partition, first_partition + num_partitions)
	// of this process on OpenMP threads.
	class LocalPartitionExecutor : public PartitionExecutor {
	public:
		LocalPartitionExecutor(std::string executor_id, int num_partitions, int first_partition = 0);

		std::vector<std::string> map_partitions(const PartitionFn& fn) override;

	private:
		std::string executor_id_;
		int num_partitions_ = 1;
		int first_partition_ = 0;
	};

	// Each rank runs its local partitions, then all results are gathered on
	// every rank in rank order.
	class MpiPartitionExecutor : public PartitionExecutor {
	public:
		MpiPartitionExecutor(MPI_Comm comm, const WorkerDirectory& directory, int partitions_per_rank);

		std::vector<std::string> map_partitions(const PartitionFn& fn) override;

	private:
		MPI_Comm comm_;
		int rank_ = 0;
		int world_ = 1;
		LocalPartitionExecutor local_;
	};

} // namespace gbmbridge
