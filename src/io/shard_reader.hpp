#pragma once
#include <mpi.h>
#include <string>
#include "common/types.hpp"
#include "config/bridge_config.hpp"

namespace gbmbridge {

	// Reads this rank's row slice of a feature matrix stored in HDF5, either as
	// a 2-D dataset (dense) or as a CSR group {indptr, indices, data[, shape]}.
	class ShardReader {
	public:
		explicit ShardReader(MPI_Comm comm);
		ShardReadResult read(const std::string& h5_path, const BridgeConfig& cfg);

		// Even split of n_rows over world ranks; the first n_rows % world ranks get one more.
		static void split_rows(int64_t n_rows, int rank, int world, int64_t& row0, int64_t& row1);

	private:
		MPI_Comm comm_;
		int rank_ = 0;
		int world_ = 1;
	};

} // namespace gbmbridge
