#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace gbmbridge {

	// Row-major dense rows; every row has the same length (n_cols).
	using DenseRows = std::vector<std::vector<double>>;

	struct SparseRow {
		int32_t size = 0;               // logical column count of the row
		std::vector<int32_t> indices;   // ascending column ids in [0, size)
		std::vector<double>  values;    // same length as indices
	};

	using SparseRows = std::vector<SparseRow>;

	struct Endpoint {
		std::string host;
		int port = 0;

		std::string str() const { return host + ":" + std::to_string(port); }
	};

	inline bool operator==(const Endpoint& a, const Endpoint& b) { return a.str() == b.str(); }

	enum class ShardLayout { Dense, CSR };

	// One rank's slice [row0, row1) of the global feature matrix.
	struct ShardReadResult {
		ShardLayout layout = ShardLayout::Dense;
		int64_t n_rows = 0;   // global
		int64_t n_cols = 0;   // global
		int64_t row0 = 0;
		int64_t row1 = 0;

		DenseRows  dense;     // filled when layout == Dense
		SparseRows sparse;    // filled when layout == CSR
		std::vector<double> labels_local;  // empty if the file has no labels
	};

} // namespace gbmbridge
