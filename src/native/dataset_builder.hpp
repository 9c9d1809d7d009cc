#pragma once
#include <cstdint>
#include <vector>
#include "common/types.hpp"
#include "native/engine.hpp"

namespace gbmbridge {

    // Component name reported when a creation call fails.
    constexpr const char* kDatasetCreateComponent = "Dataset create";

    inline int64_t row_major_offset(int64_t row, int64_t col, int64_t n_cols) {
        return row * n_cols + col;
    }

    // Throw EmptyShardError / InconsistentRowLengthError before anything is
    // allocated. Return the shared column count.
    int32_t validate_dense_rows(const DenseRows& rows);
    int32_t validate_sparse_rows(const SparseRows& rows);

    // CSR row pointers: size rows+1, starts at 0, ends at the total non-zero count.
    std::vector<int32_t> compute_row_pointers(const SparseRows& rows);

    // Build a dataset from dense rows (row-major float64 buffer).
    // The flattened buffer is released before returning or throwing; the
    // returned handle belongs to the caller.
    DatasetHandle build_dense_dataset(NativeEngine& engine, const DenseRows& rows);

    // Build a dataset from sparse rows in CSR form (int32 row pointers and
    // indices, float64 values). All three buffers are released on every path.
    DatasetHandle build_csr_dataset(NativeEngine& engine, const SparseRows& rows);

} // namespace gbmbridge
