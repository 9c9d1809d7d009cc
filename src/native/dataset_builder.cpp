#include "native/dataset_builder.hpp"
#include "native/native_buffer.hpp"
#include "native/validate.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace gbmbridge {

    static inline void check_int32(int64_t v, const char* what) {
        if (v > (int64_t)std::numeric_limits<int32_t>::max()) {
            throw std::overflow_error(std::string(what) + " exceeds the int32 range of the native engine: "
                + std::to_string(v));
        }
    }

    int32_t validate_dense_rows(const DenseRows& rows) {
        if (rows.empty()) throw EmptyShardError();
        check_int32((int64_t)rows.size(), "Row count");
        check_int32((int64_t)rows.front().size(), "Column count");

        const int64_t n_cols = (int64_t)rows.front().size();
        for (size_t r = 1; r < rows.size(); ++r) {
            if ((int64_t)rows[r].size() != n_cols) {
                throw InconsistentRowLengthError((int64_t)r, n_cols, (int64_t)rows[r].size(), "dense row length differs");
            }
        }
        return (int32_t)n_cols;
    }

    int32_t validate_sparse_rows(const SparseRows& rows) {
        if (rows.empty()) throw EmptyShardError();
        check_int32((int64_t)rows.size() + 1, "Row pointer length");

        const int32_t n_cols = rows.front().size;
        if (n_cols < 0) {
            throw BridgeError("Sparse row column count is negative: " + std::to_string(n_cols));
        }
        for (size_t r = 0; r < rows.size(); ++r) {
            const SparseRow& row = rows[r];
            if (row.size != n_cols) {
                throw InconsistentRowLengthError((int64_t)r, n_cols, row.size, "sparse row column count differs");
            }
            if (row.indices.size() != row.values.size()) {
                throw InconsistentRowLengthError((int64_t)r, (int64_t)row.indices.size(),
                    (int64_t)row.values.size(), "values length differs from indices length");
            }
            int32_t prev = -1;
            for (int32_t c : row.indices) {
                if (c < 0 || c >= n_cols || c <= prev) {
                    throw BridgeError("Row " + std::to_string(r) + ": column index " + std::to_string(c)
                        + " is out of order or outside [0, " + std::to_string(n_cols) + ")");
                }
                prev = c;
            }
        }
        return n_cols;
    }

    std::vector<int32_t> compute_row_pointers(const SparseRows& rows) {
        std::vector<int32_t> indptr(rows.size() + 1, 0);
        int64_t acc = 0;
        for (size_t r = 0; r < rows.size(); ++r) {
            acc += (int64_t)rows[r].values.size();
            check_int32(acc, "Non-zero count");
            indptr[r + 1] = (int32_t)acc;
        }
        return indptr;
    }

    DatasetHandle build_dense_dataset(NativeEngine& engine, const DenseRows& rows) {
        const int32_t n_cols = validate_dense_rows(rows);
        const int32_t n_rows = (int32_t)rows.size();

        NativeDoubleBuffer data(engine, (size_t)n_rows * (size_t)n_cols);
        for (int64_t r = 0; r < n_rows; ++r) {
            const auto& row = rows[(size_t)r];
            for (int64_t c = 0; c < n_cols; ++c) {
                data[(size_t)row_major_offset(r, c, n_cols)] = row[(size_t)c];
            }
        }

        DatasetSlot slot;
        const int is_row_major = 1;
        validate(engine.create_dataset_from_mat(data.data(), kDtypeFloat64, n_rows, n_cols, is_row_major,
            kDatasetParams, nullptr, slot.out()), kDatasetCreateComponent, engine);
        return slot.take();
    }

    DatasetHandle build_csr_dataset(NativeEngine& engine, const SparseRows& rows) {
        const int32_t n_cols = validate_sparse_rows(rows);

        // Row pointers first: they size the value/index buffers.
        const std::vector<int32_t> indptr = compute_row_pointers(rows);
        const size_t nnz = (size_t)indptr.back();

        NativeDoubleBuffer values(engine, nnz);
        NativeIntBuffer indices(engine, nnz);
        for (size_t r = 0; r < rows.size(); ++r) {
            const SparseRow& row = rows[r];
            const size_t w = (size_t)indptr[r];
            std::copy(row.values.begin(), row.values.end(), values.data() + w);
            std::copy(row.indices.begin(), row.indices.end(), indices.data() + w);
        }

        NativeIntBuffer indptr_native(engine, indptr.size());
        std::copy(indptr.begin(), indptr.end(), indptr_native.data());

        DatasetSlot slot;
        validate(engine.create_dataset_from_csr(indptr_native.data(), kDtypeInt32,
            indices.data(), values.data(), kDtypeFloat64,
            (int64_t)indptr.size(), (int64_t)nnz, (int64_t)n_cols,
            kDatasetParams, nullptr, slot.out()), kDatasetCreateComponent, engine);
        return slot.take();
    }

} // namespace gbmbridge
