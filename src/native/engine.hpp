#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace gbmbridge {

    using DatasetHandle = void*;

    // Element type codes of the engine's C API.
    constexpr int kDtypeFloat32 = 0;
    constexpr int kDtypeFloat64 = 1;
    constexpr int kDtypeInt32 = 2;
    constexpr int kDtypeInt64 = 3;

    // Result code every native entry point returns on failure.
    constexpr int kNativeFailure = -1;

    // Dataset parameters passed with every creation call.
    constexpr const char* kDatasetParams = "max_bin=255 is_pre_partition=True";

    // Entry points of the gradient-boosting engine used by this library.
    // Arrays handed to the create calls must come from new_*_array and go back
    // through the matching delete_*_array.
    class NativeEngine {
    public:
        virtual ~NativeEngine() = default;

        virtual double* new_double_array(std::size_t n) = 0;
        virtual void delete_double_array(double* p) = 0;
        virtual int32_t* new_int_array(std::size_t n) = 0;
        virtual void delete_int_array(int32_t* p) = 0;

        virtual int create_dataset_from_mat(const void* data, int data_type,
            int32_t nrow, int32_t ncol, int is_row_major,
            const char* parameters, DatasetHandle reference, DatasetHandle* out) = 0;

        virtual int create_dataset_from_csr(const void* indptr, int indptr_type,
            const int32_t* indices, const void* data, int data_type,
            int64_t nindptr, int64_t nelem, int64_t num_col,
            const char* parameters, DatasetHandle reference, DatasetHandle* out) = 0;

        // Message of the most recent failed call (process-wide engine state).
        virtual std::string last_error() = 0;
    };

    // Output slot for a creation call. The handle is read out exactly once.
    class DatasetSlot {
    public:
        DatasetHandle* out() { return &handle_; }

        DatasetHandle take() {
            if (taken_) throw std::logic_error("DatasetSlot: handle already taken");
            taken_ = true;
            DatasetHandle h = handle_;
            handle_ = nullptr;
            return h;
        }

    private:
        DatasetHandle handle_ = nullptr;
        bool taken_ = false;
    };

} // namespace gbmbridge
