#pragma once
#include <cstdint>
#include <string>
#include "native/engine.hpp"

namespace gbmbridge {

    // NativeEngine backed by LightGBM's C API (lib_lightgbm).
    class LightGbmEngine : public NativeEngine {
    public:
        double* new_double_array(std::size_t n) override;
        void delete_double_array(double* p) override;
        int32_t* new_int_array(std::size_t n) override;
        void delete_int_array(int32_t* p) override;

        int create_dataset_from_mat(const void* data, int data_type,
            int32_t nrow, int32_t ncol, int is_row_major,
            const char* parameters, DatasetHandle reference, DatasetHandle* out) override;

        int create_dataset_from_csr(const void* indptr, int indptr_type,
            const int32_t* indices, const void* data, int data_type,
            int64_t nindptr, int64_t nelem, int64_t num_col,
            const char* parameters, DatasetHandle reference, DatasetHandle* out) override;

        std::string last_error() override;

        // Dataset queries and release; failures throw NativeCallError.
        int32_t num_data(DatasetHandle handle);
        int32_t num_feature(DatasetHandle handle);
        void free_dataset(DatasetHandle handle);

        // Socket network between training processes. machines is the
        // comma-joined host:port list, num_machines its length.
        void network_init(const std::string& machines, int local_listen_port, int num_machines);
        void network_free();
    };

} // namespace gbmbridge
