#include "native/lightgbm_engine.hpp"
#include "native/validate.hpp"

#include <LightGBM/c_api.h>

namespace gbmbridge {

    // Minutes a machine waits for its peers in LGBM_NetworkInit.
    static constexpr int kNetworkTimeoutMinutes = 120;

    double* LightGbmEngine::new_double_array(std::size_t n) {
        return new double[n];
    }

    void LightGbmEngine::delete_double_array(double* p) {
        delete[] p;
    }

    int32_t* LightGbmEngine::new_int_array(std::size_t n) {
        return new int32_t[n];
    }

    void LightGbmEngine::delete_int_array(int32_t* p) {
        delete[] p;
    }

    int LightGbmEngine::create_dataset_from_mat(const void* data, int data_type,
        int32_t nrow, int32_t ncol, int is_row_major,
        const char* parameters, DatasetHandle reference, DatasetHandle* out)
    {
        return LGBM_DatasetCreateFromMat(data, data_type, nrow, ncol, is_row_major,
            parameters, reference, out);
    }

    int LightGbmEngine::create_dataset_from_csr(const void* indptr, int indptr_type,
        const int32_t* indices, const void* data, int data_type,
        int64_t nindptr, int64_t nelem, int64_t num_col,
        const char* parameters, DatasetHandle reference, DatasetHandle* out)
    {
        return LGBM_DatasetCreateFromCSR(indptr, indptr_type, indices, data, data_type,
            nindptr, nelem, num_col, parameters, reference, out);
    }

    std::string LightGbmEngine::last_error() {
        const char* msg = LGBM_GetLastError();
        return msg ? std::string(msg) : std::string();
    }

    int32_t LightGbmEngine::num_data(DatasetHandle handle) {
        int32_t n = 0;
        validate(LGBM_DatasetGetNumData(handle, &n), "Dataset num data", *this);
        return n;
    }

    int32_t LightGbmEngine::num_feature(DatasetHandle handle) {
        int32_t n = 0;
        validate(LGBM_DatasetGetNumFeature(handle, &n), "Dataset num feature", *this);
        return n;
    }

    void LightGbmEngine::free_dataset(DatasetHandle handle) {
        validate(LGBM_DatasetFree(handle), "Dataset free", *this);
    }

    void LightGbmEngine::network_init(const std::string& machines, int local_listen_port, int num_machines) {
        validate(LGBM_NetworkInit(machines.c_str(), local_listen_port, kNetworkTimeoutMinutes, num_machines),
            "Network init", *this);
    }

    void LightGbmEngine::network_free() {
        validate(LGBM_NetworkFree(), "Network free", *this);
    }

} // namespace gbmbridge
