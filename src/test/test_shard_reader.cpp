#undef NDEBUG
#include <mpi.h>
#include <cassert>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" {
#include <hdf5.h>
}

#include "io/shard_reader.hpp"
#include "native/dataset_builder.hpp"

using namespace gbmbridge;

static void write_dataset(hid_t loc, const char* name, hid_t type, int rank, const hsize_t* dims, const void* data) {
    hid_t space = H5Screate_simple(rank, dims, nullptr);
    hid_t dset = H5Dcreate2(loc, name, type, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    assert(dset >= 0);
    assert(H5Dwrite(dset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, data) >= 0);
    H5Dclose(dset);
    H5Sclose(space);
}

static std::string dense_fixture() {
    const std::string path = "gbmbridge_test_dense.h5";
    hid_t file = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    assert(file >= 0);
    const double X[3][2] = { {1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0} };
    const hsize_t xdims[2] = { 3, 2 };
    write_dataset(file, "X", H5T_NATIVE_DOUBLE, 2, xdims, X);
    const double y[3] = { 0.0, 1.0, 0.0 };
    const hsize_t ydims[1] = { 3 };
    write_dataset(file, "label", H5T_NATIVE_DOUBLE, 1, ydims, y);
    H5Fclose(file);
    return path;
}

// rows: {0:5, 2:6}, {1:7}, {} with 4 columns; shape stored or left implicit.
static std::string csr_fixture(bool with_shape) {
    const std::string path = with_shape ? "gbmbridge_test_csr_shape.h5" : "gbmbridge_test_csr.h5";
    hid_t file = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    assert(file >= 0);
    hid_t grp = H5Gcreate2(file, "X", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    assert(grp >= 0);

    const long long indptr[4] = { 0, 2, 3, 3 };
    const int indices[3] = { 0, 2, 1 };
    const float data[3] = { 5.0f, 6.0f, 7.0f };
    const hsize_t d4[1] = { 4 }, d3[1] = { 3 };
    write_dataset(grp, "indptr", H5T_NATIVE_LLONG, 1, d4, indptr);
    write_dataset(grp, "indices", H5T_NATIVE_INT, 1, d3, indices);
    write_dataset(grp, "data", H5T_NATIVE_FLOAT, 1, d3, data);
    if (with_shape) {
        const long long shape[2] = { 3, 4 };
        const hsize_t d2[1] = { 2 };
        write_dataset(grp, "shape", H5T_NATIVE_LLONG, 1, d2, shape);
    }
    H5Gclose(grp);
    H5Fclose(file);
    return path;
}

// Three rows over three stored non-zeros with a caller-supplied indptr.
static std::string csr_fixture_with_indptr(const long long (&indptr)[4]) {
    const std::string path = "gbmbridge_test_csr_bad.h5";
    hid_t file = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    assert(file >= 0);
    hid_t grp = H5Gcreate2(file, "X", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    assert(grp >= 0);

    const int indices[3] = { 0, 1, 2 };
    const double data[3] = { 1.0, 2.0, 3.0 };
    const hsize_t d4[1] = { 4 }, d3[1] = { 3 };
    write_dataset(grp, "indptr", H5T_NATIVE_LLONG, 1, d4, indptr);
    write_dataset(grp, "indices", H5T_NATIVE_INT, 1, d3, indices);
    write_dataset(grp, "data", H5T_NATIVE_DOUBLE, 1, d3, data);
    H5Gclose(grp);
    H5Fclose(file);
    return path;
}

void test_split_rows() {
    int64_t r0 = 0, r1 = 0;
    ShardReader::split_rows(10, 0, 3, r0, r1); assert(r0 == 0 && r1 == 4);
    ShardReader::split_rows(10, 1, 3, r0, r1); assert(r0 == 4 && r1 == 7);
    ShardReader::split_rows(10, 2, 3, r0, r1); assert(r0 == 7 && r1 == 10);
    ShardReader::split_rows(2, 2, 3, r0, r1); assert(r0 == r1);

    std::cout << "split_rows tests passed!" << std::endl;
}

void test_read_dense() {
    const std::string path = dense_fixture();
    BridgeConfig cfg;
    ShardReader reader(MPI_COMM_WORLD);
    ShardReadResult S = reader.read(path, cfg);

    assert(S.layout == ShardLayout::Dense);
    assert(S.n_rows == 3 && S.n_cols == 2);
    assert(S.row0 == 0 && S.row1 == 3);
    assert((S.dense[1] == std::vector<double>{3.0, 4.0}));
    assert((S.labels_local == std::vector<double>{0.0, 1.0, 0.0}));
    assert(validate_dense_rows(S.dense) == 2);

    cfg.input_format = "csr";
    bool threw = false;
    try { reader.read(path, cfg); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    std::remove(path.c_str());
    std::cout << "dense shard tests passed!" << std::endl;
}

void test_read_csr() {
    for (bool with_shape : { true, false }) {
        const std::string path = csr_fixture(with_shape);
        BridgeConfig cfg;
        cfg.input_format = "csr";
        ShardReader reader(MPI_COMM_WORLD);
        ShardReadResult S = reader.read(path, cfg);

        assert(S.layout == ShardLayout::CSR);
        assert(S.n_rows == 3);
        assert(S.n_cols == (with_shape ? 4 : 3));
        assert(S.sparse.size() == 3);
        assert((S.sparse[0].indices == std::vector<int32_t>{0, 2}));
        assert((S.sparse[0].values == std::vector<double>{5.0, 6.0}));
        assert((S.sparse[1].indices == std::vector<int32_t>{1}));
        assert(S.sparse[2].indices.empty());
        assert(S.sparse[2].size == S.n_cols);
        assert(S.labels_local.empty());

        assert((compute_row_pointers(S.sparse) == std::vector<int32_t>{0, 2, 3, 3}));

        std::remove(path.c_str());
    }

    std::cout << "csr shard tests passed!" << std::endl;
}

void test_corrupt_indptr() {
    const long long decreasing[4] = { 0, 2, 1, 3 };
    const long long past_end[4] = { 0, 1, 2, 9 };
    for (const auto* indptr : { &decreasing, &past_end }) {
        const std::string path = csr_fixture_with_indptr(*indptr);
        BridgeConfig cfg;
        ShardReader reader(MPI_COMM_WORLD);
        bool threw = false;
        try { reader.read(path, cfg); }
        catch (const std::runtime_error& e) {
            threw = true;
            assert(std::string(e.what()).find("indptr") != std::string::npos);
        }
        assert(threw);
        std::remove(path.c_str());
    }

    std::cout << "corrupt indptr tests passed!" << std::endl;
}

void test_missing_features() {
    const std::string path = dense_fixture();
    BridgeConfig cfg;
    cfg.features_dataset = "/features";
    ShardReader reader(MPI_COMM_WORLD);
    bool threw = false;
    try { reader.read(path, cfg); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    std::remove(path.c_str());
    std::cout << "missing features tests passed!" << std::endl;
}

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    test_split_rows();
    test_read_dense();
    test_read_csr();
    test_corrupt_indptr();
    test_missing_features();

    MPI_Finalize();
    return 0;
}
