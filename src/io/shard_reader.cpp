#include "io/shard_reader.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>
#include <string>
#include <iostream>
#include <type_traits>

extern "C" {
#include <hdf5.h>
}

namespace gbmbridge {

    // ============================ HDF5 helpers ============================

    static inline void h5_check(herr_t status, const char* msg) {
        if (status < 0) throw std::runtime_error(std::string("HDF5 error: ") + msg);
    }

    static inline void mpi_check(int rc, const char* msg) {
        if (rc != MPI_SUCCESS) throw std::runtime_error(std::string("MPI error: ") + msg);
    }

    static bool object_exists(hid_t loc, const std::string& path) {
        // H5Lexists only checks the last link; walk the intermediate groups.
        size_t pos = 0;
        while ((pos = path.find('/', pos + 1)) != std::string::npos) {
            if (H5Lexists(loc, path.substr(0, pos).c_str(), H5P_DEFAULT) <= 0) return false;
        }
        return H5Lexists(loc, path.c_str(), H5P_DEFAULT) > 0;
    }

    // Open file with MPI-IO if available; otherwise serial open.
    static hid_t open_file_with_mpi(const std::string& path, MPI_Comm comm) {
        hid_t fapl = H5Pcreate(H5P_FILE_ACCESS);
#ifdef H5_HAVE_PARALLEL
        MPI_Info info = MPI_INFO_NULL;
        h5_check(H5Pset_fapl_mpio(fapl, comm, info), "H5Pset_fapl_mpio");
#else
        (void)comm;
#endif
        hid_t file = H5Fopen(path.c_str(), H5F_ACC_RDONLY, fapl);
        H5Pclose(fapl);
        if (file < 0) throw std::runtime_error("Failed to open HDF5 shard file: " + path);
        return file;
    }

    static H5I_type_t object_type(hid_t file, const std::string& path) {
        hid_t obj = H5Oopen(file, path.c_str(), H5P_DEFAULT);
        if (obj < 0) throw std::runtime_error("Failed to open " + path);
        H5I_type_t t = H5Iget_type(obj);
        H5Oclose(obj);
        return t;
    }

    // Dimensions of a dataset (no read).
    static std::vector<hsize_t> dataset_dims(hid_t file, const std::string& path) {
        hid_t dset = H5Dopen(file, path.c_str(), H5P_DEFAULT);
        if (dset < 0) throw std::runtime_error("Dataset not found: " + path);
        hid_t sp = H5Dget_space(dset);
        int nd = H5Sget_simple_extent_ndims(sp);
        std::vector<hsize_t> dims(nd > 0 ? (size_t)nd : 0, 0);
        if (nd > 0) H5Sget_simple_extent_dims(sp, dims.data(), nullptr);
        H5Sclose(sp);
        H5Dclose(dset);
        return dims;
    }

    static int64_t dataset_len_1d(hid_t file, const std::string& path) {
        auto dims = dataset_dims(file, path);
        if (dims.size() != 1) throw std::runtime_error("Expected 1D dataset: " + path);
        return static_cast<int64_t>(dims[0]);
    }

    template <typename T>
    static hid_t native_type_for() {
        if (std::is_floating_point<T>::value) {
            return sizeof(T) == 8 ? H5T_NATIVE_DOUBLE : H5T_NATIVE_FLOAT;
        }
        if (sizeof(T) == 8) return H5T_NATIVE_LLONG;
        return H5T_NATIVE_INT;
    }

    // Read rows [offset, offset+count) of a 1D or 2D dataset into out (row-major).
    template <typename T>
    static void read_row_slice(hid_t file, const std::string& path, int64_t offset, int64_t count,
        std::vector<T>& out, int64_t& row_width)
    {
        hid_t dset = H5Dopen(file, path.c_str(), H5P_DEFAULT);
        if (dset < 0) throw std::runtime_error("Dataset not found: " + path);

        hid_t fspace = H5Dget_space(dset);
        const int nd = H5Sget_simple_extent_ndims(fspace);
        if (nd != 1 && nd != 2) {
            H5Sclose(fspace); H5Dclose(dset);
            throw std::runtime_error("Expected 1D or 2D dataset: " + path);
        }
        hsize_t dims[2] = { 0, 1 };
        H5Sget_simple_extent_dims(fspace, dims, nullptr);
        row_width = (nd == 2) ? (int64_t)dims[1] : 1;

        out.resize(static_cast<size_t>(count * row_width));
        if (count == 0 || row_width == 0) {
            H5Sclose(fspace); H5Dclose(dset);
            return;
        }

        hsize_t start[2] = { static_cast<hsize_t>(offset), 0 };
        hsize_t count_h[2] = { static_cast<hsize_t>(count), static_cast<hsize_t>(row_width) };
        herr_t st = H5Sselect_hyperslab(fspace, H5S_SELECT_SET, start, nullptr, count_h, nullptr);
        if (st < 0) {
            H5Sclose(fspace); H5Dclose(dset);
            throw std::runtime_error("HDF5 error: select hyperslab on " + path);
        }
        hid_t mspace = H5Screate_simple(nd, count_h, nullptr);

        hid_t dxpl = H5Pcreate(H5P_DATASET_XFER);
#ifdef H5_HAVE_PARALLEL
        H5Pset_dxpl_mpio(dxpl, H5FD_MPIO_INDEPENDENT);
#endif
        st = H5Dread(dset, native_type_for<T>(), mspace, fspace, dxpl, out.data());
        H5Pclose(dxpl);
        H5Sclose(mspace);
        H5Sclose(fspace);
        H5Dclose(dset);
        h5_check(st, ("H5Dread " + path).c_str());
    }

    template <typename T>
    static std::vector<T> read_1d_slice(hid_t file, const std::string& path, int64_t offset, int64_t count) {
        std::vector<T> out;
        int64_t width = 0;
        read_row_slice<T>(file, path, offset, count, out, width);
        return out;
    }

    // CSR shape from <group>/shape dataset or a 2-integer "shape" attribute on the group.
    static bool try_read_csr_shape(hid_t file, const std::string& group, int64_t& n_rows, int64_t& n_cols) {
        const std::string shape_path = group + "/shape";
        if (object_exists(file, shape_path)) {
            auto shape = read_1d_slice<int64_t>(file, shape_path, 0, 2);
            n_rows = shape[0]; n_cols = shape[1];
            return true;
        }

        hid_t obj = H5Oopen(file, group.c_str(), H5P_DEFAULT);
        if (obj < 0) return false;
        if (H5Aexists(obj, "shape") <= 0) { H5Oclose(obj); return false; }
        hid_t attr = H5Aopen(obj, "shape", H5P_DEFAULT);
        if (attr < 0) { H5Oclose(obj); return false; }

        hid_t aspace = H5Aget_space(attr);
        hsize_t dims[1] = { 0 };
        int nd = H5Sget_simple_extent_ndims(aspace);
        H5Sget_simple_extent_dims(aspace, dims, nullptr);
        bool ok = (nd == 1 && dims[0] == 2);
        int64_t tmp[2] = { 0, 0 };
        if (ok) ok = H5Aread(attr, H5T_NATIVE_LLONG, tmp) >= 0;

        H5Sclose(aspace);
        H5Aclose(attr);
        H5Oclose(obj);

        if (!ok) return false;
        n_rows = tmp[0]; n_cols = tmp[1];
        return true;
    }

    // ============================ Reader methods ============================

    ShardReader::ShardReader(MPI_Comm comm) : comm_(comm) {
        mpi_check(MPI_Comm_rank(comm_, &rank_), "Comm_rank");
        mpi_check(MPI_Comm_size(comm_, &world_), "Comm_size");
    }

    void ShardReader::split_rows(int64_t n_rows, int rank, int world, int64_t& row0, int64_t& row1) {
        int64_t base = n_rows / world;
        int64_t rem = n_rows % world;
        row0 = rank * base + (rank < rem ? rank : rem);
        row1 = row0 + base + (rank < rem ? 1 : 0);
    }

    static void read_dense(hid_t file, const std::string& path, int rank, int world, ShardReadResult& out) {
        auto dims = dataset_dims(file, path);
        if (dims.size() != 2) throw std::runtime_error("Dense features must be a 2D dataset: " + path);
        out.n_rows = (int64_t)dims[0];
        out.n_cols = (int64_t)dims[1];
        ShardReader::split_rows(out.n_rows, rank, world, out.row0, out.row1);

        std::vector<double> flat;
        int64_t width = 0;
        read_row_slice<double>(file, path, out.row0, out.row1 - out.row0, flat, width);

        out.dense.resize((size_t)(out.row1 - out.row0));
        for (size_t r = 0; r < out.dense.size(); ++r) {
            auto first = flat.begin() + (std::ptrdiff_t)(r * (size_t)width);
            out.dense[r].assign(first, first + (std::ptrdiff_t)width);
        }
    }

    static void read_csr(hid_t file, const std::string& group, MPI_Comm comm, int rank, int world,
        ShardReadResult& out)
    {
        for (const char* part : { "/indptr", "/indices", "/data" }) {
            if (!object_exists(file, group + part)) {
                throw std::runtime_error("Missing required dataset: " + group + part);
            }
        }

        const int64_t indptr_len = dataset_len_1d(file, group + "/indptr");
        if (indptr_len < 1) throw std::runtime_error(group + "/indptr must have length >= 1");

        int64_t n_rows = indptr_len - 1, n_cols = -1;
        const bool has_shape = try_read_csr_shape(file, group, n_rows, n_cols);
        if (n_rows != indptr_len - 1) {
            throw std::runtime_error(group + ": shape rows disagree with indptr length");
        }
        out.n_rows = n_rows;
        ShardReader::split_rows(n_rows, rank, world, out.row0, out.row1);

        // Local slice: rows [row0, row1] of indptr, then the matching nnz range.
        auto indptr = read_1d_slice<int64_t>(file, group + "/indptr", out.row0, out.row1 - out.row0 + 1);
        for (size_t r = 1; r < indptr.size(); ++r) {
            if (indptr[r] < indptr[r - 1]) {
                throw std::runtime_error(group + "/indptr is not non-decreasing at row "
                    + std::to_string(out.row0 + (int64_t)r - 1));
            }
        }
        const int64_t nnz0 = indptr.front();
        const int64_t nnz = indptr.back() - nnz0;
        if (nnz0 < 0
            || indptr.back() > dataset_len_1d(file, group + "/indices")
            || indptr.back() > dataset_len_1d(file, group + "/data")) {
            throw std::runtime_error(group + "/indptr points outside indices/data");
        }
        auto indices = read_1d_slice<int32_t>(file, group + "/indices", nnz0, nnz);
        auto data = read_1d_slice<double>(file, group + "/data", nnz0, nnz);

        if (!has_shape) {
            // Columns = global max index + 1
            long long local_max = -1;
            for (int32_t c : indices) local_max = std::max<long long>(local_max, c);
            long long global_max = -1;
            mpi_check(MPI_Allreduce(&local_max, &global_max, 1, MPI_LONG_LONG, MPI_MAX, comm), "Allreduce max column");
            n_cols = global_max + 1;
        }
        out.n_cols = n_cols;

        out.sparse.resize((size_t)(out.row1 - out.row0));
        for (size_t r = 0; r < out.sparse.size(); ++r) {
            const size_t s = (size_t)(indptr[r] - nnz0);
            const size_t e = (size_t)(indptr[r + 1] - nnz0);
            SparseRow& row = out.sparse[r];
            row.size = (int32_t)n_cols;
            row.indices.assign(indices.begin() + (std::ptrdiff_t)s, indices.begin() + (std::ptrdiff_t)e);
            row.values.assign(data.begin() + (std::ptrdiff_t)s, data.begin() + (std::ptrdiff_t)e);
        }
    }

    ShardReadResult ShardReader::read(const std::string& path, const BridgeConfig& cfg) {
        ShardReadResult out;

        hid_t file = open_file_with_mpi(path, comm_);
        try {
            if (!object_exists(file, cfg.features_dataset)) {
                throw std::runtime_error("Missing features " + cfg.features_dataset + " in " + path);
            }

            const H5I_type_t t = object_type(file, cfg.features_dataset);
            const bool is_group = (t == H5I_GROUP);
            if (cfg.input_format == "dense" && is_group) {
                throw std::runtime_error(cfg.features_dataset + " is a CSR group but input_format is \"dense\"");
            }
            if (cfg.input_format == "csr" && !is_group) {
                throw std::runtime_error(cfg.features_dataset + " is a dataset but input_format is \"csr\"");
            }

            if (is_group) {
                out.layout = ShardLayout::CSR;
                read_csr(file, cfg.features_dataset, comm_, rank_, world_, out);
            }
            else {
                out.layout = ShardLayout::Dense;
                read_dense(file, cfg.features_dataset, rank_, world_, out);
            }

            if (!cfg.label_dataset.empty() && object_exists(file, cfg.label_dataset)) {
                if (dataset_len_1d(file, cfg.label_dataset) != out.n_rows) {
                    throw std::runtime_error("Label length differs from row count: " + cfg.label_dataset);
                }
                out.labels_local = read_1d_slice<double>(file, cfg.label_dataset, out.row0, out.row1 - out.row0);
            }
            else if (rank_ == 0) {
                std::cerr << "[warn] " << cfg.label_dataset << " not found; shard has no labels\n";
            }
        }
        catch (...) {
            H5Fclose(file);
            throw;
        }

        H5Fclose(file);
        return out;
    }

} // namespace gbmbridge
