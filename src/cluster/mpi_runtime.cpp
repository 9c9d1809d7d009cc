#include "cluster/mpi_runtime.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace gbmbridge {

    static inline void mpi_check(int rc, const char* msg) {
        if (rc != MPI_SUCCESS) {
            throw std::runtime_error(std::string("MPI error: ") + msg);
        }
    }

    static inline size_t safe_strnlen(const char* s, size_t maxlen) {
        size_t n = 0;
        while (n < maxlen && s[n] != '\0') ++n;
        return n;
    }

    // ============================ MpiWorkerDirectory ============================

    MpiWorkerDirectory::MpiWorkerDirectory(MPI_Comm comm, int driver_rank)
        : comm_(comm), driver_rank_(driver_rank)
    {
        mpi_check(MPI_Comm_rank(comm_, &rank_), "Comm_rank");
        mpi_check(MPI_Comm_size(comm_, &world_), "Comm_size");
        if (driver_rank_ >= world_) {
            throw std::runtime_error("driver_rank " + std::to_string(driver_rank_)
                + " is outside the communicator (size " + std::to_string(world_) + ")");
        }

        char name[MPI_MAX_PROCESSOR_NAME] = { 0 };
        int len = 0;
        mpi_check(MPI_Get_processor_name(name, &len), "Get_processor_name");

        // Fixed-width exchange of host names
        std::vector<char> all((size_t)world_ * MPI_MAX_PROCESSOR_NAME, 0);
        mpi_check(MPI_Allgather(name, MPI_MAX_PROCESSOR_NAME, MPI_CHAR,
            all.data(), MPI_MAX_PROCESSOR_NAME, MPI_CHAR, comm_), "Allgather processor names");

        entries_.reserve((size_t)world_);
        for (int r = 0; r < world_; ++r) {
            const char* s = all.data() + (size_t)r * MPI_MAX_PROCESSOR_NAME;
            WorkerEntry e;
            e.worker_id = (r == driver_rank_) ? std::string(kDriverId) : std::to_string(r);
            e.host.assign(s, safe_strnlen(s, MPI_MAX_PROCESSOR_NAME));
            entries_.push_back(std::move(e));
        }
    }

    std::vector<WorkerEntry> MpiWorkerDirectory::list_entries() const {
        return entries_;
    }

    std::string MpiWorkerDirectory::current_worker_id() const {
        return entries_[(size_t)rank_].worker_id;
    }

    // ============================ LocalPartitionExecutor ============================

    LocalPartitionExecutor::LocalPartitionExecutor(std::string executor_id, int num_partitions, int first_partition)
        : executor_id_(std::move(executor_id)), num_partitions_(num_partitions), first_partition_(first_partition)
    {
        if (num_partitions_ < 1) throw std::runtime_error("num_partitions must be >= 1");
    }

    std::vector<std::string> LocalPartitionExecutor::map_partitions(const PartitionFn& fn) {
        const int n = num_partitions_;
        std::vector<std::string> out((size_t)n);
        std::vector<std::exception_ptr> errors((size_t)n);

#pragma omp parallel for schedule(dynamic, 1)
        for (int p = 0; p < n; ++p) {
            try {
                TaskContext ctx;
                ctx.executor_id = executor_id_;
                ctx.partition_index = first_partition_ + p;
                out[(size_t)p] = fn(ctx);
            }
            catch (...) {
                errors[(size_t)p] = std::current_exception();
            }
        }

        // First failing partition wins
        for (auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
        return out;
    }

    // ============================ MpiPartitionExecutor ============================

    static int rank_of(MPI_Comm comm) {
        int r = 0;
        mpi_check(MPI_Comm_rank(comm, &r), "Comm_rank");
        return r;
    }

    MpiPartitionExecutor::MpiPartitionExecutor(MPI_Comm comm, const WorkerDirectory& directory, int partitions_per_rank)
        : comm_(comm),
          rank_(rank_of(comm)),
          local_(directory.current_worker_id(), partitions_per_rank, rank_of(comm) * partitions_per_rank)
    {
        mpi_check(MPI_Comm_size(comm_, &world_), "Comm_size");
    }

    std::vector<std::string> MpiPartitionExecutor::map_partitions(const PartitionFn& fn) {
        // A failure on one rank must not leave the others blocked in the gather.
        std::vector<std::string> local;
        std::exception_ptr local_error;
        try {
            local = local_.map_partitions(fn);
        }
        catch (...) {
            local_error = std::current_exception();
        }

        int failed = local_error ? 1 : 0;
        int any_failed = 0;
        mpi_check(MPI_Allreduce(&failed, &any_failed, 1, MPI_INT, MPI_MAX, comm_), "Allreduce partition status");
        if (local_error) std::rethrow_exception(local_error);
        if (any_failed) throw std::runtime_error("Partition function failed on another rank");

        // Pack: item count, then item lengths, then bytes
        std::vector<int> lens;
        std::string bytes;
        lens.reserve(local.size());
        for (const auto& s : local) { lens.push_back((int)s.size()); bytes += s; }

        int n_local = (int)local.size();
        std::vector<int> n_items((size_t)world_, 0);
        mpi_check(MPI_Allgather(&n_local, 1, MPI_INT, n_items.data(), 1, MPI_INT, comm_), "Allgather item counts");

        std::vector<int> item_displs((size_t)world_, 0);
        for (int r = 1; r < world_; ++r) item_displs[(size_t)r] = item_displs[(size_t)r - 1] + n_items[(size_t)r - 1];
        const int n_total = item_displs.back() + n_items.back();

        std::vector<int> all_lens((size_t)n_total, 0);
        mpi_check(MPI_Allgatherv(lens.data(), n_local, MPI_INT,
            all_lens.data(), n_items.data(), item_displs.data(), MPI_INT, comm_), "Allgatherv item lengths");

        std::vector<int> byte_counts((size_t)world_, 0);
        for (int r = 0; r < world_; ++r) {
            for (int i = 0; i < n_items[(size_t)r]; ++i) {
                byte_counts[(size_t)r] += all_lens[(size_t)(item_displs[(size_t)r] + i)];
            }
        }
        std::vector<int> byte_displs((size_t)world_, 0);
        for (int r = 1; r < world_; ++r) byte_displs[(size_t)r] = byte_displs[(size_t)r - 1] + byte_counts[(size_t)r - 1];
        const int bytes_total = byte_displs.back() + byte_counts.back();

        std::vector<char> all_bytes((size_t)bytes_total + 1, 0);
        mpi_check(MPI_Allgatherv(bytes.data(), (int)bytes.size(), MPI_CHAR,
            all_bytes.data(), byte_counts.data(), byte_displs.data(), MPI_CHAR, comm_), "Allgatherv item bytes");

        std::vector<std::string> out;
        out.reserve((size_t)n_total);
        size_t pos = 0;
        for (int i = 0; i < n_total; ++i) {
            out.emplace_back(all_bytes.data() + pos, (size_t)all_lens[(size_t)i]);
            pos += (size_t)all_lens[(size_t)i];
        }
        return out;
    }

} // namespace gbmbridge
