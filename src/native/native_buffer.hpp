#pragma once
#include <cstddef>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include "native/engine.hpp"

namespace gbmbridge {

    // Engine-allocated flat array, released through the engine when the owner
    // goes out of scope. Move-only.
    template <typename T>
    class NativeBuffer {
        static_assert(std::is_same<T, double>::value || std::is_same<T, int32_t>::value,
            "NativeBuffer supports double and int32_t");

    public:
        NativeBuffer(NativeEngine& engine, std::size_t n) : engine_(&engine), size_(n) {
            if constexpr (std::is_same<T, double>::value) data_ = engine.new_double_array(n);
            else                                            data_ = engine.new_int_array(n);
            if (data_ == nullptr && n > 0) throw std::bad_alloc();
        }

        ~NativeBuffer() { release(); }

        NativeBuffer(const NativeBuffer&) = delete;
        NativeBuffer& operator=(const NativeBuffer&) = delete;

        NativeBuffer(NativeBuffer&& other) noexcept
            : engine_(other.engine_), data_(std::exchange(other.data_, nullptr)),
              size_(std::exchange(other.size_, 0)) {}

        NativeBuffer& operator=(NativeBuffer&& other) noexcept {
            if (this != &other) {
                release();
                engine_ = other.engine_;
                data_ = std::exchange(other.data_, nullptr);
                size_ = std::exchange(other.size_, 0);
            }
            return *this;
        }

        T* data() { return data_; }
        const T* data() const { return data_; }
        std::size_t size() const { return size_; }

        T& operator[](std::size_t i) { return data_[i]; }
        const T& operator[](std::size_t i) const { return data_[i]; }

    private:
        void release() noexcept {
            if (data_ == nullptr) return;
            if constexpr (std::is_same<T, double>::value) engine_->delete_double_array(data_);
            else                                            engine_->delete_int_array(data_);
            data_ = nullptr;
        }

        NativeEngine* engine_;
        T* data_ = nullptr;
        std::size_t size_ = 0;
    };

    using NativeDoubleBuffer = NativeBuffer<double>;
    using NativeIntBuffer = NativeBuffer<int32_t>;

} // namespace gbmbridge
