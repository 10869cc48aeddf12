#pragma once
#include <sodium.h>
#include <stdexcept>
#include <cstddef>
#include <cstring>
#include <string>

// Guarded, locked heap memory for master passwords and the derived key.
// Zero-length buffers own no allocation.
class SecureBuffer {
public:
    SecureBuffer() = default;

    explicit SecureBuffer(size_t size)
        : size_(size)
    {
        if (size_ == 0) return;

        ptr_ = static_cast<unsigned char*>(sodium_malloc(size_));
        if (!ptr_) {
            throw std::runtime_error("SecureBuffer: sodium_malloc failed");
        }

        if (sodium_mlock(ptr_, size_) != 0) {
            sodium_free(ptr_);
            ptr_ = nullptr;
            throw std::runtime_error("SecureBuffer: sodium_mlock failed");
        }

        sodium_memzero(ptr_, size_);
    }

    SecureBuffer(const char* src, size_t len)
        : SecureBuffer(len)
    {
        if (len) std::memcpy(ptr_, src, len);
    }

    // Non-copyable
    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept
        : ptr_(other.ptr_), size_(other.size_)
    {
        other.ptr_ = nullptr;
        other.size_ = 0;
    }

    SecureBuffer& operator=(SecureBuffer&& other) noexcept {
        if (this != &other) {
            release();
            ptr_ = other.ptr_;
            size_ = other.size_;
            other.ptr_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    ~SecureBuffer() {
        release();
    }

    unsigned char* data() { return ptr_; }
    const unsigned char* data() const { return ptr_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    // Copy out into pageable memory; caller wipes the result.
    std::string str() const {
        if (!ptr_) return std::string();
        return std::string(reinterpret_cast<const char*>(ptr_), size_);
    }

    // constant time for equal lengths
    bool equals(const SecureBuffer& other) const {
        if (size_ != other.size_) return false;
        if (size_ == 0) return true;
        return sodium_memcmp(ptr_, other.ptr_, size_) == 0;
    }

    // false when the page protection could not be changed; release() undoes it
    bool protect_readonly() { return !ptr_ || sodium_mprotect_readonly(ptr_) == 0; }

private:
    unsigned char* ptr_ = nullptr;
    size_t size_ = 0;

    void release() {
        if (ptr_) {
            // the wipe below needs the region writable again
            (void)sodium_mprotect_readwrite(ptr_);
            sodium_memzero(ptr_, size_);
            sodium_munlock(ptr_, size_);
            sodium_free(ptr_);
            ptr_ = nullptr;
            size_ = 0;
        }
    }
};
