#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace objfs {

// A read-only view over contiguous bytes, similar to
// std::span<const std::uint8_t>. Does not own the bytes.
class bytes_view {
public:
    bytes_view() : data_(nullptr), size_(0) {}

    bytes_view(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    bytes_view(const std::vector<std::uint8_t>& vec) : data_(vec.data()), size_(vec.size()) {}

    const std::uint8_t* data() const { return data_; }
    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    const std::uint8_t* begin() const { return data_; }
    const std::uint8_t* end() const { return data_ + size_; }

    // Clamped to the bounds of this view.
    bytes_view subview(std::size_t offset, std::size_t count) const {
        if (offset >= size_) {
            return bytes_view(data_ + size_, 0);
        }
        std::size_t avail = size_ - offset;
        return bytes_view(data_ + offset, count < avail ? count : avail);
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
};

} // namespace objfs
