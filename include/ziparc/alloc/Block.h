// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <string_view>

namespace ziparc {

/// @brief An owned, fixed-size array of elements.
/// Move-only; the size is fixed at construction.
template<typename T>
class Block
{
public:
    Block() : size_(0) {}
    Block(std::unique_ptr<T[]>&& data, size_t size) :
        data_(std::move(data)), size_(size) {}
    explicit Block(size_t size) :
        data_(new T[size]), size_(size) {}

    Block(Block&& other) noexcept :
        data_(std::move(other.data_)), size_(other.size_)
    {
        other.size_ = 0;
    }

    Block& operator=(Block&& other) noexcept
    {
        data_ = std::move(other.data_);
        size_ = other.size_;
        other.size_ = 0;
        return *this;
    }

    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;

    static Block copyOf(const T* data, size_t size)
    {
        Block block(size);
        if (size) std::memcpy(block.data(), data, size * sizeof(T));
        return block;
    }

    T* data() { return data_.get(); }
    const T* data() const { return data_.get(); }
    size_t size() const { return size_; }

    T& operator[](size_t n) { return data_[n]; }
    const T& operator[](size_t n) const { return data_[n]; }

    const T* begin() const { return data_.get(); }
    const T* end() const { return data_.get() + size_; }

private:
    std::unique_ptr<T[]> data_;
    size_t size_;
};

using ByteBlock = Block<uint8_t>;

inline ByteBlock toByteBlock(std::string_view s)
{
    return ByteBlock::copyOf(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

inline std::string_view asStringView(const ByteBlock& block)
{
    return { reinterpret_cast<const char*>(block.data()), block.size() };
}

inline bool operator==(const ByteBlock& a, const ByteBlock& b)
{
    return asStringView(a) == asStringView(b);
}

} // namespace ziparc
