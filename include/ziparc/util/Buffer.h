// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <string_view>
#include <ziparc/alloc/Block.h>

namespace ziparc {

/// @brief A growable output buffer that writes little-endian integers.
///
class DynamicBuffer
{
public:
    explicit DynamicBuffer(size_t initialCapacity = 1024) :
        buf_(new uint8_t[initialCapacity > 0 ? initialCapacity : 16]),
        size_(0),
        capacity_(initialCapacity > 0 ? initialCapacity : 16)
    {
    }

    DynamicBuffer(const DynamicBuffer&) = delete;
    DynamicBuffer& operator=(const DynamicBuffer&) = delete;

    const uint8_t* data() const { return buf_.get(); }
    size_t size() const { return size_; }

    void putByte(uint8_t v)
    {
        ensureCapacity(1);
        buf_[size_++] = v;
    }

    void putUnsignedShort(uint16_t v)
    {
        ensureCapacity(2);
        uint8_t* p = buf_.get() + size_;
        p[0] = static_cast<uint8_t>(v);
        p[1] = static_cast<uint8_t>(v >> 8);
        size_ += 2;
    }

    void putUnsignedInt(uint32_t v)
    {
        ensureCapacity(4);
        uint8_t* p = buf_.get() + size_;
        p[0] = static_cast<uint8_t>(v);
        p[1] = static_cast<uint8_t>(v >> 8);
        p[2] = static_cast<uint8_t>(v >> 16);
        p[3] = static_cast<uint8_t>(v >> 24);
        size_ += 4;
    }

    void putBytes(const void* data, size_t len)
    {
        if (len == 0) return;
        ensureCapacity(len);
        std::memcpy(buf_.get() + size_, data, len);
        size_ += len;
    }

    void putBytes(std::string_view s)
    {
        putBytes(s.data(), s.size());
    }

    /// @brief Hands the written bytes over as a ByteBlock; the buffer
    /// is empty afterwards.
    ByteBlock takeBlock()
    {
        ByteBlock block(std::move(buf_), size_);
        capacity_ = 16;
        buf_.reset(new uint8_t[capacity_]);
        size_ = 0;
        return block;
    }

private:
    void ensureCapacity(size_t len)
    {
        if (size_ + len <= capacity_) return;
        size_t newCapacity = capacity_ * 2;
        if (newCapacity < size_ + len) newCapacity = size_ + len;
        std::unique_ptr<uint8_t[]> newBuf(new uint8_t[newCapacity]);
        if (size_) std::memcpy(newBuf.get(), buf_.get(), size_);
        buf_ = std::move(newBuf);
        capacity_ = newCapacity;
    }

    std::unique_ptr<uint8_t[]> buf_;
    size_t size_;
    size_t capacity_;
};

} // namespace ziparc
