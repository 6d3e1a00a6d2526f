#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

/**
 * Zero-copy reference to a data buffer.
 * Borrowed views over chunk bytes are handed to the decoders as Slices; the
 * owner of the bytes must outlive the Slice.
 */
class Slice
{
private:
    const uint8_t* data_;
    size_t size_;

public:
    Slice() : data_(nullptr), size_(0)
    {
    }
    Slice(const uint8_t* data, size_t size) : data_(data), size_(size)
    {
    }
    explicit Slice(const std::vector<uint8_t>& bytes)
        : data_(bytes.data()), size_(bytes.size())
    {
    }

    const uint8_t*
    data() const
    {
        return data_;
    }
    size_t
    size() const
    {
        return size_;
    }
    bool
    empty() const
    {
        return size_ == 0;
    }

    // View starting at `offset`, clamped to the end of the slice
    Slice
    subslice(size_t offset) const
    {
        if (offset >= size_)
            return {data_ + size_, 0};
        return {data_ + offset, size_ - offset};
    }

    Slice
    subslice(size_t offset, size_t length) const
    {
        Slice tail = subslice(offset);
        return {tail.data(), length < tail.size() ? length : tail.size()};
    }

    std::vector<uint8_t>
    to_vector() const
    {
        return {data_, data_ + size_};
    }
};

/**
 * Utility function to convert a data slice to hexadecimal representation
 */
void
slice_hex(Slice sl, std::string& result);

/**
 * 32-byte transaction identifier, used both for bundle transactions and for
 * the ids listed in a bundle's entry table.
 */
class TransactionId
{
private:
    std::array<uint8_t, 32> data_;

public:
    TransactionId() : data_()
    {
        data_.fill(0);
    }
    explicit TransactionId(const std::array<uint8_t, 32>& data) : data_(data)
    {
    }
    explicit TransactionId(const uint8_t* data) : data_()
    {
        std::memcpy(data_.data(), data, 32);
    }

    const uint8_t*
    data() const
    {
        return data_.data();
    }
    static constexpr std::size_t
    size()
    {
        return 32;
    }

    Slice
    slice() const
    {
        return {data_.data(), size()};
    }

    bool
    operator==(const TransactionId& other) const
    {
        return data_ == other.data_;
    }
    bool
    operator!=(const TransactionId& other) const
    {
        return !(*this == other);
    }

    [[nodiscard]] std::string
    hex() const;
};
