#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// DataStream -- primary serialization stream backed by std::vector<uint8_t>
// ---------------------------------------------------------------------------
// Append-only writes plus a sequential read cursor.  Reads past the end
// throw std::runtime_error; loaders translate that into STORAGE_CORRUPT.
// ---------------------------------------------------------------------------
class DataStream {
public:
    // -- Construction -------------------------------------------------------

    DataStream() = default;

    explicit DataStream(std::vector<uint8_t> data)
        : buf_(std::move(data)) {}

    explicit DataStream(std::span<const uint8_t> data)
        : buf_(data.begin(), data.end()) {}

    // -- Write interface ----------------------------------------------------

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    // -- Read interface -----------------------------------------------------

    void read(std::span<uint8_t> buf) {
        if (read_pos_ + buf.size() > buf_.size()) {
            throw std::runtime_error(
                "DataStream::read(): attempted read past end of stream");
        }
        std::memcpy(buf.data(), buf_.data() + read_pos_, buf.size());
        read_pos_ += buf.size();
    }

    // -- Size / position queries --------------------------------------------

    /// Total number of bytes in the underlying buffer.
    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }

    /// Number of bytes remaining from the current read position to the end.
    [[nodiscard]] size_t remaining() const noexcept {
        return buf_.size() - read_pos_;
    }

    /// True when the buffer contains no data at all.
    [[nodiscard]] bool empty() const noexcept { return remaining() == 0; }

    /// True when the read cursor has reached the end of the buffer.
    [[nodiscard]] bool eof() const noexcept {
        return read_pos_ >= buf_.size();
    }

    // -- Raw access ---------------------------------------------------------

    [[nodiscard]] const uint8_t* data() const noexcept {
        return buf_.data();
    }

    /// Return a view of the data from the current read position onward.
    [[nodiscard]] std::span<const uint8_t> view() const noexcept {
        return std::span<const uint8_t>(
            buf_.data() + read_pos_, buf_.size() - read_pos_);
    }

    /// Move the internal buffer out.  Resets the stream to empty state.
    [[nodiscard]] std::vector<uint8_t> release() {
        read_pos_ = 0;
        return std::move(buf_);
    }

private:
    std::vector<uint8_t> buf_;
    size_t               read_pos_ = 0;
};

}  // namespace core
