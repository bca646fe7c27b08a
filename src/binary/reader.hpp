#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Strider::Binary {
class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data), offset_(0) {
    }

    uint8_t     read_uint8();
    uint16_t    read_uint16_be();
    uint32_t    read_uint32_be();
    uint64_t    read_uint64_be();
    double      read_double_be();
    std::string read_string(size_t length);

    // uint32 big-endian length followed by the bytes. Throws std::out_of_range
    // when the buffer is shorter than the announced length.
    std::string read_prefixed_string();

    bool eof() const {
        return offset_ >= data_.size();
    }

private:
    const std::vector<uint8_t>& data_;
    size_t                      offset_;
};
}  // namespace Strider::Binary
