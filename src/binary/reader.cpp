#include "reader.hpp"
#include <cstring>

namespace Strider::Binary {

namespace {
template <typename T>
T read_be_impl(const std::vector<uint8_t>& data, size_t& offset) {
    if (offset + sizeof(T) > data.size()) {
        throw std::out_of_range("Attempt to read past end of buffer.");
    }
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | data[offset + i]);
    }
    offset += sizeof(T);
    return value;
}
}  // namespace

uint8_t Reader::read_uint8() {
    if (offset_ >= data_.size()) {
        throw std::out_of_range("Attempt to read past end of buffer.");
    }
    return data_[offset_++];
}

uint16_t Reader::read_uint16_be() {
    return read_be_impl<uint16_t>(data_, offset_);
}

uint32_t Reader::read_uint32_be() {
    return read_be_impl<uint32_t>(data_, offset_);
}

uint64_t Reader::read_uint64_be() {
    return read_be_impl<uint64_t>(data_, offset_);
}

double Reader::read_double_be() {
    uint64_t bits = read_uint64_be();
    double   value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::string Reader::read_string(size_t length) {
    if (offset_ + length > data_.size())
        length = data_.size() - offset_;
    std::string s(reinterpret_cast<const char*>(data_.data() + offset_), length);
    offset_ += length;
    return s;
}

std::string Reader::read_prefixed_string() {
    uint32_t length = read_uint32_be();
    if (offset_ + length > data_.size()) {
        throw std::out_of_range("String length exceeds buffer.");
    }
    return read_string(length);
}
}  // namespace Strider::Binary
