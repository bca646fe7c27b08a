#include "writer.hpp"
#include <cstring>

namespace Strider::Binary {

namespace {
template <typename T>
void write_be_impl(std::vector<uint8_t>& data, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        data.push_back((value >> ((sizeof(T) - 1 - i) * 8)) & 0xFF);
    }
}
}  // namespace

void Writer::write_uint8(uint8_t value) {
    data_.push_back(value);
}

void Writer::write_uint16_be(uint16_t value) {
    write_be_impl(data_, value);
}

void Writer::write_uint32_be(uint32_t value) {
    write_be_impl(data_, value);
}

void Writer::write_uint64_be(uint64_t value) {
    write_be_impl(data_, value);
}

void Writer::write_double_be(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_uint64_be(bits);
}

void Writer::write_string(const std::string& value) {
    data_.insert(data_.end(), value.begin(), value.end());
}

void Writer::write_prefixed_string(const std::string& value) {
    write_uint32_be(static_cast<uint32_t>(value.size()));
    write_string(value);
}
}  // namespace Strider::Binary
