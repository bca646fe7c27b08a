#ifndef STRIDER_BINARY_WRITER_HPP
#define STRIDER_BINARY_WRITER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace Strider::Binary {
class Writer {
public:
    explicit Writer(std::vector<uint8_t>& data) : data_(data) {
    }

    void write_uint8(uint8_t value);
    void write_uint16_be(uint16_t value);
    void write_uint32_be(uint32_t value);
    void write_uint64_be(uint64_t value);
    void write_double_be(double value);
    void write_string(const std::string& value);
    void write_prefixed_string(const std::string& value);

private:
    std::vector<uint8_t>& data_;
};
}  // namespace Strider::Binary

#endif  // STRIDER_BINARY_WRITER_HPP
