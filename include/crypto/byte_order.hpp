#ifndef DEEPZOOM_BYTE_ORDER_HPP
#define DEEPZOOM_BYTE_ORDER_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include <boost/endian/conversion.hpp>

namespace deepzoom::crypto {

class ByteOrder {
public:
    // Reads a big endian u32 starting at data
    static uint32_t readBigU32(const uint8_t* data) {
        return boost::endian::load_big_u32(data);
    }

    // Reads a little endian u32 starting at data
    static uint32_t readLittleU32(const uint8_t* data) {
        return boost::endian::load_little_u32(data);
    }

    // Appends value to out in big endian order
    static void appendBigU32(std::vector<uint8_t>& out, uint32_t value) {
        uint8_t bytes[sizeof(uint32_t)];
        boost::endian::store_big_u32(bytes, value);
        out.insert(out.end(), bytes, bytes + sizeof(bytes));
    }

    // Appends value to out in little endian order
    static void appendLittleU32(std::vector<uint8_t>& out, uint32_t value) {
        uint8_t bytes[sizeof(uint32_t)];
        boost::endian::store_little_u32(bytes, value);
        out.insert(out.end(), bytes, bytes + sizeof(bytes));
    }
};

} // namespace deepzoom::crypto

#endif // DEEPZOOM_BYTE_ORDER_HPP
