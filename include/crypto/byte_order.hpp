#ifndef ENCSTREAM_CRYPTO_BYTE_ORDER_HPP
#define ENCSTREAM_CRYPTO_BYTE_ORDER_HPP

#include <cstdint>
#include <cstring>
#include <boost/endian/conversion.hpp>

namespace encstream::crypto {

// Little-endian load/store helpers for the wire format. All multi-byte
// integers in the header and the nonce counter are little-endian.
class ByteOrder {
public:
    template<typename T>
    static void storeLittle(uint8_t* out, T value) {
        T little = boost::endian::native_to_little(value);
        std::memcpy(out, &little, sizeof(T));
    }

    template<typename T>
    static T loadLittle(const uint8_t* in) {
        T little;
        std::memcpy(&little, in, sizeof(T));
        return boost::endian::little_to_native(little);
    }
};

} // namespace encstream::crypto

#endif // ENCSTREAM_CRYPTO_BYTE_ORDER_HPP
