#include "random.h"
#include "bytes.h"

#include <array>

extern "C" {
#include "gcrypt.h"
}

namespace httpsig { namespace util { namespace random {

void data(void* data, unsigned int size)
{
    ::gcry_create_nonce(data, size);
}

std::string uuid_v4()
{
    std::array<uint8_t, 16> b;
    data(b.data(), b.size());

    b[6] = (b[6] & 0x0f) | 0x40;  // version 4
    b[8] = (b[8] & 0x3f) | 0x80;  // RFC 4122 variant

    auto hex = bytes::to_hex(b);

    return hex.substr(0, 8)  + '-'
         + hex.substr(8, 4)  + '-'
         + hex.substr(12, 4) + '-'
         + hex.substr(16, 4) + '-'
         + hex.substr(20);
}

}}} // namespaces
