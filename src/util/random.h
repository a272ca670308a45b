#pragma once

#include <string>

namespace httpsig { namespace util { namespace random {

// Cryptographically strong bytes from libgcrypt's nonce generator.
void data(void*, unsigned int);

// Random (version 4) UUID in lowercase canonical text form,
// e.g. "3fa85f64-5717-4562-b3fc-2c963f66afa6".
std::string uuid_v4();

}}} // namespace
