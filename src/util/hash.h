#pragma once

#include <array>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <boost/utility/string_view.hpp>

namespace httpsig { namespace util {

enum class hash_algorithm {
    sha256,
    sha512,
};


namespace hash_detail {

class HashImpl;
struct HashImplDeleter {
    void operator()(HashImpl*);
};

HashImpl* new_hash_impl(hash_algorithm);
void hash_impl_update(HashImpl&, const void*, size_t);
uint8_t* hash_impl_close(HashImpl&);

} // namespace hash_detail


/* Running hash over libgcrypt.
 *
 * Call `update` as many times as needed, then `close` to obtain the digest
 * as an array of bytes.  After `close` the object may be reused for a new
 * digest.
 */
template<hash_algorithm ALGORITHM, size_t DIGEST_LENGTH>
class Hash {
public:
    using digest_type = std::array<uint8_t, DIGEST_LENGTH>;

    Hash() {}

    inline void update(boost::string_view sv)
    {
        update(sv.data(), sv.size());
    }

    inline void update(const char* c)
    {
        update(boost::string_view(c));
    }

    inline void update(const std::string& data)
    {
        update(data.data(), data.size());
    }

    inline void update(const std::vector<unsigned char>& data)
    {
        update(data.data(), data.size());
    }

    inline digest_type close()
    {
        if (!impl) impl.reset(hash_detail::new_hash_impl(ALGORITHM));

        auto digest_buffer = hash_detail::hash_impl_close(*impl);

        digest_type result;
        std::memcpy(result.data(), digest_buffer, result.size());

        impl = nullptr;

        return result;
    }

    template<class... Args>
    static
    digest_type digest(const Args&... args)
    {
        Hash hash;
        int dummy[] = {0, (hash.update(args), 0)...};
        (void) dummy;
        return hash.close();
    }

    static constexpr size_t size() {
        return DIGEST_LENGTH;
    }

private:
    std::unique_ptr<hash_detail::HashImpl, hash_detail::HashImplDeleter> impl;

    inline void update(const void* buffer, size_t size)
    {
        if (!impl) impl.reset(hash_detail::new_hash_impl(ALGORITHM));
        hash_detail::hash_impl_update(*impl, buffer, size);
    }
};

using SHA256 = Hash<hash_algorithm::sha256, 32>;
using SHA512 = Hash<hash_algorithm::sha512, 64>;

template<class... Args>
inline
SHA256::digest_type sha256_digest(const Args&... args) {
    return SHA256::digest(args...);
}

template<class... Args>
inline
SHA512::digest_type sha512_digest(const Args&... args) {
    return SHA512::digest(args...);
}

// Digest length in bytes.
size_t digest_size(hash_algorithm);

// Digest of `data` with an algorithm chosen at run time,
// returned as raw bytes.
std::string digest(hash_algorithm, boost::string_view data);

}} // namespaces
