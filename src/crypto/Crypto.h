#ifndef CRYPTO_H
#define CRYPTO_H

#include <cstddef>
#include <string>

class Crypto {
public:
    static constexpr std::size_t DIGEST_SIZE = 32;

    // raw SHA-256: writes DIGEST_SIZE bytes into out
    static void sha256(const unsigned char *data, std::size_t len, unsigned char *out);

    // lowercase hex, two chars per byte
    static std::string toHex(const unsigned char *data, std::size_t len);

    // helper: sha256 hex of a string
    static std::string sha256_hex(const std::string &data);
};

#endif // CRYPTO_H
