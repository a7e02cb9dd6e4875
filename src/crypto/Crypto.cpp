#include "Crypto.h"
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

static_assert(Crypto::DIGEST_SIZE == SHA256_DIGEST_LENGTH, "digest size must match SHA-256");

void Crypto::sha256(const unsigned char *data, std::size_t len, unsigned char *out)
{
    SHA256(data, len, out);
}

std::string Crypto::toHex(const unsigned char *data, std::size_t len)
{
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; i++)
        ss << std::setw(2) << (int)data[i];
    return ss.str();
}

std::string Crypto::sha256_hex(const std::string &data)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    sha256((const unsigned char *)data.data(), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}
