#ifndef HASH_CHAIN_H
#define HASH_CHAIN_H

#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include "../crypto/Crypto.h"

typedef std::array<unsigned char, Crypto::DIGEST_SIZE> Digest;

// digest function: (input, input length, output of Crypto::DIGEST_SIZE bytes)
typedef std::function<void(const unsigned char *, std::size_t, unsigned char *)> DigestFn;

class HashChain
{
public:
    static Digest run(const std::string &seed, int iterations, const DigestFn &digest);
    static Digest run(const std::string &seed);

    static std::string makeSeed(long long nanos);
};

#endif
