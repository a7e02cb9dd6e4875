#include "HashChain.h"
#include "../config/Config.h"

/**
 * @brief Runs the chained digest used as the fixed unit of work behind /hash.
 *
 * The seed string is digested once, then the raw 32 digest bytes are fed back
 * into the digest function (iterations - 1) more times. With HASH_ITERATIONS
 * that is 100 digest calls for every request, whatever the seed.
 *
 * @param seed       bytes of the first digest input, e.g. "input-1718000000000000000"
 * @param iterations total number of digest calls, at least 1
 * @param digest     digest function; Crypto::sha256 in production
 *
 * @return the output of the last digest call
 */
Digest HashChain::run(const std::string &seed, int iterations, const DigestFn &digest)
{
    Digest current;
    digest((const unsigned char *)seed.data(), seed.size(), current.data());

    Digest next;
    for (int i = 1; i < iterations; i++)
    {
        digest(current.data(), current.size(), next.data());
        current = next;
    }

    return current;
}

Digest HashChain::run(const std::string &seed)
{
    return run(seed, HASH_ITERATIONS, &Crypto::sha256);
}

std::string HashChain::makeSeed(long long nanos)
{
    return std::string(HASH_SEED_PREFIX) + std::to_string(nanos);
}
