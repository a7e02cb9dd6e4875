#include "HashResponse.h"
#include "HashChain.h"
#include "../config/Config.h"
#include "../crypto/Crypto.h"
#include <chrono>

HashResponse::HashResponse() : hash(""), timestamp(0), source("") {}

HashResponse::HashResponse(const std::string &hashHex, uint64_t timestampMs, const std::string &label)
    : hash(hashHex), timestamp(timestampMs), source(label)
{
}

HashResponse HashResponse::compute()
{
    long long nanos = (long long)(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                      std::chrono::system_clock::now().time_since_epoch())
                                      .count());

    Digest digest = HashChain::run(HashChain::makeSeed(nanos));

    // timestamp is taken after the work, at response construction
    uint64_t millis = (uint64_t)(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());

    return HashResponse(Crypto::toHex(digest.data(), digest.size()), millis, SOURCE_LABEL);
}

nlohmann::ordered_json HashResponse::toJSON() const
{
    nlohmann::ordered_json j;
    j["hash"] = hash;
    j["timestamp"] = timestamp;
    j["source"] = source;
    return j;
}

// throws nlohmann::json::exception on missing keys or wrong types
HashResponse HashResponse::fromJSON(const nlohmann::json &j)
{
    return HashResponse(j.at("hash").get<std::string>(),
                        j.at("timestamp").get<uint64_t>(),
                        j.at("source").get<std::string>());
}

bool HashResponse::isValidHash(const std::string &hex)
{
    if (hex.size() != Crypto::DIGEST_SIZE * 2)
        return false;

    for (char c : hex)
    {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower)
            return false;
    }
    return true;
}
