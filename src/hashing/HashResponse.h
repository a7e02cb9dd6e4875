#ifndef HASH_RESPONSE_H
#define HASH_RESPONSE_H

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

class HashResponse
{
public:
    std::string hash;   // hex of the final chain digest
    uint64_t timestamp; // ms since epoch
    std::string source;

    HashResponse();
    HashResponse(const std::string &hashHex, uint64_t timestampMs, const std::string &label);

    // runs the chain seeded with the current time
    static HashResponse compute();

    nlohmann::ordered_json toJSON() const;
    static HashResponse fromJSON(const nlohmann::json &j);

    static bool isValidHash(const std::string &hex);
};

#endif
