#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "codec/status.hpp"

struct evp_md_ctx_st;

// Running MD5 over interleaved PCM samples packed little-endian at their
// byte width (1, 2, 3 or 4 bytes, two's complement).
class PcmMd5 {
public:
    PcmMd5();

    // Drops any running state and starts a fresh digest.
    bool reset();

    Status update(const int32_t* samples, size_t count, uint8_t bit_depth);
    Status update(const std::vector<int32_t>& samples, uint8_t bit_depth);

    // Writes the digest and leaves the object finalized until reset().
    bool finalize(uint8_t out[16]);

    static std::string hex(const uint8_t digest[16]);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx;
    std::vector<uint8_t> scratch;
    bool finalized;
};
