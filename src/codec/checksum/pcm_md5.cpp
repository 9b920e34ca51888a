#include "pcm_md5.hpp"
#include <openssl/evp.h>
#include "utils/logger.hpp"

void PcmMd5::ContextDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

PcmMd5::PcmMd5() : finalized(false) {
    this->reset();
}

bool PcmMd5::reset() {
    this->ctx.reset(EVP_MD_CTX_new());
    this->finalized = false;
    if (!this->ctx) {
        WAVIFY_DEBUG_LOG("[md5] failed to create digest context\n");
        return false;
    }
    if (!EVP_DigestInit_ex(this->ctx.get(), EVP_md5(), nullptr)) {
        WAVIFY_DEBUG_LOG("[md5] failed to initialize digest\n");
        this->ctx.reset();
        return false;
    }
    return true;
}

Status PcmMd5::update(const int32_t* samples, size_t count, uint8_t bit_depth) {
    if (bit_depth != 8 && bit_depth != 16 && bit_depth != 24 && bit_depth != 32) {
        WAVIFY_DEBUG_LOG("[md5] unsupported bit depth " << static_cast<int>(bit_depth) << "\n");
        return Status::UnsupportedFormat;
    }
    if (!this->ctx || this->finalized) {
        WAVIFY_DEBUG_LOG("[md5] update on an unusable context\n");
        return Status::InvalidParameter;
    }
    if (count == 0) return Status::Ok;

    const size_t width = bit_depth / 8u;
    this->scratch.resize(count * width);
    uint8_t* dst = this->scratch.data();
    for (size_t i = 0; i < count; ++i) {
        uint32_t v = static_cast<uint32_t>(samples[i]);
        for (size_t b = 0; b < width; ++b) {
            *dst++ = static_cast<uint8_t>((v >> (8 * b)) & 0xFFu);
        }
    }

    if (!EVP_DigestUpdate(this->ctx.get(), this->scratch.data(), this->scratch.size())) {
        WAVIFY_DEBUG_LOG("[md5] digest update failed\n");
        return Status::StreamError;
    }
    return Status::Ok;
}

Status PcmMd5::update(const std::vector<int32_t>& samples, uint8_t bit_depth) {
    return this->update(samples.data(), samples.size(), bit_depth);
}

bool PcmMd5::finalize(uint8_t out[16]) {
    if (!this->ctx || this->finalized) return false;

    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(this->ctx.get(), out, &len) || len != 16) {
        WAVIFY_DEBUG_LOG("[md5] digest finalize failed (len " << len << ")\n");
        return false;
    }
    this->finalized = true;
    return true;
}

std::string PcmMd5::hex(const uint8_t digest[16]) {
    static const char kDigits[] = "0123456789abcdef";
    std::string s;
    s.reserve(32);
    for (int i = 0; i < 16; ++i) {
        s.push_back(kDigits[digest[i] >> 4]);
        s.push_back(kDigits[digest[i] & 0x0F]);
    }
    return s;
}
