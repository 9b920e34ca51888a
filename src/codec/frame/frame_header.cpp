#include "frame_header.hpp"
#include "utils/logger.hpp"

namespace {

constexpr uint32_t kBlockSizeTable[16] = {
    0, 192, 576, 1152, 2304, 4608, 0, 0,
    256, 512, 1024, 2048, 4096, 8192, 16384, 32768
};

constexpr uint32_t kSampleRateTable[12] = {
    0, 88200, 176400, 192000, 8000, 16000, 22050, 24000, 32000, 44100, 48000, 96000
};

// 0 marks codes without a fixed size.
constexpr uint8_t kSampleSizeTable[8] = {0, 8, 12, 0, 16, 20, 24, 0};

int bit_length(uint64_t v) {
    int n = 0;
    while (v) {
        ++n;
        v >>= 1;
    }
    return n;
}

int utf8_payload_capacity(int length) {
    return (7 - length) + 6 * (length - 1);
}

} // namespace

Status FrameHeader::write_utf8_uint(BitWriter& w, uint64_t value) {
    if (value <= 0x7F) {
        w.write_bits(value, 8);
        return Status::Ok;
    }

    const int bits = bit_length(value);
    int length = 2;
    while (length <= 7 && utf8_payload_capacity(length) < bits) {
        ++length;
    }
    if (length > 7) {
        WAVIFY_DEBUG_LOG("[frame] frame number " << value << " too large to encode\n");
        return Status::UnsupportedFormat;
    }

    const uint32_t prefix = ((1u << length) - 1u) << (8 - length);
    w.write_bits(prefix | (value >> (6 * (length - 1))), 8);
    for (int i = length - 2; i >= 0; --i) {
        w.write_bits(0x80u | ((value >> (6 * i)) & 0x3Fu), 8);
    }
    return Status::Ok;
}

Status FrameHeader::read_utf8_uint(BitReader& r, uint64_t& value) {
    const uint32_t first = static_cast<uint32_t>(r.read_bits(8));
    if (r.has_error()) return Status::InvalidFormat;

    if ((first & 0x80u) == 0) {
        value = first;
        return Status::Ok;
    }

    int length = 0;
    uint32_t mask = 0x80;
    while (mask && (first & mask)) {
        ++length;
        mask >>= 1;
    }
    if (length < 2 || length > 7) {
        WAVIFY_DEBUG_LOG("[frame] invalid UTF-8 integer lead byte 0x" << std::hex << first << std::dec << "\n");
        return Status::InvalidFormat;
    }

    value = first & ((1u << (7 - length)) - 1u);
    for (int i = 1; i < length; ++i) {
        const uint32_t byte = static_cast<uint32_t>(r.read_bits(8));
        if (r.has_error()) return Status::InvalidFormat;
        if ((byte & 0xC0u) != 0x80u) {
            WAVIFY_DEBUG_LOG("[frame] invalid UTF-8 continuation byte 0x" << std::hex << byte << std::dec << "\n");
            return Status::InvalidFormat;
        }
        value = (value << 6) | (byte & 0x3Fu);
    }
    return Status::Ok;
}

Status FrameHeader::write(BitWriter& w) const {
    if (this->block_size == 0) return Status::InvalidParameter;
    if (this->block_size > Frame::kMaxBlockSize) {
        WAVIFY_DEBUG_LOG("[frame] block size " << this->block_size << " exceeds " << Frame::kMaxBlockSize << "\n");
        return Status::UnsupportedFormat;
    }
    if (this->channels < 1 || this->channels > 8) return Status::UnsupportedFormat;

    const bool small_block = this->block_size <= 256;

    w.write_bits(Frame::kSyncCode, 14);
    w.write_bits(0, 1); // reserved
    w.write_bits(0, 1); // fixed blocksize
    w.write_bits(small_block ? 6u : 7u, 4);
    w.write_bits(0, 4); // sample rate from STREAMINFO
    w.write_bits(static_cast<uint32_t>(this->channels - 1), 4);
    w.write_bits(0, 3); // sample size from STREAMINFO
    w.write_bits(0, 1); // reserved

    Status st = write_utf8_uint(w, this->frame_number);
    if (st != Status::Ok) return st;

    w.write_bits(this->block_size - 1u, small_block ? 8 : 16);
    return Status::Ok;
}

Status FrameHeader::read(BitReader& r, uint32_t stream_sample_rate, uint8_t stream_bit_depth, uint16_t stream_channels) {
    const uint32_t sync = static_cast<uint32_t>(r.read_bits(14));
    if (r.has_error()) return Status::InvalidFormat;
    if (sync != Frame::kSyncCode) {
        WAVIFY_DEBUG_LOG("[frame] bad sync code 0x" << std::hex << sync << std::dec << "\n");
        return Status::InvalidFormat;
    }
    if (r.read_bits(1) != 0) {
        WAVIFY_DEBUG_LOG("[frame] reserved header bit set\n");
        return Status::InvalidFormat;
    }
    if (r.read_bits(1) != 0) {
        WAVIFY_DEBUG_LOG("[frame] variable blocksize frames not supported\n");
        return Status::UnsupportedFormat;
    }

    this->block_size_code = static_cast<uint8_t>(r.read_bits(4));
    this->sample_rate_code = static_cast<uint8_t>(r.read_bits(4));
    this->channel_assignment = static_cast<uint8_t>(r.read_bits(4));
    this->sample_size_code = static_cast<uint8_t>(r.read_bits(3));
    if (r.read_bits(1) != 0) {
        WAVIFY_DEBUG_LOG("[frame] reserved header bit set\n");
        return Status::InvalidFormat;
    }
    if (r.has_error()) return Status::InvalidFormat;

    Status st = read_utf8_uint(r, this->frame_number);
    if (st != Status::Ok) return st;

    if (this->block_size_code == 0) {
        WAVIFY_DEBUG_LOG("[frame] reserved block size code 0\n");
        return Status::InvalidFormat;
    } else if (this->block_size_code == 6) {
        this->block_size = static_cast<uint32_t>(r.read_bits(8)) + 1u;
    } else if (this->block_size_code == 7) {
        this->block_size = static_cast<uint32_t>(r.read_bits(16)) + 1u;
    } else {
        this->block_size = kBlockSizeTable[this->block_size_code];
    }

    if (this->sample_rate_code == 0) {
        this->sample_rate = stream_sample_rate;
    } else if (this->sample_rate_code <= 11) {
        this->sample_rate = kSampleRateTable[this->sample_rate_code];
    } else if (this->sample_rate_code == 12) {
        this->sample_rate = static_cast<uint32_t>(r.read_bits(8)) * 1000u;
    } else if (this->sample_rate_code == 13) {
        this->sample_rate = static_cast<uint32_t>(r.read_bits(16));
    } else if (this->sample_rate_code == 14) {
        this->sample_rate = static_cast<uint32_t>(r.read_bits(16)) * 10u;
    } else {
        WAVIFY_DEBUG_LOG("[frame] unsupported sample rate code " << static_cast<int>(this->sample_rate_code) << "\n");
        return Status::UnsupportedFormat;
    }

    if (this->sample_size_code == 0) {
        this->sample_size = stream_bit_depth;
    } else if (kSampleSizeTable[this->sample_size_code] != 0) {
        this->sample_size = kSampleSizeTable[this->sample_size_code];
    } else {
        WAVIFY_DEBUG_LOG("[frame] unsupported sample size code " << static_cast<int>(this->sample_size_code) << "\n");
        return Status::UnsupportedFormat;
    }

    this->crc8 = static_cast<uint8_t>(r.read_bits(8));
    if (r.has_error()) {
        WAVIFY_DEBUG_LOG("[frame] truncated frame header\n");
        return Status::InvalidFormat;
    }

    if (this->channel_assignment < Frame::kLeftSide) {
        this->channels = static_cast<uint8_t>(this->channel_assignment + 1);
        if (this->channels != stream_channels) {
            WAVIFY_DEBUG_LOG("[frame] frame has " << static_cast<int>(this->channels)
                             << " channels, stream has " << stream_channels << "\n");
            return Status::InvalidFormat;
        }
    } else if (this->channel_assignment <= Frame::kMidSide) {
        if (stream_channels != 2) {
            WAVIFY_DEBUG_LOG("[frame] stereo decorrelation on a " << stream_channels << " channel stream\n");
            return Status::InvalidFormat;
        }
        this->channels = 2;
    } else {
        WAVIFY_DEBUG_LOG("[frame] reserved channel assignment " << static_cast<int>(this->channel_assignment) << "\n");
        return Status::InvalidFormat;
    }

    return Status::Ok;
}

uint8_t FrameHeader::subframe_sample_size(size_t index) const {
    switch (this->channel_assignment) {
        case Frame::kLeftSide:
        case Frame::kMidSide:
            return static_cast<uint8_t>(this->sample_size + (index == 1 ? 1 : 0));
        case Frame::kSideRight:
            return static_cast<uint8_t>(this->sample_size + (index == 0 ? 1 : 0));
        default:
            return this->sample_size;
    }
}
