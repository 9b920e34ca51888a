#pragma once
#include <cstdint>
#include <string>
#include "codec/status.hpp"
#include "core/sample_buffer.hpp"

// Canonical PCM RIFF/WAVE (format tag 1): 8-bit unsigned, 16/24/32-bit
// signed little endian, 1..8 channels.
Status read_wav(const std::string& path, Core::SampleBuffer& out);

Status write_wav(const std::string& path, const Core::SampleBuffer& buffer);
