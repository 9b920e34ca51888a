#pragma once
#include <cstdint>

// Outcome of every fallible codec operation.
//   InvalidFormat     - malformed or inconsistent data
//   UnsupportedFormat - well formed, but a feature this codec does not implement
//   InvalidParameter  - caller input rejected before any I/O
//   StreamError       - the I/O target is missing a capability or failed
enum class Status : uint8_t {
    Ok = 0,
    InvalidFormat,
    UnsupportedFormat,
    InvalidParameter,
    StreamError
};

const char* status_name(Status status);

inline bool is_ok(Status status) {
    return status == Status::Ok;
}
