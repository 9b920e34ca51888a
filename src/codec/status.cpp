#include "status.hpp"

const char* status_name(Status status) {
    switch (status) {
        case Status::Ok: return "ok";
        case Status::InvalidFormat: return "invalid format";
        case Status::UnsupportedFormat: return "unsupported format";
        case Status::InvalidParameter: return "invalid parameter";
        case Status::StreamError: return "stream error";
    }
    return "unknown";
}
