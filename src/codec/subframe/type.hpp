#pragma once
#include <cstdint>
#include "codec/subframe/constants.hpp"

namespace Subframe {

struct Type {
    enum class Kind : uint8_t {
        Constant,
        Verbatim,
        Fixed,
        Lpc,
        Unsupported
    };

    Kind kind;
    uint32_t order;

    Type() : kind(Kind::Unsupported), order(0) {}
    Type(Kind kind, uint32_t order) : kind(kind), order(order) {}

    static Type from_code(uint32_t code) {
        if (code == TYPE_CONSTANT) return Type(Kind::Constant, 0);
        if (code == TYPE_VERBATIM) return Type(Kind::Verbatim, 0);
        if (code >= TYPE_FIXED_BASE && code <= TYPE_FIXED_LAST) return Type(Kind::Fixed, code - TYPE_FIXED_BASE);
        if (code >= TYPE_LPC_BASE && code <= TYPE_LPC_LAST) return Type(Kind::Lpc, (code & 0x1Fu) + 1u);
        return Type(Kind::Unsupported, 0);
    }

    uint32_t code() const {
        switch (this->kind) {
            case Kind::Constant: return TYPE_CONSTANT;
            case Kind::Verbatim: return TYPE_VERBATIM;
            case Kind::Fixed: return TYPE_FIXED_BASE + this->order;
            case Kind::Lpc: return TYPE_LPC_BASE + (this->order - 1u);
            default: return 0xFF;
        }
    }

    bool operator==(const Type& other) const {
        return this->kind == other.kind && this->order == other.order;
    }
};

} // namespace Subframe
