#include "crosslock/timelocks.hpp"

namespace crosslock {

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::SrcWithdrawal: return "SrcWithdrawal";
        case Stage::SrcPublicWithdrawal: return "SrcPublicWithdrawal";
        case Stage::SrcCancellation: return "SrcCancellation";
        case Stage::SrcPublicCancellation: return "SrcPublicCancellation";
        case Stage::DstWithdrawal: return "DstWithdrawal";
        case Stage::DstPublicWithdrawal: return "DstPublicWithdrawal";
        case Stage::DstCancellation: return "DstCancellation";
    }
    return "Unknown";
}

// Limb 3 holds bits 0..63, limb 0 holds bits 192..255
uint32_t Timelocks::field(unsigned bit) const {
    const size_t limb = 3 - bit / 64;
    const unsigned shift = bit % 64;
    return static_cast<uint32_t>(data_[limb] >> shift);
}

void Timelocks::set_field(unsigned bit, uint32_t value) {
    const size_t limb = 3 - bit / 64;
    const unsigned shift = bit % 64;
    data_[limb] &= ~(static_cast<uint64_t>(0xFFFFFFFFu) << shift);
    data_[limb] |= static_cast<uint64_t>(value) << shift;
}

Timelocks Timelocks::pack(const Offsets& offsets) {
    Timelocks t;
    for (size_t i = 0; i < STAGE_COUNT; ++i) {
        t.set_field(static_cast<unsigned>(i * 32), offsets[i]);
    }
    return t;
}

Timelocks Timelocks::with_deployed_at(uint32_t timestamp) const {
    Timelocks t = *this;
    t.set_field(DEPLOYED_AT_SHIFT, timestamp);
    return t;
}

uint32_t Timelocks::deployed_at() const {
    return field(DEPLOYED_AT_SHIFT);
}

uint32_t Timelocks::offset(Stage stage) const {
    return field(static_cast<unsigned>(stage) * 32);
}

Timelocks::Offsets Timelocks::offsets() const {
    Offsets out{};
    for (size_t i = 0; i < STAGE_COUNT; ++i) {
        out[i] = offset(static_cast<Stage>(i));
    }
    return out;
}

uint64_t Timelocks::unlock_instant(Stage stage) const {
    return static_cast<uint64_t>(deployed_at()) + offset(stage);
}

uint64_t Timelocks::rescue_start(uint32_t rescue_delay) const {
    return static_cast<uint64_t>(deployed_at()) + rescue_delay;
}

bool Timelocks::is_well_ordered() const {
    auto at = [this](Stage s) { return offset(s); };
    return at(Stage::SrcWithdrawal) <= at(Stage::SrcPublicWithdrawal) &&
           at(Stage::SrcPublicWithdrawal) <= at(Stage::SrcCancellation) &&
           at(Stage::SrcCancellation) <= at(Stage::SrcPublicCancellation) &&
           at(Stage::DstWithdrawal) <= at(Stage::DstPublicWithdrawal) &&
           at(Stage::DstPublicWithdrawal) <= at(Stage::DstCancellation);
}

} // namespace crosslock
