#pragma once

#include <array>
#include <cstdint>
#include "crosslock/types.hpp"

namespace crosslock {

/**
 * @brief Timelock stages in packing order
 *
 * Stage i occupies bits [32*i, 32*i + 32) of the packed word.
 */
enum class Stage : uint8_t {
    SrcWithdrawal = 0,
    SrcPublicWithdrawal = 1,
    SrcCancellation = 2,
    SrcPublicCancellation = 3,
    DstWithdrawal = 4,
    DstPublicWithdrawal = 5,
    DstCancellation = 6
};

constexpr size_t STAGE_COUNT = 7;

const char* stage_name(Stage stage);

/**
 * @brief Seven 32-bit stage offsets plus a 32-bit deployment timestamp
 * packed into one 256-bit word
 *
 * Layout (bit ranges of the word):
 *   0..223    offsets, 32 bits per stage
 *   224..255  deployment timestamp
 *
 * Pure value type. Offsets are relative to the deployment timestamp;
 * the factory stamps the timestamp once when the escrow is deployed.
 */
class Timelocks {
public:
    using Offsets = std::array<uint32_t, STAGE_COUNT>;

    static constexpr unsigned DEPLOYED_AT_SHIFT = 224;

    Timelocks() = default;

    static Timelocks pack(const Offsets& offsets);
    static Timelocks from_raw(const Word256& raw) { return Timelocks(raw); }

    // Overwrites only the top 32 bits
    Timelocks with_deployed_at(uint32_t timestamp) const;

    uint32_t deployed_at() const;
    uint32_t offset(Stage stage) const;
    Offsets offsets() const;

    // deployed_at + offset(stage), no overflow
    uint64_t unlock_instant(Stage stage) const;

    // deployed_at + rescue_delay
    uint64_t rescue_start(uint32_t rescue_delay) const;

    // Conventional ordering of the source and destination stages
    bool is_well_ordered() const;

    const Word256& raw() const { return data_; }

    bool operator==(const Timelocks& other) const = default;

private:
    explicit Timelocks(const Word256& raw) : data_(raw) {}

    uint32_t field(unsigned bit) const;
    void set_field(unsigned bit, uint32_t value);

    Word256 data_{};
};

} // namespace crosslock
