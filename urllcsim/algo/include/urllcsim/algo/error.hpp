#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace urllcsim::algo {

/// @brief Invalid simulation configuration.
/// @ingroup algo
///
/// Raised before a run starts: unknown scheduling policy name, zero
/// resource blocks, non-positive duration, empty priority list and similar.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief The radio model produced or received an unusable value.
/// @ingroup algo
///
/// Non-positive distance, non-finite SINR or a non-positive data rate.
/// A ChannelError aborts the run.
class ChannelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief A packet could not be created or split.
/// @ingroup algo
///
/// Raised while a device generates a packet, the error is contained: the
/// device traces it, counts one dropped packet and keeps generating.
class PacketError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @param packet_id Identifier the packet would have carried.
    /// @param reason    Human-readable cause.
    PacketError(uint64_t packet_id, const std::string& reason)
        : std::runtime_error("packet " + std::to_string(packet_id) + ": " + reason)
        , packet_id_(packet_id) {}

    [[nodiscard]] uint64_t packet_id() const noexcept { return packet_id_; }

private:
    uint64_t packet_id_{0};
};

} // namespace urllcsim::algo
