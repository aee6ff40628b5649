#pragma once

#include <urllcsim/algo/packet.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace urllcsim::algo {

/// @brief A packet waiting for a resource block.
/// @ingroup algo
struct WaitingEntry {
    std::size_t device_id;
    Packet packet;
    uint64_t sequence;  ///< Insertion order, used to break key ties.
};

/// @brief Packets waiting for a block, selected by a caller-supplied key.
/// @ingroup algo
///
/// The set does not keep entries sorted: pop_next() evaluates the key of
/// every entry at pop time and takes the minimum of (key, sequence). Keys
/// that depend on the current time or on device history are therefore
/// always up to date, and equal keys are served FIFO.
class WaitingSet {
public:
    using KeyFunction = std::function<double(const WaitingEntry&)>;

    /// @brief Append a packet at the tail.
    void push(std::size_t device_id, Packet packet);

    /// @brief Remove and return the entry with the smallest key.
    ///
    /// The winning packet's dispatch key is updated to the evaluated value.
    /// Returns nullopt when the set is empty.
    std::optional<WaitingEntry> pop_next(const KeyFunction& key);

    /// @brief Drop the packet with @p packet_id, if it is waiting.
    /// @return True if a packet was removed.
    bool remove(uint64_t packet_id);

    [[nodiscard]] bool contains(uint64_t packet_id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const std::vector<WaitingEntry>& entries() const noexcept { return entries_; }

private:
    std::vector<WaitingEntry> entries_;
    uint64_t next_sequence_{0};
};

} // namespace urllcsim::algo
