#include <urllcsim/algo/waiting_set.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace urllcsim::algo {

void WaitingSet::push(std::size_t device_id, Packet packet) {
    entries_.push_back(WaitingEntry{device_id, std::move(packet), next_sequence_++});
}

std::optional<WaitingEntry> WaitingSet::pop_next(const KeyFunction& key) {
    if (entries_.empty()) {
        return std::nullopt;
    }

    std::size_t best = 0;
    double best_key = key(entries_[0]);
    for (std::size_t i = 1; i < entries_.size(); ++i) {
        double k = key(entries_[i]);
        if (k < best_key || (k == best_key && entries_[i].sequence < entries_[best].sequence)) {
            best = i;
            best_key = k;
        }
    }

    auto it = entries_.begin() + static_cast<std::ptrdiff_t>(best);
    WaitingEntry entry = std::move(*it);
    entries_.erase(it);
    entry.packet.set_dispatch_key(best_key);
    return entry;
}

bool WaitingSet::remove(uint64_t packet_id) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [packet_id](const WaitingEntry& e) {
        return e.packet.id() == packet_id;
    });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool WaitingSet::contains(uint64_t packet_id) const noexcept {
    return std::any_of(entries_.begin(), entries_.end(), [packet_id](const WaitingEntry& e) {
        return e.packet.id() == packet_id;
    });
}

} // namespace urllcsim::algo
