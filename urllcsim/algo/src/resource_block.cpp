#include <urllcsim/algo/resource_block.hpp>

#include <urllcsim/core/error.hpp>

#include <string>
#include <utility>

namespace urllcsim::algo {

ResourceBlock::ResourceBlock(std::size_t id, std::size_t subcarriers,
                             core::Duration slot_duration, double initial_sinr_db)
    : id_(id)
    , subcarriers_(subcarriers)
    , slot_duration_(slot_duration)
    , current_sinr_(initial_sinr_db) {}

const TransmissionHandle& ResourceBlock::occupant() const {
    if (!occupant_) {
        throw core::InvalidStateError("resource block " + std::to_string(id_) + " is free");
    }
    return *occupant_;
}

TransmissionHandle& ResourceBlock::occupant() {
    if (!occupant_) {
        throw core::InvalidStateError("resource block " + std::to_string(id_) + " is free");
    }
    return *occupant_;
}

void ResourceBlock::bind(TransmissionHandle handle) {
    if (occupant_) {
        throw core::InvalidStateError("resource block " + std::to_string(id_) +
                                      " is already carrying packet " +
                                      std::to_string(occupant_->packet.id()));
    }
    occupant_.emplace(std::move(handle));
}

TransmissionHandle ResourceBlock::unbind() {
    if (!occupant_) {
        throw core::InvalidStateError("cannot release free resource block " + std::to_string(id_));
    }
    TransmissionHandle handle = std::move(*occupant_);
    occupant_.reset();
    return handle;
}

} // namespace urllcsim::algo
