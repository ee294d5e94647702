#include "mediaharvest/storage/name_reservations.hpp"
#include "mediaharvest/core/utils.hpp"

namespace mediaharvest::storage {

std::filesystem::path NameReservations::key_for(const std::filesystem::path& path) {
    return core::utils::FileUtils::absolute_normal(path);
}

std::filesystem::path NameReservations::reserve_unique(const std::filesystem::path& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto parent = destination.parent_path();
    auto stem = destination.stem().string();
    auto ext = destination.extension().string();
    
    auto candidate = destination;
    std::error_code ec;
    for (int i = 1; std::filesystem::exists(candidate, ec) || reserved_.count(key_for(candidate)) > 0; ++i) {
        candidate = parent / (stem + "_" + std::to_string(i) + ext);
    }
    
    reserved_.insert(key_for(candidate));
    return candidate;
}

void NameReservations::release(const std::filesystem::path& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_.erase(key_for(destination));
}

bool NameReservations::is_reserved(const std::filesystem::path& destination) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.count(key_for(destination)) > 0;
}

size_t NameReservations::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.size();
}

} // namespace mediaharvest::storage
