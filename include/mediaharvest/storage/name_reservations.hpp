#pragma once

#include <filesystem>
#include <mutex>
#include <set>

namespace mediaharvest::storage {

/**
 * Destination names claimed by work in flight. A name counts as taken when a
 * file exists there or another caller holds it, so downloads and links into
 * one folder never pick the same name before anything is on disk.
 */
class NameReservations {
public:
    // Claims `destination`, or the first free `<stem>_<n><ext>` after it.
    std::filesystem::path reserve_unique(const std::filesystem::path& destination);
    
    void release(const std::filesystem::path& destination);
    bool is_reserved(const std::filesystem::path& destination) const;
    size_t size() const;

private:
    static std::filesystem::path key_for(const std::filesystem::path& path);
    
    mutable std::mutex mutex_;
    std::set<std::filesystem::path> reserved_;
};

} // namespace mediaharvest::storage
