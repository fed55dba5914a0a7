#include "clam/cluster.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace clam {

Cluster::Cluster(std::string name, size_t depth, size_t offset, std::span<const Index> indices)
    : name_(std::move(name))
    , depth_(depth)
    , offset_(offset)
    , indices_(indices) {}

Cluster::~Cluster() {
    // Detach descendants onto a heap stack so each one dies childless
    std::vector<std::unique_ptr<Cluster>> pending;
    for (auto& child : children_) {
        if (child) pending.push_back(std::move(child));
    }

    while (!pending.empty()) {
        std::unique_ptr<Cluster> node = std::move(pending.back());
        pending.pop_back();
        for (auto& child : node->children_) {
            if (child) pending.push_back(std::move(child));
        }
    }
}

bool Cluster::contains(Index item) const {
    return std::find(indices_.begin(), indices_.end(), item) != indices_.end();
}

} // namespace clam
