/**
 * Tree construction
 *
 * Pending clusters live on explicit stacks rather than the call stack. The
 * calling thread starts at the root; any child with at least
 * parallel_threshold members becomes its own pool task, smaller ones are
 * finished by whichever thread split their parent. Every decision depends
 * only on the cluster's own members, so the tree is identical for any pool
 * size.
 */

#include "clam/tree.hpp"
#include "clam/dataset.hpp"
#include "clam/error.hpp"
#include "clam/logging.hpp"
#include "clam/thread_pool.hpp"
#include "clam/util/threading.hpp"
#include "clam/util/timer.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <numeric>

namespace clam {

namespace {

// Geometric median is taken over every member up to this cardinality
constexpr size_t FULL_SAMPLE_LIMIT = 100;

uint64_t fnv1a(const std::string& text) {
    uint64_t hash = 0xcbf29ce484222325ull;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 0x100000001b3ull;
    }
    return hash;
}

// Position of the largest value; equal values resolve to the lower item id
size_t arg_max(const std::vector<Distance>& values, std::span<const Index> ids) {
    size_t best = 0;
    for (size_t p = 1; p < values.size(); ++p) {
        if (values[p] > values[best] || (values[p] == values[best] && ids[p] < ids[best])) {
            best = p;
        }
    }
    return best;
}

} // namespace

class TreeBuilder {
public:
    TreeBuilder(const MetricSpace& space, const BuildConfig& config,
                ThreadPool& pool, const CancellationToken* cancel)
        : space_(space)
        , config_(config)
        , pool_(pool)
        , user_cancel_(cancel)
        , tree_(space, config)
        , parallel_(pool.num_threads() > 1 && !pool.in_worker_thread())
        , outstanding_(0) {}

    Tree run() {
        const size_t n = space_.cardinality();
        if (n == 0) {
            throw EmptyDatasetError("Cannot build a tree over an empty dataset", "Tree::build");
        }
        config_.validate();

        warn_about_axioms();

        LOG_INFO("Building tree over ", n, " items with metric '", space_.metric_name(), "' (",
                 parallel_ ? pool_.num_threads() : 1, " threads)");

        Timer timer;
        timer.start();
        const size_t calls_before = space_.distance_count();

        tree_.permutation_.resize(n);
        std::iota(tree_.permutation_.begin(), tree_.permutation_.end(), Index(0));

        if (parallel_) {
            try {
                tree_.root_ = make_cluster("1", 0, 0, n);
                build_subtree(tree_.root_.get());
            } catch (...) {
                errors_.set_exception(std::current_exception());
                abort_.cancel();
            }
            wait_for_tasks();
            errors_.propagate();
        } else {
            tree_.root_ = make_cluster("1", 0, 0, n);
            build_subtree(tree_.root_.get());
        }

        if (user_cancel_ && user_cancel_->is_cancelled()) {
            throw CancelledError("Tree construction was cancelled", "Tree::build");
        }

        timer.stop();
        tree_.stats_.build_seconds = timer.elapsed_seconds();
        tree_.stats_.build_distance_calls = space_.distance_count() - calls_before;
        tree_.compute_stats();

        LOG_INFO("Built tree: ", tree_.num_clusters(), " clusters, ", tree_.num_leaves(),
                 " leaves, height ", tree_.height(), ", ", tree_.stats_.build_distance_calls,
                 " distance calls in ", timer.elapsed_ms(), " ms");

        return std::move(tree_);
    }

private:
    void warn_about_axioms() const {
        const std::string name = space_.metric_name();
        if (!space_.obeys_triangle_inequality()) {
            LOG_WARN("Metric '", name,
                     "' does not obey the triangle inequality; exact search may miss neighbors");
        }
        if (!space_.has_identity()) {
            LOG_WARN("Metric '", name,
                     "' lacks identity; distinct items may be at distance 0 and share a leaf");
        }
        if (!space_.has_symmetry()) {
            LOG_WARN("Metric '", name,
                     "' is not symmetric; cached pairs keep whichever direction was computed first");
        }
        if (!space_.has_non_negativity()) {
            LOG_WARN("Metric '", name,
                     "' may return negative values; such results raise InvalidMetricError");
        }
    }

    bool cancelled() const {
        return abort_.is_cancelled() || (user_cancel_ && user_cancel_->is_cancelled());
    }

    std::span<Index> mutable_members(const Cluster& cluster) {
        return std::span<Index>(tree_.permutation_.data() + cluster.offset(), cluster.cardinality());
    }

    std::unique_ptr<Cluster> make_cluster(std::string name, size_t depth, size_t offset, size_t cardinality) {
        std::span<const Index> members(tree_.permutation_.data() + offset, cardinality);
        auto cluster = std::make_unique<Cluster>(std::move(name), depth, offset, members);
        summarize(*cluster);
        return cluster;
    }

    std::vector<Distance> distances_from(Index item, std::span<const Index> members) {
        std::vector<Distance> distances(members.size());
        if (members.size() >= config_.parallel_threshold) {
            // Runs inline when already on a worker
            pool_.parallel_for(0, members.size(), [&](size_t p) {
                distances[p] = space_.scan_distance(item, members[p]);
            });
        } else {
            for (size_t p = 0; p < members.size(); ++p) {
                distances[p] = space_.scan_distance(item, members[p]);
            }
        }
        return distances;
    }

    // Geometric median of a deterministic sample
    Index select_center(const Cluster& cluster) {
        std::span<const Index> members = cluster.indices();

        std::vector<Index> sample;
        if (members.size() <= FULL_SAMPLE_LIMIT) {
            sample.assign(members.begin(), members.end());
        } else {
            const size_t n = static_cast<size_t>(std::ceil(std::sqrt(static_cast<double>(members.size()))));
            sample = choose_unique(members, n, config_.seed ^ fnv1a(cluster.name()));
        }

        if (sample.size() == 1) {
            return sample[0];
        }

        std::vector<Distance> sums(sample.size(), 0.0);
        auto row_sum = [&](size_t i) {
            Distance sum = 0.0;
            for (Index other : sample) {
                sum += space_.scan_distance(sample[i], other);
            }
            sums[i] = sum;
        };

        if (sample.size() * sample.size() >= config_.parallel_threshold) {
            pool_.parallel_for(0, sample.size(), row_sum);
        } else {
            for (size_t i = 0; i < sample.size(); ++i) row_sum(i);
        }

        size_t best = 0;
        for (size_t i = 1; i < sample.size(); ++i) {
            if (sums[i] < sums[best] || (sums[i] == sums[best] && sample[i] < sample[best])) {
                best = i;
            }
        }
        return sample[best];
    }

    void summarize(Cluster& cluster) {
        std::span<const Index> members = cluster.indices();

        if (members.size() == 1) {
            cluster.center_ = members[0];
            cluster.arg_radius_ = members[0];
            cluster.radius_ = 0.0;
            cluster.lfd_ = 1.0;
            return;
        }

        cluster.center_ = select_center(cluster);
        const std::vector<Distance> distances = distances_from(cluster.center_, members);

        const size_t farthest = arg_max(distances, members);
        cluster.radius_ = distances[farthest];
        cluster.arg_radius_ = members[farthest];

        if (cluster.radius_ == 0.0) {
            cluster.lfd_ = 1.0;
            return;
        }

        const Distance half = cluster.radius_ / 2.0;
        const size_t inner = static_cast<size_t>(
            std::count_if(distances.begin(), distances.end(), [half](Distance d) { return d <= half; }));
        // The center itself is always inside half the radius
        cluster.lfd_ = std::log2(static_cast<double>(members.size()) / static_cast<double>(inner));
    }

    bool should_stop(const Cluster& cluster) const {
        return cluster.cardinality() <= config_.min_cardinality
            || cluster.cardinality() == 1
            || cluster.radius() == 0.0
            || cluster.radius() <= config_.min_radius
            || (config_.max_depth > 0 && cluster.depth() >= config_.max_depth)
            || (config_.min_lfd > 0.0 && cluster.lfd() < config_.min_lfd);
    }

    // Splits the cluster in place; false means it stays a leaf
    bool split(Cluster& cluster) {
        if (should_stop(cluster)) {
            return false;
        }

        std::span<Index> members = mutable_members(cluster);

        const Index left_pole = cluster.arg_radius();
        const std::vector<Distance> to_left = distances_from(left_pole, members);

        const size_t right_position = arg_max(to_left, members);
        const Index right_pole = members[right_position];
        if (to_left[right_position] == 0.0) {
            return false;
        }

        const std::vector<Distance> to_right = distances_from(right_pole, members);

        std::vector<Index> left_members;
        std::vector<Index> right_members;
        left_members.reserve(members.size());
        right_members.reserve(members.size());

        const bool left_wins_ties = left_pole < right_pole;
        for (size_t p = 0; p < members.size(); ++p) {
            const bool to_left_side = to_left[p] < to_right[p]
                || (to_left[p] == to_right[p] && left_wins_ties);
            (to_left_side ? left_members : right_members).push_back(members[p]);
        }

        if (left_members.empty() || right_members.empty()) {
            return false;
        }

        // Stable: each side keeps the parent's relative order
        std::copy(left_members.begin(), left_members.end(), members.begin());
        std::copy(right_members.begin(), right_members.end(), members.begin() + left_members.size());

        const size_t depth = cluster.depth() + 1;
        cluster.children_[0] = make_cluster(cluster.name() + "0", depth,
                                            cluster.offset(), left_members.size());
        cluster.children_[1] = make_cluster(cluster.name() + "1", depth,
                                            cluster.offset() + left_members.size(), right_members.size());
        return true;
    }

    void build_subtree(Cluster* start) {
        std::vector<Cluster*> pending{start};

        while (!pending.empty()) {
            if (cancelled()) {
                return;
            }

            Cluster* cluster = pending.back();
            pending.pop_back();

            if (!split(*cluster)) {
                continue;
            }

            for (int side = 1; side >= 0; --side) {
                Cluster* child = cluster->children_[side].get();
                if (parallel_ && child->cardinality() >= config_.parallel_threshold) {
                    dispatch(child);
                } else {
                    pending.push_back(child);
                }
            }
        }
    }

    void dispatch(Cluster* cluster) {
        {
            std::lock_guard<std::mutex> lock(done_mutex_);
            ++outstanding_;
        }

        try {
            pool_.submit([this, cluster]() {
                try {
                    build_subtree(cluster);
                } catch (...) {
                    errors_.set_exception(std::current_exception());
                    abort_.cancel();
                }
                task_finished();
            });
        } catch (...) {
            task_finished();
            throw;
        }
    }

    void task_finished() {
        std::lock_guard<std::mutex> lock(done_mutex_);
        if (--outstanding_ == 0) {
            done_cv_.notify_all();
        }
    }

    void wait_for_tasks() {
        std::unique_lock<std::mutex> lock(done_mutex_);
        done_cv_.wait(lock, [this]() { return outstanding_ == 0; });
    }

    const MetricSpace& space_;
    const BuildConfig& config_;
    ThreadPool& pool_;
    const CancellationToken* user_cancel_;

    Tree tree_;
    bool parallel_;

    CancellationToken abort_;
    ExceptionPropagator errors_;

    size_t outstanding_;
    std::mutex done_mutex_;
    std::condition_variable done_cv_;
};

Tree Tree::build(const MetricSpace& space, const BuildConfig& config,
                 ThreadPool* pool, const CancellationToken* cancel) {
    ThreadPool& workers = pool ? *pool : ThreadPool::instance();
    TreeBuilder builder(space, config, workers, cancel);
    return builder.run();
}

} // namespace clam
