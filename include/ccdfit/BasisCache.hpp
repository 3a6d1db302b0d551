/* ===================================================================== *
 *  include/ccdfit/BasisCache.hpp   ––  bounded L-R-U design-matrix cache
 * ===================================================================== */
#pragma once
#include "Types.hpp"

#include <ankerl/unordered_dense.h>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <utility>

namespace ccdfit {

using MatrixPtr = std::shared_ptr<const Matrix>;

/*
 * Identity of a harmonic design matrix.  Two keys are equal only when the
 * date sequences are equal element by element (same length, same order)
 * and the basis configuration matches; the hash is never used as identity.
 */
struct BasisKey {
    Dates  dates;
    int    num_coeffs  = 4;
    double avg_days_yr = 0.0;

    bool operator==(const BasisKey& o) const
    {
        return num_coeffs == o.num_coeffs
            && avg_days_yr == o.avg_days_yr
            && dates == o.dates;
    }
};

struct BasisKeyHash {
    std::size_t operator()(const BasisKey& k) const noexcept;
};

/*
 * Thread–safe bounded cache with   L-R-U eviction  and
 *                                   shared ownership.
 *
 * Matrices are handed out as shared_ptr<const Matrix>; evicting an entry
 * only drops the cache's reference, callers keep theirs.  The lock is never
 * held while a matrix is being built, so distinct keys never wait on each
 * other's computation.
 *
 *     auto m = cache.insert_if_absent(key, [&]{ return build(...); });
 *     use(*m);
 */
class BasisCache
{
public:
    explicit BasisCache(std::size_t capacity = 1'000);

    /* process-wide instance used when no cache is passed explicitly */
    static BasisCache& instance();

    /* ------------ read (updates recency) --------------------------- */
    MatrixPtr try_get(const BasisKey& key) const;

    /* ------------ insert-or-get ------------------------------------ */
    template<typename Producer>
    MatrixPtr insert_if_absent(const BasisKey& key, Producer&& make);

    /* ------------ house-keeping ------------------------------------ */
    void        set_capacity(std::size_t n);
    std::size_t capacity() const;
    std::size_t size() const;
    bool        contains(const BasisKey& key) const;
    void        clear();

private:
    /* ---------- internal L-R-U bookkeeping ------------------------- */
    using LruList = std::list<BasisKey>;                     // MRU at front
    struct Node {
        MatrixPtr         mat;      // shared ownership
        LruList::iterator lru_pos;  // position in the list
    };
    using Map = ankerl::unordered_dense::map<BasisKey, Node, BasisKeyHash>;

    void touch_(typename Map::iterator it) const;
    void evict_if_needed_();

    /* ---------- data members --------------------------------------- */
    mutable std::mutex mtx_;
    mutable Map        cache_;
    mutable LruList    lru_;
    std::size_t        max_entries_;
};

/* ===================================================================== *
 *  template implementation
 * ===================================================================== */
template<typename Producer>
MatrixPtr BasisCache::insert_if_absent(const BasisKey& key, Producer&& make)
{
    {
        std::lock_guard lk(mtx_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            touch_(it);
            return it->second.mat;         //  fast-path hit
        }
    }

    /* ---------- build matrix outside any lock ---------------------- */
    MatrixPtr new_mat = std::make_shared<const Matrix>(
                            std::forward<Producer>(make)() );

    /* ---------- second attempt / insertion ------------------------- */
    std::lock_guard lk(mtx_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {              // someone else inserted
        touch_(it);
        return it->second.mat;
    }

    auto lru_it = lru_.insert(lru_.begin(), key);
    cache_.try_emplace(key, Node{new_mat, lru_it});
    evict_if_needed_();
    return new_mat;
}

} // namespace ccdfit
