/* ===================================================================== *
 *  src/BasisCache.cpp
 * ===================================================================== */
#include "ccdfit/BasisCache.hpp"
#include "ccdfit/Defaults.hpp"

#include <functional>

namespace ccdfit {

/* ------------------------------------------------------------------ *
 *  boost-like hash_combine over (dates…, num_coeffs, avg_days_yr)    *
 * ------------------------------------------------------------------ */
namespace {

template<typename T>
inline void hash_combine(std::size_t& seed, const T& v)
{
    seed ^= std::hash<T>{}(v) +
            0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace

std::size_t BasisKeyHash::operator()(const BasisKey& k) const noexcept
{
    std::size_t seed = k.dates.size();
    for (auto t : k.dates) hash_combine(seed, t);
    hash_combine(seed, k.num_coeffs);
    hash_combine(seed, k.avg_days_yr);
    return seed;
}

/* -------- construction / shared instance ------------------------------ */
BasisCache::BasisCache(std::size_t capacity)
    : max_entries_(capacity == 0 ? 1 : capacity)
{}

BasisCache& BasisCache::instance()
{
    static BasisCache inst(BASIS_CACHE_SIZE);
    return inst;
}

/* -------- simple helpers -------------------------------------------- */
void BasisCache::set_capacity(std::size_t n)
{
    std::lock_guard lk(mtx_);
    max_entries_ = (n == 0) ? 1 : n;
    evict_if_needed_();
}
std::size_t BasisCache::capacity() const
{
    std::lock_guard lk(mtx_);
    return max_entries_;
}
std::size_t BasisCache::size() const
{
    std::lock_guard lk(mtx_);
    return cache_.size();
}
bool BasisCache::contains(const BasisKey& key) const
{
    std::lock_guard lk(mtx_);
    return cache_.find(key) != cache_.end();   // does not touch recency
}
void BasisCache::clear()
{
    std::lock_guard lk(mtx_);
    cache_.clear();
    lru_.clear();
}

/* -------- try_get ---------------------------------------------------- */
MatrixPtr BasisCache::try_get(const BasisKey& key) const
{
    std::lock_guard lk(mtx_);
    auto it = cache_.find(key);
    if (it == cache_.end()) return nullptr;
    touch_(it);
    return it->second.mat;
}

/* ===================================================================== *
 *            internal L-R-U helpers (private)
 * ===================================================================== */
void BasisCache::touch_(typename Map::iterator it) const
{
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
}
void BasisCache::evict_if_needed_()
{
    while (cache_.size() > max_entries_) {
        cache_.erase(lru_.back());     // shared_ptr keeps data alive
        lru_.pop_back();
    }
}

} // namespace ccdfit
