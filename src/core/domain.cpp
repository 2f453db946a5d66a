#include "crossfill/domain.hpp"
#include <algorithm>
#include <cassert>

namespace crossfill {

Domain::Domain()
    : n_(0) {}

Domain::Domain(size_t vocabulary_size)
    : n_(vocabulary_size) {
    values_.reserve(vocabulary_size);
    sparse_.reserve(vocabulary_size);
    for (value_type v = 0; v < vocabulary_size; ++v) {
        values_.push_back(v);
        sparse_.push_back(v);
    }
}

bool Domain::remove(value_type value) {
    if (!contains(value)) {
        return false;  // 元々存在しない
    }
    swap_at(sparse_[value], n_ - 1);
    --n_;
    return true;
}

bool Domain::assign(value_type value) {
    if (!contains(value)) {
        return false;
    }
    swap_at(sparse_[value], 0);
    n_ = 1;
    return true;
}

std::vector<Domain::value_type> Domain::values() const {
    std::vector<value_type> result(values_.begin(), values_.begin() + static_cast<std::ptrdiff_t>(n_));
    std::sort(result.begin(), result.end());
    return result;
}

void Domain::set_n(size_t n) {
    assert(n <= values_.size() && "set_n: size exceeds capacity");
    n_ = n;
}

void Domain::restore_dense(std::vector<value_type> dense, size_t n) {
    assert(dense.size() == sparse_.size() && "restore_dense: capacity mismatch");
    values_ = std::move(dense);
    for (size_t i = 0; i < values_.size(); ++i) {
        sparse_[values_[i]] = i;
    }
    n_ = n;
}

size_t Domain::index_of(value_type value) const {
    if (!contains(value)) {
        return SIZE_MAX;
    }
    return sparse_[value];
}

void Domain::swap_at(size_t i, size_t j) {
    assert(i < values_.size() && "swap_at: index i out of bounds");
    assert(j < values_.size() && "swap_at: index j out of bounds");
    if (i == j) return;
    value_type vi = values_[i];
    value_type vj = values_[j];
    values_[i] = vj;
    values_[j] = vi;
    sparse_[vi] = j;
    sparse_[vj] = i;
}

} // namespace crossfill
