#include "shiken_csp/domain.hpp"
#include <algorithm>
#include <limits>

namespace shiken_csp {

Domain::Domain()
    : offset_(0)
    , n_(0)
    , min_(std::numeric_limits<value_type>::max())
    , max_(std::numeric_limits<value_type>::min()) {}

Domain::Domain(value_type min, value_type max)
    : offset_(min)
    , n_(0)
    , min_(min)
    , max_(max) {
    if (min > max) {
        offset_ = 0;
        min_ = std::numeric_limits<value_type>::max();
        max_ = std::numeric_limits<value_type>::min();
        return;
    }
    size_t range = static_cast<size_t>(max - min + 1);
    sparse_.assign(range, SIZE_MAX);
    values_.reserve(range);
    for (value_type v = min; v <= max; ++v) {
        sparse_[static_cast<size_t>(v - offset_)] = values_.size();
        values_.push_back(v);
    }
    n_ = values_.size();
}

Domain::Domain(std::vector<value_type> values)
    : offset_(0)
    , n_(0)
    , min_(std::numeric_limits<value_type>::max())
    , max_(std::numeric_limits<value_type>::min()) {
    if (values.empty()) {
        return;
    }
    // 重複を除去してソート
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());

    values_ = std::move(values);
    n_ = values_.size();
    min_ = values_.front();
    max_ = values_.back();
    offset_ = min_;

    size_t range = static_cast<size_t>(max_ - offset_ + 1);
    sparse_.assign(range, SIZE_MAX);
    for (size_t i = 0; i < n_; ++i) {
        sparse_[static_cast<size_t>(values_[i] - offset_)] = i;
    }
}

bool Domain::contains(value_type value) const {
    if (n_ == 0 || value < min_ || value > max_) {
        return false;
    }
    auto idx_val = static_cast<size_t>(value - offset_);
    if (idx_val >= sparse_.size()) {
        return false;
    }
    return sparse_[idx_val] < n_;
}

bool Domain::remove(value_type value) {
    if (!contains(value)) {
        return true;  // 元々存在しない → 成功（変更なし）
    }
    // 削除すると空になる場合は失敗（ドメインは変更しない）
    if (n_ == 1) {
        return false;
    }

    erase_at(sparse_[static_cast<size_t>(value - offset_)]);
    if (value == min_ || value == max_) {
        update_bounds();
    }
    return true;
}

bool Domain::remove_below(value_type threshold) {
    if (n_ == 0) {
        return false;
    }
    if (threshold <= min_) {
        return true;
    }
    if (threshold > max_) {
        return false;
    }
    for (size_t i = 0; i < n_;) {
        if (values_[i] < threshold) {
            erase_at(i);  // 末尾の値が i に入るので i は進めない
        } else {
            ++i;
        }
    }
    update_bounds();
    return n_ > 0;
}

bool Domain::remove_above(value_type threshold) {
    if (n_ == 0) {
        return false;
    }
    if (threshold >= max_) {
        return true;
    }
    if (threshold < min_) {
        return false;
    }
    for (size_t i = 0; i < n_;) {
        if (values_[i] > threshold) {
            erase_at(i);
        } else {
            ++i;
        }
    }
    update_bounds();
    return n_ > 0;
}

bool Domain::assign(value_type value) {
    if (!contains(value)) {
        return false;
    }
    // value を先頭に移動して n_ = 1
    size_t idx = sparse_[static_cast<size_t>(value - offset_)];
    if (idx != 0) {
        value_type front = values_[0];
        values_[0] = value;
        values_[idx] = front;
        sparse_[static_cast<size_t>(value - offset_)] = 0;
        sparse_[static_cast<size_t>(front - offset_)] = idx;
    }
    n_ = 1;
    min_ = value;
    max_ = value;
    return true;
}

std::vector<Domain::value_type> Domain::values() const {
    std::vector<value_type> result(values_.begin(), values_.begin() + static_cast<std::ptrdiff_t>(n_));
    std::sort(result.begin(), result.end());
    return result;
}

void Domain::restore(size_t n, value_type min, value_type max) {
    n_ = n;
    min_ = min;
    max_ = max;
}

void Domain::erase_at(size_t idx) {
    size_t last = n_ - 1;
    if (idx != last) {
        value_type a = values_[idx];
        value_type b = values_[last];
        values_[idx] = b;
        values_[last] = a;
        sparse_[static_cast<size_t>(b - offset_)] = idx;
        sparse_[static_cast<size_t>(a - offset_)] = last;
    }
    --n_;
}

void Domain::update_bounds() {
    if (n_ == 0) {
        return;
    }
    min_ = values_[0];
    max_ = values_[0];
    for (size_t i = 1; i < n_; ++i) {
        min_ = std::min(min_, values_[i]);
        max_ = std::max(max_, values_[i]);
    }
}

} // namespace shiken_csp
