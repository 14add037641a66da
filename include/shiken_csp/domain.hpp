/**
 * @file domain.hpp
 * @brief 整数定義域クラス（Sparse Set ベース）
 */
#ifndef SHIKEN_CSP_DOMAIN_HPP
#define SHIKEN_CSP_DOMAIN_HPP

#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace shiken_csp {

/**
 * @brief 整数定義域を表すクラス
 *
 * Sparse Set を使用し、O(1) での値の存在確認と削除を実現する。
 * 削除は有効領域の末尾とのスワップで行うため、
 * バックトラック時の復元は size (n_) と min/max キャッシュのリセットのみ。
 */
class Domain {
public:
    using value_type = int64_t;

    /**
     * @brief 空の定義域を作成
     */
    Domain();

    /**
     * @brief 区間定義域を作成
     * @param min 最小値
     * @param max 最大値
     */
    Domain(value_type min, value_type max);

    /**
     * @brief 値リストから定義域を作成（重複は無視）
     */
    explicit Domain(std::vector<value_type> values);

    bool empty() const { return n_ == 0; }
    size_t size() const { return n_; }

    std::optional<value_type> min() const { return n_ == 0 ? std::nullopt : std::optional<value_type>(min_); }
    std::optional<value_type> max() const { return n_ == 0 ? std::nullopt : std::optional<value_type>(max_); }

    /**
     * @brief 値が定義域に含まれるか
     */
    bool contains(value_type value) const;

    /**
     * @brief 値を削除
     * @return 削除後も定義域が空でなければ true
     */
    bool remove(value_type value);

    /**
     * @brief threshold 未満の値を一括削除
     * @return ドメインが空にならなければ true
     */
    bool remove_below(value_type threshold);

    /**
     * @brief threshold 超の値を一括削除
     * @return ドメインが空にならなければ true
     */
    bool remove_above(value_type threshold);

    /**
     * @brief 指定値に固定
     * @return 値が定義域に含まれていれば true
     */
    bool assign(value_type value);

    /**
     * @brief 有効な値を昇順で取得
     */
    std::vector<value_type> values() const;

    bool is_singleton() const { return n_ == 1; }

    // ===== Trail 復元用（Model からの操作用） =====

    size_t n() const { return n_; }

    /**
     * @brief 有効サイズと min/max キャッシュを復元
     */
    void restore(size_t n, value_type min, value_type max);

private:
    void erase_at(size_t idx);
    void update_bounds();

    std::vector<value_type> values_;  // Dense 配列
    std::vector<size_t> sparse_;      // sparse_[val - offset_] = dense index
    value_type offset_;               // = 初期 min 値
    size_t n_;                        // 有効な値の数
    value_type min_;                  // キャッシュ
    value_type max_;                  // キャッシュ
};

} // namespace shiken_csp

#endif // SHIKEN_CSP_DOMAIN_HPP
