/**
 * @file var_data.hpp
 * @brief Trail エントリ構造体
 *
 * model.hpp から分離し、ドメインクラスとの循環依存を回避する。
 */
#ifndef SHIKEN_CSP_VAR_DATA_HPP
#define SHIKEN_CSP_VAR_DATA_HPP

#include <cstdint>
#include <cstddef>

namespace shiken_csp {

/**
 * @brief 変数ドメイン用 Trail エントリ
 */
struct VarTrailEntry {
    size_t var_idx;
    int64_t old_min;
    int64_t old_max;
    size_t old_n;
};

} // namespace shiken_csp

#endif // SHIKEN_CSP_VAR_DATA_HPP
