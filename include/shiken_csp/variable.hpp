/**
 * @file variable.hpp
 * @brief CSP変数クラス
 */
#ifndef SHIKEN_CSP_VARIABLE_HPP
#define SHIKEN_CSP_VARIABLE_HPP

#include "shiken_csp/domain.hpp"
#include <string>
#include <memory>
#include <cstdint>

namespace shiken_csp {

/**
 * @brief CSP変数を表すクラス
 *
 * ドメインの変更は探索中は Model の Trail 付き操作を経由すること。
 * 直接の assign/remove は presolve とテスト用。
 */
class Variable {
public:
    /**
     * @note 通常は Model::create_variable() を使用してください
     */
    Variable(std::string name, Domain domain);

    /**
     * @brief Model内のID（インデックス）
     */
    size_t id() const { return id_; }

    /**
     * @brief IDを設定（Modelから呼び出される）
     */
    void set_id(size_t id) { id_ = id; }

    const std::string& name() const { return name_; }

    Domain& domain() { return domain_; }
    const Domain& domain() const { return domain_; }

    /**
     * @pre ドメインが空でないこと
     */
    Domain::value_type min() const { return domain_.min().value(); }
    Domain::value_type max() const { return domain_.max().value(); }

    bool assign(Domain::value_type value) { return domain_.assign(value); }
    bool remove(Domain::value_type value) { return domain_.remove(value); }

    bool is_assigned() const { return domain_.is_singleton(); }

    std::optional<Domain::value_type> assigned_value() const {
        if (domain_.is_singleton()) {
            return domain_.min();
        }
        return std::nullopt;
    }

private:
    size_t id_ = SIZE_MAX;
    std::string name_;
    Domain domain_;
};

using VariablePtr = std::shared_ptr<Variable>;

} // namespace shiken_csp

#endif // SHIKEN_CSP_VARIABLE_HPP
