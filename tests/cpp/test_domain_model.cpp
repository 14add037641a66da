#include <catch2/catch.hpp>
#include "shiken_csp/domain.hpp"
#include "shiken_csp/variable.hpp"
#include "shiken_csp/model.hpp"

#include <stdexcept>

using namespace shiken_csp;

// ============================================================================
// Domain (Sparse Set) tests
// ============================================================================

TEST_CASE("Domain basic operations", "[domain]") {
    Domain d(1, 5);

    SECTION("initial state") {
        REQUIRE(d.size() == 5);
        REQUIRE(!d.empty());
        REQUIRE(d.min().value() == 1);
        REQUIRE(d.max().value() == 5);
    }

    SECTION("contains") {
        REQUIRE(d.contains(1));
        REQUIRE(d.contains(3));
        REQUIRE(d.contains(5));
        REQUIRE(!d.contains(0));
        REQUIRE(!d.contains(6));
    }

    SECTION("values are sorted after removals") {
        d.remove(1);
        d.remove(3);
        REQUIRE(d.values() == std::vector<Domain::value_type>{2, 4, 5});
    }
}

TEST_CASE("Domain empty", "[domain]") {
    Domain d;
    REQUIRE(d.empty());
    REQUIRE_FALSE(d.min().has_value());
    REQUIRE_FALSE(d.max().has_value());
    REQUIRE(!d.contains(0));

    Domain inverted(5, 1);
    REQUIRE(inverted.empty());
}

TEST_CASE("Domain remove", "[domain]") {
    Domain d(1, 5);

    SECTION("remove middle value") {
        REQUIRE(d.remove(3));
        REQUIRE(d.size() == 4);
        REQUIRE(!d.contains(3));
        REQUIRE(d.contains(1));
        REQUIRE(d.contains(5));
    }

    SECTION("remove min value") {
        REQUIRE(d.remove(1));
        REQUIRE(d.min().value() == 2);
    }

    SECTION("remove max value") {
        REQUIRE(d.remove(5));
        REQUIRE(d.max().value() == 4);
    }

    SECTION("remove non-existent value") {
        // 存在しない値の削除は成功（変更なし）として扱う
        REQUIRE(d.remove(10));
        REQUIRE(d.size() == 5);
    }

    SECTION("remove from singleton fails") {
        Domain singleton(3, 3);
        REQUIRE(singleton.is_singleton());
        REQUIRE(!singleton.remove(3));  // 空になるので失敗
        REQUIRE(singleton.size() == 1);
        REQUIRE(singleton.contains(3));
    }
}

TEST_CASE("Domain remove_below / remove_above", "[domain]") {
    Domain d(1, 10);

    SECTION("remove_below") {
        REQUIRE(d.remove_below(4));
        REQUIRE(d.size() == 7);
        REQUIRE(d.min().value() == 4);
        REQUIRE(!d.contains(3));
    }

    SECTION("remove_above") {
        REQUIRE(d.remove_above(6));
        REQUIRE(d.size() == 6);
        REQUIRE(d.max().value() == 6);
        REQUIRE(!d.contains(7));
    }

    SECTION("wipe out fails") {
        REQUIRE(!d.remove_below(11));
        REQUIRE(!d.remove_above(0));
    }
}

TEST_CASE("Domain assign", "[domain]") {
    Domain d(1, 5);

    SECTION("assign to existing value") {
        REQUIRE(d.assign(3));
        REQUIRE(d.is_singleton());
        REQUIRE(d.min().value() == 3);
        REQUIRE(d.max().value() == 3);
        REQUIRE(!d.contains(1));
        REQUIRE(!d.contains(5));
    }

    SECTION("assign to non-existent value") {
        REQUIRE(!d.assign(10));
        REQUIRE(d.size() == 5);  // unchanged
    }
}

TEST_CASE("Domain from vector", "[domain]") {
    std::vector<int64_t> vals = {5, 2, 8, 2, 3};  // with duplicate
    Domain d(vals);

    REQUIRE(d.size() == 4);
    REQUIRE(d.min().value() == 2);
    REQUIRE(d.max().value() == 8);
    REQUIRE(d.contains(5));
    REQUIRE(!d.contains(4));
}

TEST_CASE("Domain restore", "[domain]") {
    Domain d(1, 3);
    REQUIRE(d.n() == 3);

    d.remove(1);
    REQUIRE(d.n() == 2);

    d.restore(3, 1, 3);
    REQUIRE(d.size() == 3);
    REQUIRE(d.contains(1));
    REQUIRE(d.min().value() == 1);
}

// ============================================================================
// Model tests
// ============================================================================

TEST_CASE("Model basic operations", "[model]") {
    Model model;
    auto x = model.create_variable("x", 1, 5);
    auto y = model.create_variable("y", Domain(1, 3));

    SECTION("variable indices") {
        REQUIRE(x->id() == 0);
        REQUIRE(y->id() == 1);
        REQUIRE(model.find_variable_index("y") == 1);
        REQUIRE(model.find_variable_index("z") == SIZE_MAX);
    }

    SECTION("variable data") {
        REQUIRE(model.var_min(0) == 1);
        REQUIRE(model.var_max(0) == 5);
        REQUIRE(model.var_size(0) == 5);
        REQUIRE(model.var_size(1) == 3);
    }

    SECTION("variable lookup") {
        REQUIRE(model.variable(0) == x);
        REQUIRE(model.variable("y") == y);
        REQUIRE_THROWS_AS(model.variable(7), std::out_of_range);
        REQUIRE_THROWS_AS(model.variable("z"), std::out_of_range);
    }

    SECTION("duplicate name") {
        REQUIRE_THROWS_AS(model.create_variable("x", 0, 1), std::invalid_argument);
    }
}

TEST_CASE("Model rejects constraints over foreign variables", "[model]") {
    Model model;
    Model other;
    auto x = model.create_variable("x", 0, 3);
    auto foreign = other.create_variable("x", 0, 3);

    REQUIRE_THROWS_AS(model.add_constraint(std::make_shared<IntDistGeConstraint>(x, foreign, 1)),
                      std::invalid_argument);

    auto y = model.create_variable("y", 0, 3);
    model.add_constraint(std::make_shared<IntDistGeConstraint>(x, y, 1));
    model.add_constraint(std::make_shared<IntNotInConstraint>(x, std::vector<Domain::value_type>{0}));
    REQUIRE(model.constraints().size() == 2);
    REQUIRE(model.constraints()[0]->id() == 0);
    REQUIRE(model.constraints()[1]->id() == 1);
}

TEST_CASE("Model instantiate with trail", "[model][trail]") {
    Model model;
    model.create_variable("x", 1, 5);

    SECTION("instantiate") {
        REQUIRE(model.instantiate(1, 0, 3));
        REQUIRE(model.is_instantiated(0));
        REQUIRE(model.value(0) == 3);
        REQUIRE(model.var_trail_size() == 1);
    }

    SECTION("instantiate invalid value") {
        REQUIRE(!model.instantiate(1, 0, 10));
        REQUIRE(!model.is_instantiated(0));
        REQUIRE(model.var_size(0) == 5);
    }
}

TEST_CASE("Model rewind_to", "[model][trail]") {
    Model model;
    model.create_variable("x", 1, 5);
    model.create_variable("y", 1, 3);

    REQUIRE(model.instantiate(1, 0, 3));
    REQUIRE(model.instantiate(2, 1, 2));

    SECTION("rewind to level 1") {
        model.rewind_to(1);

        REQUIRE(model.is_instantiated(0));
        REQUIRE(model.value(0) == 3);

        REQUIRE(!model.is_instantiated(1));
        REQUIRE(model.var_size(1) == 3);
        REQUIRE(model.var_min(1) == 1);
        REQUIRE(model.var_max(1) == 3);
    }

    SECTION("rewind to level 0") {
        model.rewind_to(0);

        REQUIRE(!model.is_instantiated(0));
        REQUIRE(model.var_size(0) == 5);
        REQUIRE(!model.is_instantiated(1));
        REQUIRE(model.var_size(1) == 3);
        REQUIRE(model.var_trail_size() == 0);
    }
}

TEST_CASE("Model set_min / set_max with trail", "[model][trail]") {
    Model model;
    model.create_variable("x", 1, 10);

    REQUIRE(model.set_min(1, 0, 5));
    REQUIRE(model.var_min(0) == 5);
    REQUIRE(model.var_size(0) == 6);

    REQUIRE(model.set_max(2, 0, 7));
    REQUIRE(model.var_max(0) == 7);
    REQUIRE(model.var_size(0) == 3);

    REQUIRE(!model.set_min(3, 0, 8));

    model.rewind_to(1);
    REQUIRE(model.var_max(0) == 10);
    REQUIRE(model.var_min(0) == 5);

    model.rewind_to(0);
    REQUIRE(model.var_min(0) == 1);
    REQUIRE(model.var_size(0) == 10);
    REQUIRE(model.contains(0, 4));
}

TEST_CASE("Model remove_value with trail", "[model][trail]") {
    Model model;
    model.create_variable("x", 1, 5);

    REQUIRE(model.remove_value(1, 0, 3));
    REQUIRE(model.var_size(0) == 4);
    REQUIRE(!model.contains(0, 3));

    REQUIRE(model.remove_value(2, 0, 1));
    REQUIRE(model.var_min(0) == 2);

    model.rewind_to(1);
    REQUIRE(model.var_size(0) == 4);
    REQUIRE(model.contains(0, 1));
    REQUIRE(!model.contains(0, 3));

    model.rewind_to(0);
    REQUIRE(model.var_size(0) == 5);
    REQUIRE(model.contains(0, 3));
}

TEST_CASE("Model no duplicate trail save at same level", "[model][trail]") {
    Model model;
    model.create_variable("x", 1, 10);

    REQUIRE(model.remove_value(1, 0, 5));
    REQUIRE(model.remove_value(1, 0, 6));
    REQUIRE(model.remove_value(1, 0, 7));
    REQUIRE(model.var_trail_size() == 1);

    model.rewind_to(0);
    REQUIRE(model.var_size(0) == 10);
    REQUIRE(model.contains(0, 6));
}

TEST_CASE("Model pending update queue", "[model]") {
    Model model;
    model.create_variable("x", 1, 5);

    REQUIRE(!model.has_pending_updates());
    model.enqueue_remove_value(0, 2);
    model.enqueue_set_max(0, 4);
    REQUIRE(model.has_pending_updates());

    auto first = model.pop_pending_update();
    REQUIRE(first.type == PendingUpdate::Type::RemoveValue);
    REQUIRE(first.value == 2);

    auto second = model.pop_pending_update();
    REQUIRE(second.type == PendingUpdate::Type::SetMax);
    REQUIRE(!model.has_pending_updates());

    model.enqueue_set_min(0, 3);
    model.clear_pending_updates();
    REQUIRE(!model.has_pending_updates());
}

TEST_CASE("Model watch list", "[model]") {
    Model model;
    auto x = model.create_variable("x", 0, 3);
    auto y = model.create_variable("y", 0, 3);
    auto z = model.create_variable("z", 0, 3);
    model.add_constraint(std::make_shared<IntDistGeConstraint>(x, y, 1));
    model.add_constraint(std::make_shared<IntNeOrConstraint>(x, z, y, z));
    model.build_constraint_watch_list();

    REQUIRE(model.constraints_for_var(0) == std::vector<size_t>{0, 1});
    REQUIRE(model.constraints_for_var(1) == std::vector<size_t>{0, 1});
    // z は int_ne_or に2回現れるが登録は1回
    REQUIRE(model.constraints_for_var(2) == std::vector<size_t>{1});
    REQUIRE(model.constraints_for_var(99).empty());
}
