//
// Unit tests for the execution engine
//

#include <catch2/catch_test_macros.hpp>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/suite/suite.h>

#include "../common/mock_units.h"
#include "../common/test_frames.h"

using namespace epoch_monitor;
using namespace epoch_monitor::test;
using trompeloeil::_;

namespace {
InputData MakeInput() {
    InputData input;
    input.current = CreateCurrentFrame();
    return input;
}
}  // namespace

TEST_CASE("Suite - Lifecycle", "[suite]") {
    suite::Suite engine;
    REQUIRE(engine.GetState() == epoch_core::SuiteState::Uninitialized);

    SECTION("Verify requires current data") {
        engine.Reset();
        REQUIRE_THROWS_AS(engine.Verify(InputData{}), ConfigurationError);
        REQUIRE(engine.GetState() == epoch_core::SuiteState::Reset);
    }

    SECTION("Run before Verify is rejected") {
        engine.Reset();
        REQUIRE_THROWS_AS(engine.Run(MakeInput()), std::logic_error);
    }

    SECTION("Units cannot be added after a run") {
        const auto input = MakeInput();
        engine.Reset();
        engine.Verify(input);
        engine.AddUnit(std::make_shared<FixedUnit>("a", 1.0));
        engine.Run(input);
        REQUIRE(engine.GetState() == epoch_core::SuiteState::Complete);
        REQUIRE_THROWS_AS(engine.AddUnit(std::make_shared<FixedUnit>("b", 1.0)), std::logic_error);
    }
}

TEST_CASE("Suite - Arena", "[suite]") {
    const auto input = MakeInput();
    suite::Suite engine;
    engine.Reset();
    engine.Verify(input);

    SECTION("Equal identities share a slot") {
        const auto first = engine.AddUnit(std::make_shared<FixedUnit>("a", 1.0));
        const auto second = engine.AddUnit(std::make_shared<FixedUnit>("b", 1.0));
        const auto again = engine.AddUnit(std::make_shared<FixedUnit>("a", 1.0));
        REQUIRE(first == 0);
        REQUIRE(second == 1);
        REQUIRE(again == first);
        REQUIRE(engine.GetUnits().size() == 2);
    }

    SECTION("Signed zero arguments share a slot") {
        const auto positive = engine.AddUnit(std::make_shared<MockUnit>("Threshold", UnitArgs{{"lt", 0.0}}));
        const auto negative = engine.AddUnit(std::make_shared<MockUnit>("Threshold", UnitArgs{{"lt", -0.0}}));
        REQUIRE(positive == negative);
        REQUIRE(engine.GetUnits().size() == 1);
    }

    SECTION("Dependency cycles are rejected at registration") {
        auto first = std::make_shared<LinkedUnit>("first");
        auto second = std::make_shared<LinkedUnit>("second");
        first->Link(second);
        second->Link(first);
        REQUIRE_THROWS_AS(engine.AddUnit(first), ConfigurationError);
        REQUIRE(engine.GetUnits().empty());

        second->Link(nullptr);
        REQUIRE(engine.AddUnit(first) == 1);
    }

    SECTION("A unit computing itself fails the run") {
        auto looping = std::make_shared<LinkedUnit>("looping");
        engine.AddUnit(looping);
        looping->Link(looping);
        REQUIRE_THROWS_AS(engine.Run(input), ComputationError);
        REQUIRE(engine.GetState() == epoch_core::SuiteState::Failed);
    }

    SECTION("Dependencies precede their dependents") {
        auto base = std::make_shared<MockUnit>("Base");
        const auto index = engine.AddUnit(std::make_shared<OffsetUnit>(base, 1.0));
        REQUIRE(index == 1);
        REQUIRE(engine.IndexOf(base->GetIdentity()) == 0);
        REQUIRE(engine.GetUnit(0) == base);
        REQUIRE_THROWS_AS(engine.GetUnit(2), std::out_of_range);
    }

    SECTION("Run computes in arena order, dependencies once") {
        auto base = std::make_shared<MockUnit>("Base");
        auto other = std::make_shared<MockUnit>("Other");
        trompeloeil::sequence seq;
        REQUIRE_CALL(*base, Compute(_, _)).IN_SEQUENCE(seq).RETURN(Result{MakePayload(5.0)});
        REQUIRE_CALL(*other, Compute(_, _)).IN_SEQUENCE(seq).RETURN(Result{MakePayload(1.0)});

        auto plusOne = std::make_shared<OffsetUnit>(base, 1.0);
        auto plusTwo = std::make_shared<OffsetUnit>(base, 2.0);
        engine.AddUnit(plusOne);
        engine.AddUnit(plusTwo);
        engine.AddUnit(other);
        engine.Run(input);

        REQUIRE(engine.GetState() == epoch_core::SuiteState::Complete);
        REQUIRE(plusOne->GetResult().GetNumber("current.value") == 6.0);
        REQUIRE(plusTwo->GetResult().GetNumber("current.value") == 7.0);
        REQUIRE(engine.GetContext().Size() == 4);
    }

    SECTION("A failing unit fails the run") {
        auto failing = std::make_shared<MockUnit>("Failing");
        REQUIRE_CALL(*failing, Compute(_, _)).THROW(std::runtime_error("division by zero"));

        engine.AddUnit(failing);
        REQUIRE_THROWS_AS(engine.Run(input), ComputationError);
        REQUIRE(engine.GetState() == epoch_core::SuiteState::Failed);
        REQUIRE_THROWS_AS(failing->GetResult(), ResultNotReadyError);
    }
}

TEST_CASE("Suite - Restore", "[suite]") {
    suite::Suite engine;

    SECTION("Restored units read their stored results") {
        auto unit = std::make_shared<FixedUnit>("a", 1.0);
        engine.Restore({unit}, {Result{MakePayload(3.0)}});
        REQUIRE(engine.GetState() == epoch_core::SuiteState::Complete);
        REQUIRE(unit->GetResult().GetNumber("current.value") == 3.0);
    }

    SECTION("Duplicate identities are corrupt") {
        REQUIRE_THROWS_AS(engine.Restore({std::make_shared<FixedUnit>("a", 1.0), std::make_shared<FixedUnit>("a", 1.0)},
                                        {Result{MakePayload(1.0)}, Result{MakePayload(2.0)}}),
                          CorruptSnapshotError);
    }
}

TEST_CASE("Suite - Additional features", "[suite]") {
    InputData input = MakeInput();
    input.reference = CreateReferenceFrame();
    suite::Suite engine;
    engine.Reset();
    engine.Verify(input);

    auto shared = std::make_shared<MockFeatureGenerator>("row_hash");
    auto duplicate = std::make_shared<MockFeatureGenerator>("row_hash");
    engine.AddUnit(std::make_shared<FeatureRowsUnit>("a", shared));
    engine.AddUnit(std::make_shared<FeatureRowsUnit>("b", duplicate));

    SECTION("One feature id is generated once per dataset") {
        REQUIRE_CALL(*shared, Generate(_, _)).TIMES(2).RETURN(_1);
        FORBID_CALL(*duplicate, Generate(_, _));

        const auto features = engine.CreateAdditionalFeatures(input);
        REQUIRE(features.current.size() == 1);
        REQUIRE(features.current.at("row_hash").num_rows() == 4);
        REQUIRE(features.reference.at("row_hash").num_rows() == 5);
    }

    SECTION("Without reference data only the current side is generated") {
        input.reference.reset();
        REQUIRE_CALL(*shared, Generate(_, _)).TIMES(1).RETURN(_1);

        const auto features = engine.CreateAdditionalFeatures(input);
        REQUIRE(features.current.size() == 1);
        REQUIRE(features.reference.empty());
    }
}
