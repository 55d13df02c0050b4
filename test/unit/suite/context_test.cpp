//
// Unit tests for the per-run result cache
//

#include <catch2/catch_test_macros.hpp>
#include <epoch_monitor/core/errors.h>
#include <epoch_monitor/suite/context.h>

#include "../common/mock_units.h"
#include "../common/test_frames.h"

using namespace epoch_monitor;
using namespace epoch_monitor::test;
using trompeloeil::_;

TEST_CASE("Context - Compute once per identity", "[context]") {
    InputData input;
    input.current = CreateCurrentFrame();
    suite::Context context;

    SECTION("Equal identities share one computation") {
        auto first = std::make_shared<MockUnit>("Mean", UnitArgs{{"column_name", "age"}});
        auto twin = std::make_shared<MockUnit>("Mean", UnitArgs{{"column_name", "age"}});

        REQUIRE_CALL(*first, Compute(_, _)).TIMES(1).RETURN(Result{MakePayload(7.0)});
        FORBID_CALL(*twin, Compute(_, _));

        REQUIRE(context.GetOrCompute(*first, input).GetNumber("current.value") == 7.0);
        REQUIRE(context.GetOrCompute(*twin, input).GetNumber("current.value") == 7.0);
        REQUIRE(context.Size() == 1);
    }

    SECTION("Shared dependency is computed once for two dependents") {
        auto base = std::make_shared<MockUnit>("Base");
        REQUIRE_CALL(*base, Compute(_, _)).TIMES(1).RETURN(Result{MakePayload(10.0)});

        const OffsetUnit plusOne{base, 1.0};
        const OffsetUnit plusTwo{base, 2.0};
        REQUIRE(context.GetOrCompute(plusOne, input).GetNumber("current.value") == 11.0);
        REQUIRE(context.GetOrCompute(plusTwo, input).GetNumber("current.value") == 12.0);
        REQUIRE(context.Size() == 3);
    }

    SECTION("Failures carry the identity of the failing unit") {
        auto base = std::make_shared<MockUnit>("Base", UnitArgs{{"k", 1}});
        REQUIRE_CALL(*base, Compute(_, _)).THROW(std::runtime_error("boom"));

        const OffsetUnit dependent{base, 1.0};
        try {
            context.GetOrCompute(dependent, input);
            FAIL("Should have thrown");
        } catch (const ComputationError& e) {
            REQUIRE(e.Identity() == base->GetIdentity());
        }
        REQUIRE(context.Size() == 0);
    }

    SECTION("Reset forgets results") {
        auto unit = std::make_shared<MockUnit>("Mean");
        REQUIRE_CALL(*unit, Compute(_, _)).TIMES(2).RETURN(Result{MakePayload(1.0)});

        context.GetOrCompute(*unit, input);
        context.Reset();
        REQUIRE(context.Find(unit->GetIdentity()) == nullptr);
        context.GetOrCompute(*unit, input);
    }
}

TEST_CASE("Context - Results are never overwritten", "[context]") {
    suite::Context context;
    const UnitIdentity identity{"Mean", {{"column_name", "age"}}};

    context.Insert(identity, Result{MakePayload(1.0)});
    REQUIRE_THROWS_AS(context.Insert(identity, Result{MakePayload(2.0)}), std::logic_error);
    REQUIRE(context.Find(identity)->GetNumber("current.value") == 1.0);
}
