#pragma once

#include <catch2/trompeloeil.hpp>
#include <epoch_monitor/suite/context.h>
#include <epoch_monitor/units/items.h>
#include <memory>
#include <string>
#include <vector>

namespace epoch_monitor::test {

inline glz::generic MakePayload(double value) {
    glz::generic payload;
    payload.data = glz::generic::object_t{};
    payload["current"].data = glz::generic::object_t{};
    payload["current"]["value"] = value;
    return payload;
}

/**
 * @brief Computational unit with a mockable Compute
 *
 * Identity accessors and dependencies come from ComputationalUnit. Only
 * Compute goes through Trompeloeil.
 *
 * Example usage:
 * @code
 * auto unit = std::make_shared<MockUnit>("Mean", UnitArgs{{"column_name", "age"}});
 * REQUIRE_CALL(*unit, Compute(trompeloeil::_, trompeloeil::_))
 *     .TIMES(1)
 *     .RETURN(Result{MakePayload(1.0)});
 * @endcode
 */
class MockUnit : public units::ComputationalUnit {
public:
    explicit MockUnit(std::string type, UnitArgs args = {},
                      epoch_core::UnitKind kind = epoch_core::UnitKind::Metric)
        : units::ComputationalUnit(std::move(type), std::move(args), kind) {}

    MAKE_CONST_MOCK2(Compute, Result(const InputData&, suite::Context&), override);
};
using MockUnitPtr = std::shared_ptr<MockUnit>;

/**
 * @brief Unit reading the "current.value" of a single dependency and adding an offset
 */
class OffsetUnit : public units::ComputationalUnit {
public:
    OffsetUnit(units::UnitPtr dependency, double offset)
        : units::ComputationalUnit("OffsetUnit", UnitArgs{{"offset", offset}},
                                   epoch_core::UnitKind::Metric),
          m_dependency(std::move(dependency)),
          m_offset(offset) {}

    std::vector<units::UnitPtr> GetDependencies() const override { return {m_dependency}; }

    Result Compute(const InputData& input, suite::Context& context) const override {
        const auto& base = GetDependencyResult(*m_dependency, input, context);
        return Result{MakePayload(base.GetNumber("current.value") + m_offset)};
    }

private:
    units::UnitPtr m_dependency;
    double m_offset;
};

// Stubbed feature id, mocked Generate.
class MockFeatureGenerator : public units::IFeatureGenerator {
public:
    explicit MockFeatureGenerator(std::string featureId) : m_featureId(std::move(featureId)) {}

    std::string GetFeatureId() const override { return m_featureId; }

    MAKE_CONST_MOCK2(Generate, epoch_frame::DataFrame(const epoch_frame::DataFrame&, const DataDefinition&),
                     override);

private:
    std::string m_featureId;
};

/**
 * @brief Unit requiring one additional feature and reporting its row counts
 *
 * "current.value" holds the rows of the current feature frame and
 * "reference.value" those of the reference frame, when present.
 */
class FeatureRowsUnit : public units::ComputationalUnit {
public:
    FeatureRowsUnit(std::string name, units::FeatureGeneratorPtr generator)
        : units::ComputationalUnit("FeatureRowsUnit", UnitArgs{{"name", std::move(name)}},
                                   epoch_core::UnitKind::Metric),
          m_generator(std::move(generator)) {}

    std::vector<units::FeatureGeneratorPtr> RequiredFeatures() const override { return {m_generator}; }

    Result Compute(const InputData& input, suite::Context&) const override {
        const auto featureId = m_generator->GetFeatureId();
        auto payload = MakePayload(static_cast<double>(input.currentFeatures.at(featureId).num_rows()));
        if (auto it = input.referenceFeatures.find(featureId); it != input.referenceFeatures.end()) {
            payload["reference"].data = glz::generic::object_t{};
            payload["reference"]["value"] = static_cast<double>(it->second.num_rows());
        }
        return Result{payload};
    }

private:
    units::FeatureGeneratorPtr m_generator;
};

/**
 * @brief Unit whose dependencies are resolved lazily, so tests can build cycles
 */
class LinkedUnit : public units::ComputationalUnit {
public:
    explicit LinkedUnit(std::string name)
        : units::ComputationalUnit("LinkedUnit", UnitArgs{{"name", std::move(name)}},
                                   epoch_core::UnitKind::Metric) {}

    void Link(const units::UnitPtr& next) { m_next = next; }

    std::vector<units::UnitPtr> GetDependencies() const override {
        if (auto next = m_next.lock()) {
            return {next};
        }
        return {};
    }

    Result Compute(const InputData& input, suite::Context& context) const override {
        if (auto next = m_next.lock()) {
            return GetDependencyResult(*next, input, context);
        }
        return Result{MakePayload(0.0)};
    }

private:
    std::weak_ptr<units::IComputationalUnit> m_next;
};

// Stubbed name, mocked Generate.
class MockPreset : public units::IPreset {
public:
    explicit MockPreset(std::string name) : m_name(std::move(name)) {}

    std::string GetName() const override { return m_name; }

    MAKE_CONST_MOCK2(Generate, std::vector<units::CheckItem>(const InputData&, const DatasetColumns&),
                     override);

private:
    std::string m_name;
};

class MockGenerator : public units::IGenerator {
public:
    explicit MockGenerator(std::string name) : m_name(std::move(name)) {}

    std::string GetName() const override { return m_name; }

    MAKE_CONST_MOCK1(Generate, std::vector<units::CheckItem>(const DatasetColumns&), override);

private:
    std::string m_name;
};

// Metric unit returning a fixed value; test kind reports the given status.
class FixedUnit : public units::ComputationalUnit {
public:
    FixedUnit(std::string name, double value)
        : units::ComputationalUnit("FixedUnit", UnitArgs{{"name", std::move(name)}},
                                   epoch_core::UnitKind::Metric),
          m_payload(MakePayload(value)) {}

    FixedUnit(std::string name, epoch_core::TestStatus status)
        : units::ComputationalUnit("FixedTest", UnitArgs{{"name", name}},
                                   epoch_core::UnitKind::Test),
          m_payload(MakeTestPayload(status, name + " checked")) {}

    Result Compute(const InputData&, suite::Context&) const override { return Result{m_payload}; }

private:
    glz::generic m_payload;
};

}  // namespace epoch_monitor::test
