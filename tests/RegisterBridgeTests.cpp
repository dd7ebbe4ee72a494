#include "SimulationHarness.hpp"
#include "register_bridge.hpp"
#include "register_map.hpp"
#include "safe_data_model.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace
{

struct BridgeFixture
{
    BridgeFixture()
        : data_model{std::make_shared<SafeDataModel>()},
          bridge{std::make_shared<RegisterBridge>(data_model, sim.controller)}
    {
        data_model->initialize(plantRegisters());
    }

    uint16_t word(uint16_t address)
    {
        uint16_t value = 0;
        EXPECT_TRUE(data_model->getRegisterValue(address, value)) << address;
        return value;
    }

    // Client write followed by the server's notification, as FC6 does it.
    std::optional<SimError> command(RegisterCommand cmd)
    {
        EXPECT_TRUE(data_model->setRegisterValue(reg::COMMAND, static_cast<uint16_t>(cmd)));
        return bridge->onHoldingWrite(reg::COMMAND, 1);
    }

    SimulationHarness sim;
    std::shared_ptr<SafeDataModel> data_model;
    std::shared_ptr<RegisterBridge> bridge;
};

}  // namespace

//-------------------------------------------------------------------------

TEST(SafeDataModelTest, ThirtyTwoBitValuesSplitHighWordFirst)
{
    SafeDataModel model;
    model.initialize(plantRegisters());

    ASSERT_TRUE(model.setLogicalValue(reg::RPM, uint32_t{200000}));
    uint16_t high = 0, low = 0;
    ASSERT_TRUE(model.getRegisterValue(reg::RPM, high));
    ASSERT_TRUE(model.getRegisterValue(reg::RPM + 1, low));
    EXPECT_EQ(high, 3u);
    EXPECT_EQ(low, 3392u);
}

//-------------------------------------------------------------------------

TEST(SafeDataModelTest, SignedValuesUseTwosComplement)
{
    SafeDataModel model;
    model.initialize(plantRegisters());

    ASSERT_TRUE(model.setLogicalValue(reg::CUMULATIVE_ENERGY_GJ, int32_t{-2217}));
    uint16_t high = 0, low = 0;
    model.getRegisterValue(reg::CUMULATIVE_ENERGY_GJ, high);
    model.getRegisterValue(reg::CUMULATIVE_ENERGY_GJ + 1, low);
    EXPECT_EQ(high, 0xFFFFu);
    EXPECT_EQ(low, 63319u);

    auto value = model.getLogicalValue(reg::CUMULATIVE_ENERGY_GJ);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(std::get<int32_t>(*value), -2217);
}

//-------------------------------------------------------------------------

TEST(SafeDataModelTest, RejectsMismatchedAndUnmappedWrites)
{
    SafeDataModel model;
    model.initialize(plantRegisters());

    EXPECT_FALSE(model.setLogicalValue(reg::RPM, uint16_t{5}));
    EXPECT_FALSE(model.setLogicalValue(39999, uint16_t{5}));

    EXPECT_FALSE(model.setRegisterValue(reg::STATUS, 1));
    EXPECT_FALSE(model.setRegisterValue(reg::LAST_RESULT, 1));
    EXPECT_FALSE(model.setRegisterValue(30100, 1));

    uint16_t value = 0;
    EXPECT_FALSE(model.getRegisterValue(30100, value));
}

//-------------------------------------------------------------------------

TEST(SafeDataModelTest, ClientWritesRebuildLogicalValue)
{
    SafeDataModel model;
    model.initialize(plantRegisters());

    ASSERT_TRUE(model.setRegisterValue(reg::CONDUIT_LENGTH_M, 1));
    ASSERT_TRUE(model.setRegisterValue(reg::CONDUIT_LENGTH_M + 1, 2));

    auto value = model.getLogicalValue(reg::CONDUIT_LENGTH_M);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(std::get<uint32_t>(*value), 65538u);
}

//-------------------------------------------------------------------------

TEST(SafeDataModelTest, BulkWriteIsAllOrNothing)
{
    SafeDataModel model;
    model.initialize(plantRegisters());

    // NUM_CONDUITS and ACTIVE_CONDUITS are writable, LAST_RESULT is not.
    EXPECT_FALSE(model.setRegisterValues(reg::NUM_CONDUITS, {4, 2, 1}));
    EXPECT_EQ(std::get<uint16_t>(*model.getLogicalValue(reg::NUM_CONDUITS)), 0u);
    EXPECT_EQ(std::get<uint16_t>(*model.getLogicalValue(reg::ACTIVE_CONDUITS)), 0u);

    ASSERT_TRUE(model.setRegisterValues(reg::DURATION_MIN, {45, 0, 1200}));
    EXPECT_EQ(std::get<uint16_t>(*model.getLogicalValue(reg::DURATION_MIN)), 45u);
    EXPECT_EQ(std::get<uint32_t>(*model.getLogicalValue(reg::CONDUIT_LENGTH_M)), 1200u);

    std::vector<uint16_t> words;
    ASSERT_TRUE(model.getRegisterValues(reg::DURATION_MIN, 3, words));
    EXPECT_EQ(words, (std::vector<uint16_t>{45, 0, 1200}));
    EXPECT_FALSE(model.getRegisterValues(reg::TOTAL_CAPACITY_GWH, 3, words));
    EXPECT_TRUE(words.empty());
}

//-------------------------------------------------------------------------

TEST(RegisterBridgeTest, StartCommandThroughRegisters)
{
    BridgeFixture f;

    ASSERT_TRUE(f.data_model->setRegisterValue(reg::SCENARIO_INDEX, 0));
    ASSERT_TRUE(f.data_model->setRegisterValue(reg::DURATION_MIN, 15));

    auto result = f.command(RegisterCommand::START);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, SimError::None);
    EXPECT_EQ(f.word(reg::LAST_RESULT), 0u);
    EXPECT_EQ(f.word(reg::COMMAND), 0u);

    auto state = f.sim.core->state();
    EXPECT_EQ(state.status, CoreStatus::ACCELERATING);
    EXPECT_EQ(state.scenario_id, "Peak Demand");
    EXPECT_DOUBLE_EQ(state.run_duration_seconds, 900.0);

    EXPECT_EQ(f.command(RegisterCommand::START), SimError::AlreadyRunning);
    EXPECT_EQ(f.word(reg::LAST_RESULT), 2u);
}

//-------------------------------------------------------------------------

TEST(RegisterBridgeTest, BadScenarioIndexReported)
{
    BridgeFixture f;

    ASSERT_TRUE(f.data_model->setRegisterValue(reg::SCENARIO_INDEX, 9));
    EXPECT_EQ(f.command(RegisterCommand::START), SimError::UnknownScenario);
    EXPECT_EQ(f.word(reg::LAST_RESULT), 1u);
    EXPECT_EQ(f.sim.core->state().status, CoreStatus::IDLE);
}

//-------------------------------------------------------------------------

TEST(RegisterBridgeTest, StopEmergencyAndReset)
{
    BridgeFixture f;

    EXPECT_EQ(f.command(RegisterCommand::STOP), SimError::NotRunning);
    EXPECT_EQ(f.word(reg::LAST_RESULT), 3u);

    EXPECT_EQ(f.command(RegisterCommand::EMERGENCY_STOP), SimError::None);
    EXPECT_EQ(f.sim.core->state().status, CoreStatus::EMERGENCY_STOPPED);

    EXPECT_EQ(f.command(RegisterCommand::RESET), SimError::None);
    EXPECT_EQ(f.sim.core->state().status, CoreStatus::IDLE);
}

//-------------------------------------------------------------------------

TEST(RegisterBridgeTest, NetworkConfigThroughRegisters)
{
    BridgeFixture f;

    ASSERT_TRUE(f.data_model->setLogicalValue(reg::CONDUIT_LENGTH_M, uint32_t{1200}));
    ASSERT_TRUE(f.data_model->setRegisterValue(reg::NUM_CONDUITS, 10));
    ASSERT_TRUE(f.data_model->setRegisterValue(reg::ACTIVE_CONDUITS, 10));

    EXPECT_EQ(f.command(RegisterCommand::APPLY_NETWORK_CONFIG), SimError::None);
    EXPECT_EQ(f.word(reg::STANDBY_CONDUITS), 0u);
    EXPECT_EQ(std::get<uint32_t>(*f.data_model->getLogicalValue(reg::REDUNDANCY_X1000)), 1000u);
    EXPECT_EQ(std::get<uint32_t>(*f.data_model->getLogicalValue(reg::TOTAL_CAPACITY_GWH)), 35024u);
    EXPECT_EQ(f.sim.network->current().num_conduits, 10u);

    ASSERT_TRUE(f.data_model->setRegisterValue(reg::ACTIVE_CONDUITS, 11));
    EXPECT_EQ(f.command(RegisterCommand::APPLY_NETWORK_CONFIG), SimError::InvalidConfig);
    EXPECT_EQ(f.word(reg::LAST_RESULT), 4u);
    EXPECT_EQ(f.sim.network->current().active_conduits, 10u);
}

//-------------------------------------------------------------------------

TEST(RegisterBridgeTest, WritesOutsideCommandRegisterIgnored)
{
    BridgeFixture f;

    ASSERT_TRUE(f.data_model->setRegisterValue(reg::SCENARIO_INDEX, 1));
    EXPECT_FALSE(f.bridge->onHoldingWrite(reg::SCENARIO_INDEX, 2).has_value());
    EXPECT_FALSE(f.bridge->onHoldingWrite(reg::COMMAND, 1).has_value());
    EXPECT_EQ(f.sim.core->state().status, CoreStatus::IDLE);
}

//-------------------------------------------------------------------------

TEST(RegisterBridgeTest, UnknownCommandCode)
{
    BridgeFixture f;

    ASSERT_TRUE(f.data_model->setRegisterValue(reg::COMMAND, 42));
    EXPECT_EQ(f.bridge->onHoldingWrite(reg::COMMAND, 1), SimError::InvalidConfig);
    EXPECT_EQ(f.word(reg::COMMAND), 0u);
}

//-------------------------------------------------------------------------

TEST(RegisterBridgeTest, PublishedTelemetryLandsInInputRegisters)
{
    BridgeFixture f;
    f.bridge->attach();
    f.bridge->attach();
    EXPECT_EQ(f.sim.channel->subscriberCount(), 1u);

    ASSERT_TRUE(f.sim.controller->start("Peak Demand", 15.0).ok());
    auto snapshot = f.sim.core->tick(10.0);
    ASSERT_TRUE(f.sim.channel->publish(snapshot));

    EXPECT_EQ(f.word(reg::STATUS), static_cast<uint16_t>(CoreStatus::ACCELERATING));
    EXPECT_EQ(std::get<uint32_t>(*f.data_model->getLogicalValue(reg::RPM)), 2500u);
    EXPECT_EQ(std::get<uint32_t>(*f.data_model->getLogicalValue(reg::POWER_GW)), 250u);
    EXPECT_EQ(std::get<uint32_t>(*f.data_model->getLogicalValue(reg::SEQUENCE)),
              static_cast<uint32_t>(snapshot.sequence));
    EXPECT_EQ(std::get<int32_t>(*f.data_model->getLogicalValue(reg::CUMULATIVE_ENERGY_GJ)),
              static_cast<int32_t>(std::lround(snapshot.cumulative_energy_gj)));

    f.bridge->detach();
    EXPECT_EQ(f.sim.channel->subscriberCount(), 0u);
}

//-------------------------------------------------------------------------
