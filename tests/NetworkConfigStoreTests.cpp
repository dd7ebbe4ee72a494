#include "energy_model.hpp"
#include "network_config_store.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace
{

NetworkConfigStore defaultStore()
{
    return NetworkConfigStore{EnergyModel{CoreParams{}, ConduitParams{}}, NetworkConfig{6437, 3, 2}};
}

}  // namespace

//-------------------------------------------------------------------------

TEST(NetworkConfigStoreTest, StartsWithInitialTopology)
{
    auto store = defaultStore();

    auto config = store.current();
    EXPECT_EQ(config.conduit_length_m, 6437u);
    EXPECT_EQ(config.num_conduits, 3u);
    EXPECT_EQ(config.active_conduits, 2u);

    auto capacity = store.capacity();
    EXPECT_EQ(capacity.standby_conduits, 1u);
    EXPECT_GT(capacity.total_capacity_gwh, 0.0);
}

//-------------------------------------------------------------------------

TEST(NetworkConfigStoreTest, ValidUpdateReplacesConfigAndCapacity)
{
    auto store = defaultStore();

    auto result = store.update(1200, 10, 10);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value->standby_conduits, 0u);
    EXPECT_EQ(result.value->redundancy_factor, 1.0);

    EXPECT_EQ(store.current().num_conduits, 10u);
    EXPECT_EQ(store.current().conduit_length_m, 1200u);
    EXPECT_EQ(store.capacity().total_capacity_gwh, result.value->total_capacity_gwh);
}

//-------------------------------------------------------------------------

TEST(NetworkConfigStoreTest, MoreActiveThanTotalRejected)
{
    auto store = defaultStore();
    auto before = store.capacity();

    auto result = store.update(100, 5, 10);
    EXPECT_EQ(result.error, SimError::InvalidConfig);
    EXPECT_FALSE(result.value.has_value());

    auto config = store.current();
    EXPECT_EQ(config.conduit_length_m, 6437u);
    EXPECT_EQ(config.num_conduits, 3u);
    EXPECT_EQ(config.active_conduits, 2u);
    EXPECT_EQ(store.capacity().total_capacity_gwh, before.total_capacity_gwh);
}

//-------------------------------------------------------------------------

TEST(NetworkConfigStoreTest, ZeroValuesRejected)
{
    auto store = defaultStore();

    EXPECT_EQ(store.update(0, 3, 2).error, SimError::InvalidConfig);
    EXPECT_EQ(store.update(1000, 0, 0).error, SimError::InvalidConfig);
    EXPECT_EQ(store.update(1000, 3, 0).error, SimError::InvalidConfig);
    EXPECT_EQ(store.current().conduit_length_m, 6437u);
}

//-------------------------------------------------------------------------

TEST(NetworkConfigStoreTest, Validation)
{
    EXPECT_TRUE(NetworkConfigStore::isValid({1, 1, 1}));
    EXPECT_TRUE(NetworkConfigStore::isValid({6437, 3, 3}));
    EXPECT_FALSE(NetworkConfigStore::isValid({6437, 3, 4}));
    EXPECT_FALSE(NetworkConfigStore::isValid({0, 3, 2}));
}

//-------------------------------------------------------------------------

TEST(NetworkConfigStoreTest, InvalidInitialConfigThrows)
{
    EnergyModel model{CoreParams{}, ConduitParams{}};

    EXPECT_THROW(NetworkConfigStore(model, NetworkConfig{6437, 2, 3}), std::invalid_argument);
    EXPECT_THROW(NetworkConfigStore(model, NetworkConfig{6437, 0, 0}), std::invalid_argument);
}

//-------------------------------------------------------------------------
