/******************************************************************************
 * Copyright 2026 ETC Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 ******************************************************************************
 * This file is a part of AmpLink.
 *****************************************************************************/

#include "amplink/cpp/device_registry.h"

#include <memory>
#include <string>
#include "gmock/gmock.h"

using testing::_;
using testing::InSequence;
using testing::Ref;

struct TestPacket
{
  std::string name;
  int         value{0};
};

class TestDevice
{
public:
  explicit TestDevice(const TestPacket& packet) : name_(packet.name), value_(packet.value) {}

  const std::string& name() const { return name_; }
  int                value() const { return value_; }

  bool Merge(const TestPacket& packet)
  {
    bool changed = (packet.value != value_);
    value_ = packet.value;
    return changed;
  }

private:
  std::string name_;
  int         value_;
};

struct TestFamily
{
  using Device = TestDevice;
  using Packet = TestPacket;
};

using TestRegistry = amplink::DeviceRegistry<TestFamily>;

class MockRegistryNotifyHandler : public TestRegistry::NotifyHandler
{
public:
  MOCK_METHOD(void, HandleNewDevice, (TestDevice & device), (override));
  MOCK_METHOD(void, HandleDeviceUpdated, (TestDevice & device, bool changed), (override));
};

class TestDeviceRegistry : public testing::Test
{
protected:
  int          devices_created_{0};
  TestRegistry registry_{[this](const TestPacket& packet) {
    ++devices_created_;
    return std::make_unique<TestDevice>(packet);
  }};

  testing::StrictMock<MockRegistryNotifyHandler> handler_;

  void SetUp() override { registry_.AddNotifyHandler(handler_); }
};

TEST_F(TestDeviceRegistry, FirstPacketCreatesDevice)
{
  EXPECT_CALL(handler_, HandleNewDevice(_)).WillOnce([](TestDevice& device) {
    EXPECT_EQ(device.name(), "Amp A");
    EXPECT_EQ(device.value(), 1);
  });

  EXPECT_TRUE(registry_.HandlePacket(TestPacket{"Amp A", 1}));
  EXPECT_EQ(devices_created_, 1);
  EXPECT_EQ(registry_.size(), 1u);
  ASSERT_NE(registry_.FindDevice("Amp A"), nullptr);
  EXPECT_EQ(registry_.FindDevice("Amp B"), nullptr);
}

// A repeat packet for a known name is merged into the existing device and produces exactly one
// update notification, whether or not anything changed.
TEST_F(TestDeviceRegistry, RepeatPacketUpdatesDevice)
{
  EXPECT_CALL(handler_, HandleNewDevice(_));
  registry_.HandlePacket(TestPacket{"Amp A", 1});
  TestDevice* device = registry_.FindDevice("Amp A");
  ASSERT_NE(device, nullptr);

  EXPECT_CALL(handler_, HandleDeviceUpdated(Ref(*device), false));
  EXPECT_FALSE(registry_.HandlePacket(TestPacket{"Amp A", 1}));

  EXPECT_CALL(handler_, HandleDeviceUpdated(Ref(*device), true));
  EXPECT_FALSE(registry_.HandlePacket(TestPacket{"Amp A", 2}));

  EXPECT_EQ(devices_created_, 1);
  EXPECT_EQ(registry_.size(), 1u);
  EXPECT_EQ(device->value(), 2);
}

TEST_F(TestDeviceRegistry, DevicesAreListedInDiscoveryOrder)
{
  EXPECT_CALL(handler_, HandleNewDevice(_)).Times(3);
  EXPECT_CALL(handler_, HandleDeviceUpdated(_, _)).Times(1);
  registry_.HandlePacket(TestPacket{"Zebra", 0});
  registry_.HandlePacket(TestPacket{"Alpha", 0});
  registry_.HandlePacket(TestPacket{"Zebra", 0});
  registry_.HandlePacket(TestPacket{"Mid", 0});

  auto devices = registry_.GetDevices();
  ASSERT_EQ(devices.size(), 3u);
  EXPECT_EQ(devices[0]->name(), "Zebra");
  EXPECT_EQ(devices[1]->name(), "Alpha");
  EXPECT_EQ(devices[2]->name(), "Mid");
}

TEST_F(TestDeviceRegistry, HandlersAreCalledInOrderAdded)
{
  testing::StrictMock<MockRegistryNotifyHandler> second_handler;
  registry_.AddNotifyHandler(second_handler);
  // Adding a handler twice has no effect.
  registry_.AddNotifyHandler(handler_);

  {
    InSequence seq;
    EXPECT_CALL(handler_, HandleNewDevice(_));
    EXPECT_CALL(second_handler, HandleNewDevice(_));
  }
  registry_.HandlePacket(TestPacket{"Amp A", 0});
}

TEST_F(TestDeviceRegistry, RemovedHandlerIsNotCalled)
{
  registry_.RemoveNotifyHandler(handler_);
  registry_.HandlePacket(TestPacket{"Amp A", 0});
  EXPECT_EQ(registry_.size(), 1u);
}

// Handlers are called without the registry lock held.
TEST_F(TestDeviceRegistry, HandlerCanQueryRegistry)
{
  EXPECT_CALL(handler_, HandleNewDevice(_)).WillOnce([this](TestDevice& device) {
    EXPECT_EQ(registry_.FindDevice(device.name()), &device);
    EXPECT_EQ(registry_.GetDevices().size(), 1u);
  });
  registry_.HandlePacket(TestPacket{"Amp A", 0});
}

TEST_F(TestDeviceRegistry, ExternalUpdateIsDispatched)
{
  EXPECT_CALL(handler_, HandleNewDevice(_));
  registry_.HandlePacket(TestPacket{"Amp A", 0});
  TestDevice* device = registry_.FindDevice("Amp A");
  ASSERT_NE(device, nullptr);

  EXPECT_CALL(handler_, HandleDeviceUpdated(Ref(*device), true));
  registry_.NotifyDeviceUpdated(*device, true);
}

TEST_F(TestDeviceRegistry, FactoryFailureCreatesNothing)
{
  TestRegistry failing_registry([](const TestPacket&) { return std::unique_ptr<TestDevice>(); });
  failing_registry.AddNotifyHandler(handler_);

  EXPECT_FALSE(failing_registry.HandlePacket(TestPacket{"Amp A", 0}));
  EXPECT_EQ(failing_registry.size(), 0u);
}

TEST_F(TestDeviceRegistry, ClearRemovesAllDevices)
{
  EXPECT_CALL(handler_, HandleNewDevice(_)).Times(2);
  registry_.HandlePacket(TestPacket{"Amp A", 0});
  registry_.HandlePacket(TestPacket{"Amp B", 0});

  registry_.Clear();
  EXPECT_EQ(registry_.size(), 0u);
  EXPECT_TRUE(registry_.GetDevices().empty());
  EXPECT_EQ(registry_.FindDevice("Amp A"), nullptr);
}
