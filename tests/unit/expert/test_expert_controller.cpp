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

#include "amplink/cpp/expert.h"

#include "gmock/gmock.h"
#include "etcpal_mock/common.h"
#include "amplink/cpp/common.h"
#include "amplink_mocks.h"
#include "test_packets.h"

using testing::_;
using testing::Return;

class TestExpertController : public testing::Test
{
protected:
  const etcpal::SockAddr kSender{0xc0a8010a, 45454};

  ListenerMock                                 listener_;
  ListenerMock                                 replacement_listener_;
  testing::StrictMock<MockExpertNotifyHandler> handler_;
  MockCommandTransport*                        transport_{new testing::NiceMock<MockCommandTransport>};
  amplink::expert::Controller controller_{std::unique_ptr<amplink::CommandTransport>(transport_)};

  void SetUp() override
  {
    etcpal_reset_all_fakes();
    ASSERT_EQ(amplink::Init(), kEtcPalErrOk);
    controller_.AddNotifyHandler(handler_);
  }

  void TearDown() override
  {
    controller_.Shutdown();
    amplink::Deinit();
  }

  void StartController(const amplink::expert::Settings& settings = amplink::expert::Settings{})
  {
    EXPECT_CALL(*listener_.listener, Start(settings.listen_port));
    ASSERT_EQ(controller_.Startup(settings, nullptr, listener_.Take()), kEtcPalErrOk);
  }
};

TEST_F(TestExpertController, StartupListensOnStatusPort)
{
  StartController();
  EXPECT_TRUE(controller_.listening());
  EXPECT_EQ(controller_.settings().listen_port, 45454u);
  EXPECT_EQ(controller_.settings().command_port, 45455u);
}

TEST_F(TestExpertController, StartupRejectsInvalidSettings)
{
  amplink::expert::Settings settings;
  settings.transmit_count = 0;
  EXPECT_EQ(controller_.Startup(settings, nullptr, listener_.Take()), kEtcPalErrInvalid);

  amplink::expert::Controller other_controller;
  settings = amplink::expert::Settings{};
  settings.listen_port = 0;
  EXPECT_EQ(other_controller.Startup(settings), kEtcPalErrInvalid);

  settings = amplink::expert::Settings{};
  settings.max_volume_db = 31.0;
  EXPECT_EQ(other_controller.Startup(settings), kEtcPalErrInvalid);
}

TEST_F(TestExpertController, StartupRequiresInit)
{
  amplink::Deinit();
  EXPECT_EQ(controller_.Startup(amplink::expert::Settings{}, nullptr, listener_.Take()), kEtcPalErrNotInit);
  ASSERT_EQ(amplink::Init(), kEtcPalErrOk);
}

TEST_F(TestExpertController, ListenerErrorIsReturned)
{
  EXPECT_CALL(*listener_.listener, Start(_)).WillOnce(Return(etcpal::Error(kEtcPalErrAddrInUse)));
  EXPECT_EQ(controller_.Startup(amplink::expert::Settings{}, nullptr, listener_.Take()), kEtcPalErrAddrInUse);
  EXPECT_FALSE(controller_.listening());
}

TEST_F(TestExpertController, StatusBroadcastCreatesDevice)
{
  StartController();

  EXPECT_CALL(handler_, HandleNewDevice(_)).WillOnce([](amplink::expert::Device& device) {
    EXPECT_EQ(device.name(), "Living Room");
    EXPECT_EQ(device.ip_address(), etcpal::IpAddr(0xc0a8010a));
  });
  listener_.Receive(testpackets::ExpertStatus(), kSender);

  ASSERT_NE(controller_.FindDevice("Living Room"), nullptr);
  EXPECT_EQ(controller_.GetDevices().size(), 1u);
}

TEST_F(TestExpertController, RepeatBroadcastUpdatesDevice)
{
  StartController();

  EXPECT_CALL(handler_, HandleNewDevice(_));
  listener_.Receive(testpackets::ExpertStatus(), kSender);

  EXPECT_CALL(handler_, HandleDeviceUpdated(_, false));
  listener_.Receive(testpackets::ExpertStatus(), kSender);

  testpackets::ExpertStatusFields fields;
  fields.muted = true;
  EXPECT_CALL(handler_, HandleDeviceUpdated(_, true));
  listener_.Receive(testpackets::ExpertStatus(fields), kSender);

  EXPECT_EQ(controller_.GetDevices().size(), 1u);
  EXPECT_TRUE(controller_.FindDevice("Living Room")->muted());
}

TEST_F(TestExpertController, DevicesAreKeyedByName)
{
  StartController();

  EXPECT_CALL(handler_, HandleNewDevice(_)).Times(2);
  listener_.Receive(testpackets::ExpertStatus(), kSender);

  testpackets::ExpertStatusFields fields;
  fields.name = "Kitchen";
  listener_.Receive(testpackets::ExpertStatus(fields), etcpal::SockAddr(0xc0a8010b, 45454));

  auto devices = controller_.GetDevices();
  ASSERT_EQ(devices.size(), 2u);
  EXPECT_EQ(devices[0]->name(), "Living Room");
  EXPECT_EQ(devices[1]->name(), "Kitchen");
}

// Datagrams that are not valid status broadcasts are dropped without notifying anyone.
TEST_F(TestExpertController, MalformedDatagramIsDropped)
{
  StartController();

  auto truncated = testpackets::ExpertStatus();
  truncated.resize(200);
  listener_.Receive(truncated, kSender);

  auto bad_name = testpackets::ExpertStatus();
  bad_name[19] = 0xfe;
  listener_.Receive(bad_name, kSender);

  EXPECT_TRUE(controller_.GetDevices().empty());
}

TEST_F(TestExpertController, DeviceUsesControllerTransportAndSettings)
{
  amplink::expert::Settings settings;
  settings.command_port = 50000;
  settings.transmit_count = 3;
  StartController(settings);

  EXPECT_CALL(handler_, HandleNewDevice(_));
  listener_.Receive(testpackets::ExpertStatus(), kSender);

  auto device = controller_.FindDevice("Living Room");
  ASSERT_NE(device, nullptr);

  EXPECT_CALL(*transport_, Send(etcpal::SockAddr(0xc0a8010a, 50000), testing::SizeIs(3)))
      .WillOnce(Return(etcpal::Error::Ok()));
  EXPECT_EQ(device->TurnOff(), kEtcPalErrOk);
}

// Devices stay usable after the controller stops listening.
TEST_F(TestExpertController, ShutdownKeepsDevices)
{
  StartController();

  EXPECT_CALL(handler_, HandleNewDevice(_));
  listener_.Receive(testpackets::ExpertStatus(), kSender);

  controller_.Shutdown();
  EXPECT_FALSE(controller_.listening());
  EXPECT_NE(controller_.FindDevice("Living Room"), nullptr);
}

TEST_F(TestExpertController, StartupTwiceIsHarmless)
{
  StartController();
  EXPECT_EQ(controller_.Startup(), kEtcPalErrOk);
  EXPECT_TRUE(controller_.listening());
}

TEST_F(TestExpertController, StartupAfterListenerFailureListensAgain)
{
  StartController();

  // The listener stopped itself.
  listener_.running = false;
  ASSERT_FALSE(controller_.listening());

  EXPECT_CALL(*listener_.listener, Stop());
  EXPECT_CALL(*replacement_listener_.listener, Start(45454));
  EXPECT_EQ(controller_.Startup(amplink::expert::Settings{}, nullptr, replacement_listener_.Take()), kEtcPalErrOk);
  EXPECT_TRUE(controller_.listening());
  EXPECT_NE(replacement_listener_.notify, nullptr);
}
