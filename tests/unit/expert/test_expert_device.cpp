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

#include <cmath>
#include <vector>
#include "gmock/gmock.h"
#include "amplink/expert/expert_prot.h"
#include "amplink_mocks.h"
#include "test_packets.h"

using testing::_;
using testing::Return;
using testing::SaveArg;

using amplink::CommandFrame;

static void ExpectSameStatus(const amplink::expert::Status& a, const amplink::expert::Status& b)
{
  EXPECT_EQ(a.name, b.name);
  EXPECT_EQ(a.ip_address, b.ip_address);
  EXPECT_EQ(a.power, b.power);
  EXPECT_EQ(a.muted, b.muted);
  EXPECT_EQ(a.volume, b.volume);
  EXPECT_EQ(a.source_index, b.source_index);
  EXPECT_EQ(a.sources, b.sources);
}

class TestExpertDevice : public testing::Test
{
protected:
  static constexpr uint32_t kDeviceIpv4 = 0xc0a8010a;  // 192.168.1.10

  testing::NiceMock<MockCommandTransport> transport_;
  amplink::expert::Settings              settings_;

  TestExpertDevice() { ON_CALL(transport_, Send(_, _)).WillByDefault(Return(etcpal::Error::Ok())); }

  amplink::expert::Status MakeStatus(const testpackets::ExpertStatusFields& fields = testpackets::ExpertStatusFields{})
  {
    auto buf = testpackets::ExpertStatus(fields);
    auto status = amplink::expert::ParseStatus(buf.data(), buf.size(), etcpal::IpAddr(kDeviceIpv4));
    EXPECT_TRUE(status);
    return *status;
  }

  std::unique_ptr<amplink::expert::Device> MakeDevice(
      const testpackets::ExpertStatusFields& fields = testpackets::ExpertStatusFields{})
  {
    return std::make_unique<amplink::expert::Device>(MakeStatus(fields), transport_, settings_);
  }
};

TEST_F(TestExpertDevice, InitialStateComesFromStatus)
{
  testpackets::ExpertStatusFields fields;
  fields.source_index = 1;
  fields.volume = 195;
  fields.muted = true;
  auto device = MakeDevice(fields);

  EXPECT_EQ(device->name(), "Living Room");
  EXPECT_EQ(device->ip_address(), etcpal::IpAddr(kDeviceIpv4));
  EXPECT_TRUE(device->power());
  EXPECT_TRUE(device->muted());
  EXPECT_EQ(device->volume(), 195u);
  EXPECT_DOUBLE_EQ(device->VolumeAsDb(), 0.0);
  EXPECT_FLOAT_EQ(device->VolumeAsFloat(), 195.0f / 255.0f);
  EXPECT_EQ(device->GetSource(), "Input 2");
  EXPECT_EQ(device->GetSources(), std::vector<std::string>({"Input 1", "Input 2", "Input 3"}));
  EXPECT_EQ(device->packet_counter(), 0u);
  EXPECT_EQ(device->command_counter(), 0u);
}

TEST_F(TestExpertDevice, VolumeToDbScale)
{
  EXPECT_DOUBLE_EQ(amplink::expert::VolumeToDb(0), -97.5);
  EXPECT_DOUBLE_EQ(amplink::expert::VolumeToDb(175), -10.0);
  EXPECT_DOUBLE_EQ(amplink::expert::VolumeToDb(195), 0.0);
  EXPECT_DOUBLE_EQ(amplink::expert::VolumeToDb(255), 30.0);
}

TEST_F(TestExpertDevice, MergeReportsChanges)
{
  auto device = MakeDevice();

  // The same status again changes nothing.
  auto before = device->status();
  EXPECT_FALSE(device->Merge(MakeStatus()));
  ExpectSameStatus(device->status(), before);

  testpackets::ExpertStatusFields fields;
  fields.volume = 150;
  EXPECT_TRUE(device->Merge(MakeStatus(fields)));
  EXPECT_EQ(device->volume(), 150u);
  before = device->status();
  EXPECT_FALSE(device->Merge(MakeStatus(fields)));
  ExpectSameStatus(device->status(), before);

  fields.source_index = 2;
  EXPECT_TRUE(device->Merge(MakeStatus(fields)));
  EXPECT_EQ(device->source_index(), 2u);
  EXPECT_TRUE(device->sources()[2].selected);
  EXPECT_FALSE(device->sources()[0].selected);

  fields.power = false;
  EXPECT_TRUE(device->Merge(MakeStatus(fields)));
  EXPECT_FALSE(device->power());

  fields.muted = true;
  EXPECT_TRUE(device->Merge(MakeStatus(fields)));
  EXPECT_TRUE(device->muted());
}

TEST_F(TestExpertDevice, MergeTracksAddressChange)
{
  auto device = MakeDevice();

  auto status = MakeStatus();
  status.ip_address = etcpal::IpAddr(0xc0a80120);
  EXPECT_TRUE(device->Merge(status));
  EXPECT_EQ(device->ip_address(), etcpal::IpAddr(0xc0a80120));
}

// Input names and enabled flags are refreshed, but do not count as a change on their own.
TEST_F(TestExpertDevice, MergeReplacesInputList)
{
  auto device = MakeDevice();

  testpackets::ExpertStatusFields fields;
  fields.num_enabled = 5;
  EXPECT_FALSE(device->Merge(MakeStatus(fields)));
  EXPECT_EQ(device->GetSources().size(), 5u);
}

TEST_F(TestExpertDevice, MergeIgnoresOtherDevice)
{
  auto device = MakeDevice();
  auto before = device->status();

  testpackets::ExpertStatusFields fields;
  fields.name = "Kitchen";
  fields.volume = 10;
  fields.power = false;
  fields.muted = true;
  fields.source_index = 1;
  fields.num_enabled = 5;
  auto other = MakeStatus(fields);
  other.ip_address = etcpal::IpAddr(0xc0a80120);

  EXPECT_FALSE(device->Merge(other));
  ExpectSameStatus(device->status(), before);
  EXPECT_EQ(device->packet_counter(), 0u);
  EXPECT_EQ(device->command_counter(), 0u);
}

TEST_F(TestExpertDevice, CommandIsSentToCommandPort)
{
  auto device = MakeDevice();

  etcpal::SockAddr dest;
  EXPECT_CALL(transport_, Send(_, _)).WillOnce(testing::DoAll(SaveArg<0>(&dest), Return(etcpal::Error::Ok())));
  EXPECT_EQ(device->TurnOff(), kEtcPalErrOk);

  EXPECT_EQ(dest, etcpal::SockAddr(kDeviceIpv4, 45455));
}

// Each command is transmitted transmit_count times. Every transmission gets the next packet
// counter; all transmissions of one command share a command counter.
TEST_F(TestExpertDevice, CountersAdvance)
{
  auto device = MakeDevice();

  std::vector<std::vector<CommandFrame>> sent;
  EXPECT_CALL(transport_, Send(_, _)).Times(2).WillRepeatedly([&sent](const etcpal::SockAddr&,
                                                                       const std::vector<CommandFrame>& frames) {
    sent.push_back(frames);
    return etcpal::Error::Ok();
  });

  EXPECT_EQ(device->TurnOn(), kEtcPalErrOk);
  EXPECT_EQ(device->SetMute(true), kEtcPalErrOk);

  ASSERT_EQ(sent.size(), 2u);
  ASSERT_EQ(sent[0].size(), 2u);
  ASSERT_EQ(sent[1].size(), 2u);

  // packet counter
  EXPECT_EQ(sent[0][0][3], 0u);
  EXPECT_EQ(sent[0][1][3], 1u);
  EXPECT_EQ(sent[1][0][3], 2u);
  EXPECT_EQ(sent[1][1][3], 3u);

  // command counter
  EXPECT_EQ(sent[0][0][5], 0u);
  EXPECT_EQ(sent[0][1][5], 0u);
  EXPECT_EQ(sent[1][0][5], 1u);
  EXPECT_EQ(sent[1][1][5], 1u);

  EXPECT_EQ(sent[0][0][7], 0x01);
  EXPECT_EQ(sent[1][0][7], 0x07);

  EXPECT_EQ(device->packet_counter(), 4u);
  EXPECT_EQ(device->command_counter(), 2u);
}

TEST_F(TestExpertDevice, TransmitCountIsHonored)
{
  settings_.transmit_count = 5;
  auto device = MakeDevice();

  EXPECT_CALL(transport_, Send(_, testing::SizeIs(5))).WillOnce(Return(etcpal::Error::Ok()));
  EXPECT_EQ(device->TurnOn(), kEtcPalErrOk);
  EXPECT_EQ(device->packet_counter(), 5u);
  EXPECT_EQ(device->command_counter(), 1u);
}

TEST_F(TestExpertDevice, SendErrorIsReturned)
{
  auto device = MakeDevice();

  EXPECT_CALL(transport_, Send(_, _)).WillOnce(Return(etcpal::Error(kEtcPalErrHostUnreach)));
  EXPECT_EQ(device->TurnOn(), kEtcPalErrHostUnreach);
}

TEST_F(TestExpertDevice, TogglePowerUsesRecordedState)
{
  testpackets::ExpertStatusFields fields;
  fields.power = false;
  auto device = MakeDevice(fields);

  std::vector<CommandFrame> frames;
  EXPECT_CALL(transport_, Send(_, _)).WillOnce(testing::DoAll(SaveArg<1>(&frames), Return(etcpal::Error::Ok())));
  EXPECT_EQ(device->TogglePower(), kEtcPalErrOk);

  ASSERT_FALSE(frames.empty());
  EXPECT_EQ(frames[0][6], 0x01);
  EXPECT_EQ(frames[0][7], 0x01);
}

TEST_F(TestExpertDevice, SetVolumeDbSendsCode)
{
  testpackets::ExpertStatusFields fields;
  fields.volume = 100;
  auto device = MakeDevice(fields);

  std::vector<CommandFrame> frames;
  EXPECT_CALL(transport_, Send(_, _)).WillOnce(testing::DoAll(SaveArg<1>(&frames), Return(etcpal::Error::Ok())));
  EXPECT_EQ(device->SetVolumeDb(-10.0), kEtcPalErrOk);

  ASSERT_FALSE(frames.empty());
  EXPECT_EQ(frames[0][7], 0x04);
  EXPECT_EQ(frames[0][8], 0xc1);
  EXPECT_EQ(frames[0][9], 0x20);
}

// Requests above the configured maximum are clamped to it.
TEST_F(TestExpertDevice, SetVolumeDbClampsToMaximum)
{
  testpackets::ExpertStatusFields fields;
  fields.volume = 100;
  auto device = MakeDevice(fields);

  std::vector<CommandFrame> frames;
  EXPECT_CALL(transport_, Send(_, _)).WillOnce(testing::DoAll(SaveArg<1>(&frames), Return(etcpal::Error::Ok())));
  EXPECT_EQ(device->SetVolumeDb(20.0), kEtcPalErrOk);

  ASSERT_FALSE(frames.empty());
  auto expected = amplink::expert::VolumeCode(-10.0);
  EXPECT_EQ(frames[0][8], expected >> 8);
  EXPECT_EQ(frames[0][9], expected & 0xff);
}

TEST_F(TestExpertDevice, SetVolumeDbClampsToMinimum)
{
  auto device = MakeDevice();

  std::vector<CommandFrame> frames;
  EXPECT_CALL(transport_, Send(_, _)).WillOnce(testing::DoAll(SaveArg<1>(&frames), Return(etcpal::Error::Ok())));
  EXPECT_EQ(device->SetVolumeDb(-200.0), kEtcPalErrOk);

  ASSERT_FALSE(frames.empty());
  EXPECT_EQ(frames[0][8], 0xc2);
  EXPECT_EQ(frames[0][9], 0xc3);
}

// Nothing is sent when the requested level is already the recorded level.
TEST_F(TestExpertDevice, SetVolumeDbSameLevelSendsNothing)
{
  auto device = MakeDevice();  // volume 175 is -10dB

  EXPECT_CALL(transport_, Send(_, _)).Times(0);
  EXPECT_EQ(device->SetVolumeDb(-10.0), kEtcPalErrOk);
  EXPECT_EQ(device->SetVolumeDb(-10.2), kEtcPalErrOk);
  EXPECT_EQ(device->command_counter(), 0u);
}

TEST_F(TestExpertDevice, SetVolumeDbRejectsNan)
{
  auto device = MakeDevice();

  EXPECT_CALL(transport_, Send(_, _)).Times(0);
  EXPECT_EQ(device->SetVolumeDb(std::nan("")), kEtcPalErrInvalid);
  EXPECT_EQ(device->SetVolumeFloat(std::nanf("")), kEtcPalErrInvalid);
}

TEST_F(TestExpertDevice, SetVolumeIntClampsToMaximum)
{
  testpackets::ExpertStatusFields fields;
  fields.volume = 100;
  auto device = MakeDevice(fields);

  std::vector<CommandFrame> frames;
  EXPECT_CALL(transport_, Send(_, _)).WillOnce(testing::DoAll(SaveArg<1>(&frames), Return(etcpal::Error::Ok())));
  EXPECT_EQ(device->SetVolumeInt(250), kEtcPalErrOk);

  ASSERT_FALSE(frames.empty());
  EXPECT_EQ(frames[0][8], 0xc1);
  EXPECT_EQ(frames[0][9], 0x20);
}

TEST_F(TestExpertDevice, VolumeStepsFromRecordedLevel)
{
  testpackets::ExpertStatusFields fields;
  fields.volume = 100;  // -47.5dB
  auto device = MakeDevice(fields);

  std::vector<CommandFrame> up_frames;
  std::vector<CommandFrame> down_frames;
  EXPECT_CALL(transport_, Send(_, _))
      .WillOnce(testing::DoAll(SaveArg<1>(&up_frames), Return(etcpal::Error::Ok())))
      .WillOnce(testing::DoAll(SaveArg<1>(&down_frames), Return(etcpal::Error::Ok())));
  EXPECT_EQ(device->VolumeUp(), kEtcPalErrOk);
  EXPECT_EQ(device->VolumeDown(), kEtcPalErrOk);

  auto up_code = amplink::expert::VolumeCode(-47.0);
  auto down_code = amplink::expert::VolumeCode(-48.0);
  ASSERT_FALSE(up_frames.empty());
  ASSERT_FALSE(down_frames.empty());
  EXPECT_EQ(up_frames[0][8], up_code >> 8);
  EXPECT_EQ(up_frames[0][9], up_code & 0xff);
  EXPECT_EQ(down_frames[0][8], down_code >> 8);
  EXPECT_EQ(down_frames[0][9], down_code & 0xff);
}

TEST_F(TestExpertDevice, VolumeUpAtMaximumSendsNothing)
{
  auto device = MakeDevice();  // 175 is the maximum

  EXPECT_CALL(transport_, Send(_, _)).Times(0);
  EXPECT_EQ(device->VolumeUp(), kEtcPalErrOk);
}

TEST_F(TestExpertDevice, SelectSourceByName)
{
  auto device = MakeDevice();

  std::vector<CommandFrame> frames;
  EXPECT_CALL(transport_, Send(_, _)).WillOnce(testing::DoAll(SaveArg<1>(&frames), Return(etcpal::Error::Ok())));
  EXPECT_EQ(device->SelectSource("Input 3"), kEtcPalErrOk);

  ASSERT_FALSE(frames.empty());
  EXPECT_EQ(frames[0][7], 0x05);
  EXPECT_EQ(frames[0][8], 0x40);
  EXPECT_EQ(frames[0][9], 0x40);
}

TEST_F(TestExpertDevice, SelectSourceRejectsUnknownOrDisabled)
{
  auto device = MakeDevice();  // inputs 1-3 enabled

  EXPECT_CALL(transport_, Send(_, _)).Times(0);
  EXPECT_EQ(device->SelectSource("Turntable"), kEtcPalErrInvalid);
  EXPECT_EQ(device->SelectSource("Input 4"), kEtcPalErrInvalid);
  EXPECT_EQ(device->command_counter(), 0u);
}

TEST_F(TestExpertDevice, ToStringDescribesDevice)
{
  auto device = MakeDevice();
  EXPECT_EQ(device->ToString(),
            "Expert \"Living Room\" at 192.168.1.10. Volume: 175 (-10.0dB, 0.69) Power: on Muted: no Source: Input 1");
}
