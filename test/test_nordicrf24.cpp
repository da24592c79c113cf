//   Copyright 2017 Aidan Holmes

//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//       http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.

#include "nordicrf24.hpp"
#include "simrf24.hpp"
#include <gtest/gtest.h>
#include <string.h>
#include <vector>

static const uint8_t node1[5] = {'N','o','d','e','1'} ;
static const uint8_t node2[5] = {'N','o','d','e','2'} ;

class NordicRF24Test : public ::testing::Test{
protected:
  NordicRF24Test() : a(22, &air), b(22, &air){}

  // Index of the first event matching type and code, or -1
  int find_event(const SimRF24 &chip, SimRF24::event_type type, uint8_t code, size_t from = 0){
    const std::vector<SimRF24::Event> &ev = chip.events() ;
    for (size_t i=from; i < ev.size(); i++){
      if (ev[i].type == type && ev[i].code == code) return i ;
    }
    return -1 ;
  }

  SimAir air ;
  SimRF24 a ;
  SimRF24 b ;
};

TEST_F(NordicRF24Test, ConstructionWritesRegistersOnceInOrder)
{
  NordicRF24 radio(&a, &a, 22, &a) ;

  const uint8_t expected[] = {
    REG_SETUP_AW, REG_SETUP_RETR, REG_RF_CH, REG_RF_SETUP, REG_FEATURE,
    REG_DYNPD, REG_EN_AA, REG_EN_RXADDR,
    REG_RX_PW_BASE, REG_RX_PW_BASE+1, REG_RX_PW_BASE+2,
    REG_RX_PW_BASE+3, REG_RX_PW_BASE+4, REG_RX_PW_BASE+5,
    REG_STATUS, REG_CONFIG
  } ;
  EXPECT_EQ(std::vector<uint8_t>(expected, expected+sizeof(expected)), a.written_registers()) ;

  EXPECT_EQ(0x03, a.reg(REG_SETUP_AW)) ;
  EXPECT_EQ(0x05, a.reg(REG_SETUP_RETR)) ;
  EXPECT_EQ(76, a.reg(REG_RF_CH)) ;
  EXPECT_EQ(0x06, a.reg(REG_RF_SETUP)) ;
  EXPECT_EQ(CONFIG_EN_CRC | CONFIG_CRCO | CONFIG_PWR_UP, a.reg(REG_CONFIG)) ;
  EXPECT_EQ(RF24Mode::mode_standby, radio.get_mode()) ;
  EXPECT_FALSE(a.ce()) ;
}

TEST_F(NordicRF24Test, PowerUpSettlesBeforeNextAccess)
{
  NordicRF24 radio(&a, &a, 22, &a) ;

  int cfg = find_event(a, SimRF24::ev_write_reg, REG_CONFIG) ;
  ASSERT_GE(cfg, 0) ;
  ASSERT_LT(cfg+1, (int)a.events().size()) ;
  const SimRF24::Event &next = a.events()[cfg+1] ;
  EXPECT_EQ(SimRF24::ev_sleep, next.type) ;
  EXPECT_GE(next.us, 1500u) ;
}

TEST_F(NordicRF24Test, NotConnected)
{
  a.set_unresponsive(true) ;
  EXPECT_THROW({NordicRF24 radio(&a, &a, 22, &a);}, RF24NotConnectedErr) ;
}

TEST_F(NordicRF24Test, IsConnected)
{
  NordicRF24 radio(&a, &a, 22, &a) ;
  EXPECT_TRUE(radio.is_connected()) ;
  a.set_unresponsive(true) ;
  EXPECT_FALSE(radio.is_connected()) ;
}

TEST_F(NordicRF24Test, RequiresHardware)
{
  EXPECT_THROW({NordicRF24 radio(NULL, &a, 22, &a);}, RF24Exception) ;
  EXPECT_THROW({NordicRF24 radio(&a, NULL, 22, &a);}, RF24Exception) ;
  EXPECT_THROW({NordicRF24 radio(&a, &a, 22, NULL);}, RF24Exception) ;
}

TEST_F(NordicRF24Test, TransportFailureReleasesBus)
{
  NordicRF24 radio(&a, &a, 22, &a) ;
  a.fail_transfer_after(0) ;
  EXPECT_THROW(radio.status(), RF24TransportErr) ;
  EXPECT_FALSE(a.is_selected()) ;

  a.fail_transfer_after(-1) ;
  a.fail_select(true) ;
  EXPECT_THROW(radio.flush_tx(), RF24TransportErr) ;
}

TEST_F(NordicRF24Test, NoDataAfterConstruction)
{
  NordicRF24 radio(&a, &a, 22, &a) ;
  EXPECT_FALSE(radio.data_available()) ;
  uint8_t pipe = 0xFF ;
  EXPECT_FALSE(radio.data_available_on_pipe(pipe)) ;
}

TEST_F(NordicRF24Test, HelloWorld)
{
  RF24Config config ;
  config.set_channel(8).set_power_level(RF24_NEG18DBM).set_payload_size(12) ;

  NordicRF24 sender(&a, &a, 22, &a, config) ;
  NordicRF24 receiver(&b, &b, 22, &b, config) ;
  EXPECT_EQ(8, a.reg(REG_RF_CH)) ;
  EXPECT_EQ(0x00, a.reg(REG_RF_SETUP)) ;

  receiver.open_reading_pipe(0, node1, 5) ;
  receiver.start_listening() ;
  sender.open_writing_pipe(node1, 5) ;
  sender.write((const uint8_t*)"Hello world!", 12) ;

  EXPECT_TRUE(receiver.data_available()) ;
  uint8_t buffer[RF24_MAX_PAYLOAD] ;
  uint8_t pipe = 0xFF ;
  ASSERT_EQ(12, receiver.read(buffer, sizeof(buffer), &pipe)) ;
  EXPECT_EQ(0, memcmp("Hello world!", buffer, 12)) ;
  EXPECT_EQ(0, pipe) ;
  EXPECT_FALSE(receiver.data_available()) ;
  EXPECT_EQ(RF24Mode::mode_standby, sender.get_mode()) ;
}

TEST_F(NordicRF24Test, DynamicRoundTrip)
{
  RF24Config config ;
  config.set_dynamic_payloads(true) ;

  NordicRF24 sender(&a, &a, 22, &a, config) ;
  NordicRF24 receiver(&b, &b, 22, &b, config) ;
  receiver.open_reading_pipe(1, node1, 5) ;
  receiver.start_listening() ;
  sender.open_writing_pipe(node1, 5) ;

  uint8_t out[RF24_MAX_PAYLOAD], in[RF24_MAX_PAYLOAD] ;
  for (uint8_t len=1; len <= RF24_MAX_PAYLOAD; len++){
    for (uint8_t i=0; i < len; i++) out[i] = len * 7 + i ;
    sender.write(out, len) ;
    uint8_t pipe = 0 ;
    ASSERT_EQ(len, receiver.read(in, sizeof(in), &pipe)) ;
    EXPECT_EQ(1, pipe) ;
    EXPECT_EQ(0, memcmp(out, in, len)) << "length " << (int)len ;
  }
}

TEST_F(NordicRF24Test, StaticRoundTrip)
{
  const uint8_t widths[] = {1, 2, 16, 31, RF24_MAX_PAYLOAD} ;
  uint8_t out[RF24_MAX_PAYLOAD], in[RF24_MAX_PAYLOAD] ;

  for (size_t w=0; w < sizeof(widths); w++){
    uint8_t len = widths[w] ;
    RF24Config config ;
    config.set_payload_size(len) ;

    NordicRF24 sender(&a, &a, 22, &a, config) ;
    NordicRF24 receiver(&b, &b, 22, &b, config) ;
    receiver.open_reading_pipe(1, node1, 5) ;
    receiver.start_listening() ;
    sender.open_writing_pipe(node1, 5) ;

    for (uint8_t i=0; i < len; i++) out[i] = 0xA0 + i ;
    sender.write(out, len) ;
    uint8_t pipe = 0 ;
    ASSERT_EQ(len, receiver.read(in, sizeof(in), &pipe)) << "width " << (int)len ;
    EXPECT_EQ(1, pipe) ;
    EXPECT_EQ(0, memcmp(out, in, len)) << "width " << (int)len ;
    EXPECT_FALSE(receiver.data_available()) ;
  }
}

TEST_F(NordicRF24Test, StaticWidthTakenFromFirstWrite)
{
  RF24Config config ;
  config.set_auto_ack(false) ;
  NordicRF24 radio(&a, &a, 22, &a, config) ;
  radio.open_writing_pipe(node1, 5) ;

  const uint8_t payload[7] = {1,2,3,4,5,6,7} ;
  radio.write(payload, 7) ;
  EXPECT_EQ(7, radio.get_config().payload_size()) ;
  for (uint8_t i=0; i < RF24_PIPES; i++){
    EXPECT_EQ(7, a.reg(REG_RX_PW_BASE+i)) ;
  }
  EXPECT_THROW(radio.write(payload, 6), RF24SizeMismatchErr) ;
}

TEST_F(NordicRF24Test, PayloadValidationBeforeHardware)
{
  RF24Config config ;
  config.set_payload_size(12) ;
  NordicRF24 radio(&a, &a, 22, &a, config) ;
  radio.open_writing_pipe(node1, 5) ;
  a.clear_events() ;

  uint8_t payload[RF24_MAX_PAYLOAD+1] ;
  memset(payload, 0, sizeof(payload)) ;
  EXPECT_THROW(radio.write(payload, 33), RF24PayloadTooLargeErr) ;
  EXPECT_THROW(radio.write(payload, 0), RF24SizeMismatchErr) ;
  EXPECT_THROW(radio.write(payload, 5), RF24SizeMismatchErr) ;
  EXPECT_THROW(radio.start_write(payload, 13), RF24SizeMismatchErr) ;
  EXPECT_THROW(radio.write(NULL, 12), RF24Exception) ;
  EXPECT_TRUE(a.events().empty()) ;
}

TEST_F(NordicRF24Test, MaxRetriesFlushesQueue)
{
  RF24Config config ;
  config.set_payload_size(4) ;
  NordicRF24 sender(&a, &a, 22, &a, config) ;
  sender.open_writing_pipe(node1, 5) ;

  const uint8_t payload[4] = {'p','i','n','g'} ;
  try{
    sender.write(payload, 4) ;
    FAIL() << "write acknowledged with nobody listening" ;
  }catch(RF24MaxRetryErr &e){
    EXPECT_EQ(5, e.attempts()) ;
  }
  EXPECT_TRUE(sender.fifo_status().tx_empty()) ;
  EXPECT_FALSE(sender.status().max_retry()) ;
  EXPECT_FALSE(sender.status().data_sent()) ;

  uint8_t lost = 0, retrans = 0 ;
  sender.read_observe(lost, retrans) ;
  EXPECT_EQ(1, lost) ;
  EXPECT_EQ(5, retrans) ;

  // Retry succeeds once a peer is listening
  NordicRF24 receiver(&b, &b, 22, &b, config) ;
  receiver.open_reading_pipe(1, node1, 5) ;
  receiver.start_listening() ;
  EXPECT_NO_THROW(sender.write(payload, 4)) ;
  EXPECT_TRUE(receiver.data_available()) ;
}

TEST_F(NordicRF24Test, AckNeedsPipe0Shadow)
{
  RF24Config config ;
  config.set_payload_size(4) ;
  NordicRF24 sender(&a, &a, 22, &a, config) ;
  NordicRF24 receiver(&b, &b, 22, &b, config) ;
  receiver.open_reading_pipe(1, node1, 5) ;
  receiver.start_listening() ;

  // Sender listens on its own pipe 0 address between writes
  sender.open_reading_pipe(0, node2, 5) ;
  sender.open_writing_pipe(node1, 5) ;
  sender.start_listening() ;
  EXPECT_EQ(0, memcmp(node2, a.reg_bytes(REG_RX_ADDR_BASE), 5)) ;

  const uint8_t payload[4] = {9,8,7,6} ;
  sender.write(payload, 4) ;
  EXPECT_TRUE(receiver.data_available()) ;

  // Listening again on the reading address
  EXPECT_EQ(RF24Mode::mode_listening, sender.get_mode()) ;
  EXPECT_EQ(0, memcmp(node2, a.reg_bytes(REG_RX_ADDR_BASE), 5)) ;
  EXPECT_TRUE(a.receiving()) ;
}

TEST_F(NordicRF24Test, FailedWriteResumesListening)
{
  RF24Config config ;
  config.set_payload_size(4) ;
  NordicRF24 radio(&a, &a, 22, &a, config) ;
  radio.open_reading_pipe(0, node2, 5) ;
  radio.open_writing_pipe(node1, 5) ;
  radio.start_listening() ;

  const uint8_t payload[4] = {1,1,1,1} ;
  EXPECT_THROW(radio.write(payload, 4), RF24MaxRetryErr) ;
  EXPECT_EQ(RF24Mode::mode_listening, radio.get_mode()) ;
  EXPECT_EQ(0, memcmp(node2, a.reg_bytes(REG_RX_ADDR_BASE), 5)) ;
}

TEST_F(NordicRF24Test, FullQueueReportsBackpressure)
{
  RF24Config config ;
  config.set_payload_size(4) ;
  NordicRF24 sender(&a, &a, 22, &a, config) ;
  NordicRF24 receiver(&b, &b, 22, &b, config) ;
  receiver.open_reading_pipe(1, node1, 5) ;
  receiver.start_listening() ;
  sender.open_writing_pipe(node1, 5) ;

  const uint8_t p[4][4] = {{1,1,1,1},{2,2,2,2},{3,3,3,3},{4,4,4,4}} ;
  air.hold() ;
  EXPECT_TRUE(sender.start_write(p[0], 4)) ;
  EXPECT_TRUE(sender.start_write(p[1], 4)) ;
  EXPECT_TRUE(sender.start_write(p[2], 4)) ;
  EXPECT_TRUE(sender.status().tx_full()) ;
  EXPECT_FALSE(sender.start_write(p[3], 4)) ;
  EXPECT_EQ(3u, a.tx_count()) ;
  EXPECT_EQ(NordicRF24::tx_pending, sender.poll_write()) ;

  air.release() ;
  EXPECT_EQ(NordicRF24::tx_complete, sender.poll_write()) ;
  EXPECT_EQ(NordicRF24::tx_idle, sender.poll_write()) ;

  // Queue order kept
  uint8_t buffer[4] ;
  for (int i=0; i < 3; i++){
    ASSERT_EQ(4, receiver.read(buffer, sizeof(buffer))) ;
    EXPECT_EQ(0, memcmp(p[i], buffer, 4)) ;
  }
  EXPECT_FALSE(receiver.data_available()) ;
}

TEST_F(NordicRF24Test, BlockingWriteTimesOut)
{
  RF24Config config ;
  config.set_payload_size(4) ;
  NordicRF24 sender(&a, &a, 22, &a, config) ;
  sender.open_writing_pipe(node1, 5) ;

  const uint8_t payload[4] = {5,5,5,5} ;
  air.hold() ;
  for (int i=0; i < RF24_FIFO_DEPTH; i++) ASSERT_TRUE(sender.start_write(payload, 4)) ;

  unsigned long start = a.elapsed_us() ;
  EXPECT_THROW(sender.write(payload, 4), RF24TimeoutErr) ;
  EXPECT_GE(a.elapsed_us() - start, (unsigned long)sender.max_transmit_time_us() * (RF24_FIFO_DEPTH + 1)) ;
  EXPECT_EQ(3u, a.tx_count()) ;
}

TEST_F(NordicRF24Test, StaleFailureFlushedBeforeWrite)
{
  RF24Config config ;
  config.set_payload_size(4).set_auto_ack(false) ;
  NordicRF24 radio(&a, &a, 22, &a, config) ;
  radio.open_writing_pipe(node1, 5) ;

  a.raise_flags(STATUS_MAX_RT) ;
  const uint8_t payload[4] = {1,2,3,4} ;
  EXPECT_TRUE(radio.start_write(payload, 4)) ;
  EXPECT_EQ(NordicRF24::tx_complete, radio.poll_write()) ;
}

TEST_F(NordicRF24Test, PollIdleWithNothingQueued)
{
  NordicRF24 radio(&a, &a, 22, &a) ;
  EXPECT_EQ(NordicRF24::tx_idle, radio.poll_write()) ;
}

// Finishes the held transmission just as FIFO_STATUS is read
class LateCompletionSim : public SimRF24{
public:
  explicit LateCompletionSim(SimAir *air) : SimRF24(22, air){}

  virtual bool transfer(const uint8_t *tx, uint8_t *rx, uint16_t len){
    if (len > 0 && tx[0] == (RF24_READ_REG | REG_FIFO_STATUS) && m_air && m_air->is_held())
      m_air->release() ;
    return SimRF24::transfer(tx, rx, len) ;
  }
};

TEST_F(NordicRF24Test, CompletionBetweenPollReadsClearsDataSent)
{
  LateCompletionSim chip(&air) ;
  RF24Config config ;
  config.set_payload_size(4).set_auto_ack(false) ;
  NordicRF24 radio(&chip, &chip, 22, &chip, config) ;
  radio.open_writing_pipe(node1, 5) ;

  const uint8_t payload[4] = {9,8,7,6} ;
  air.hold() ;
  radio.write(payload, 4) ;
  EXPECT_EQ(1u, chip.transmissions()) ;
  EXPECT_EQ(0u, chip.tx_count()) ;
  EXPECT_FALSE(radio.status().data_sent()) ;
  EXPECT_EQ(0, chip.reg(REG_STATUS) & STATUS_TX_DS) ;
  EXPECT_EQ(RF24Mode::mode_standby, radio.get_mode()) ;
}

TEST_F(NordicRF24Test, ReadRequiresListening)
{
  NordicRF24 radio(&a, &a, 22, &a) ;
  uint8_t buffer[RF24_MAX_PAYLOAD] ;
  EXPECT_THROW(radio.read(buffer, sizeof(buffer)), RF24NotListeningErr) ;
}

TEST_F(NordicRF24Test, ReadEmptyFifo)
{
  NordicRF24 radio(&a, &a, 22, &a) ;
  radio.start_listening() ;
  uint8_t buffer[RF24_MAX_PAYLOAD] ;
  EXPECT_EQ(0, radio.read(buffer, sizeof(buffer))) ;
}

TEST_F(NordicRF24Test, CorruptDynamicWidthFlushes)
{
  RF24Config config ;
  config.set_dynamic_payloads(true) ;
  NordicRF24 radio(&a, &a, 22, &a, config) ;
  radio.open_reading_pipe(1, node1, 5) ;
  radio.start_listening() ;

  uint8_t buffer[RF24_MAX_PAYLOAD] ;
  a.inject_rx(1, std::vector<uint8_t>(4, 0xAA)) ;
  a.inject_rx(1, std::vector<uint8_t>(4, 0xBB)) ;
  a.corrupt_width(40) ;
  EXPECT_THROW(radio.read(buffer, sizeof(buffer)), RF24CorruptPayloadErr) ;
  EXPECT_EQ(0u, a.rx_count()) ;
  EXPECT_FALSE(radio.data_available()) ;

  a.inject_rx(1, std::vector<uint8_t>(4, 0xCC)) ;
  a.corrupt_width(0) ;
  EXPECT_THROW(radio.read(buffer, sizeof(buffer)), RF24CorruptPayloadErr) ;

  a.clear_corrupt_width() ;
  a.inject_rx(1, std::vector<uint8_t>(4, 0xDD)) ;
  EXPECT_EQ(4, radio.read(buffer, sizeof(buffer))) ;
}

TEST_F(NordicRF24Test, SmallBufferLeavesPayload)
{
  RF24Config config ;
  config.set_payload_size(8) ;
  NordicRF24 radio(&a, &a, 22, &a, config) ;
  radio.open_reading_pipe(1, node1, 5) ;
  radio.start_listening() ;

  a.inject_rx(1, std::vector<uint8_t>(8, 0x42)) ;
  uint8_t buffer[8] ;
  EXPECT_THROW(radio.read(buffer, 4), RF24PayloadTooLargeErr) ;
  EXPECT_EQ(1u, a.rx_count()) ;
  EXPECT_EQ(8, radio.read(buffer, 8)) ;
  EXPECT_EQ(0x42, buffer[7]) ;
}

TEST_F(NordicRF24Test, DataAvailableOnPipe)
{
  RF24Config config ;
  config.set_payload_size(2) ;
  NordicRF24 radio(&a, &a, 22, &a, config) ;
  radio.start_listening() ;

  a.inject_rx(2, std::vector<uint8_t>(2, 0)) ;
  uint8_t pipe = 0xFF ;
  EXPECT_TRUE(radio.data_available()) ;
  EXPECT_TRUE(radio.data_available_on_pipe(pipe)) ;
  EXPECT_EQ(2, pipe) ;
}

TEST_F(NordicRF24Test, ListeningTransitions)
{
  NordicRF24 radio(&a, &a, 22, &a) ;
  a.clear_events() ;

  radio.start_listening() ;
  const std::vector<SimRF24::Event> &ev = a.events() ;
  ASSERT_EQ(3u, ev.size()) ;
  EXPECT_EQ(SimRF24::ev_write_reg, ev[0].type) ;
  EXPECT_EQ(REG_CONFIG, ev[0].code) ;
  EXPECT_EQ(CONFIG_EN_CRC | CONFIG_CRCO | CONFIG_PWR_UP | CONFIG_PRIM_RX, ev[0].data[0]) ;
  EXPECT_EQ(SimRF24::ev_ce, ev[1].type) ;
  EXPECT_EQ(IHardwareGPIO::high, ev[1].code) ;
  EXPECT_EQ(SimRF24::ev_sleep, ev[2].type) ;
  EXPECT_GE(ev[2].us, 130u) ;
  EXPECT_EQ(RF24Mode::mode_listening, radio.get_mode()) ;

  a.clear_events() ;
  radio.stop_listening() ;
  ASSERT_EQ(3u, a.events().size()) ;
  EXPECT_EQ(SimRF24::ev_ce, a.events()[0].type) ;
  EXPECT_EQ(IHardwareGPIO::low, a.events()[0].code) ;
  EXPECT_EQ(REG_CONFIG, a.events()[1].code) ;
  EXPECT_EQ(0, a.reg(REG_CONFIG) & CONFIG_PRIM_RX) ;
  EXPECT_EQ(RF24Mode::mode_standby, radio.get_mode()) ;
}

TEST_F(NordicRF24Test, TransmitPulseWidth)
{
  RF24Config config ;
  config.set_payload_size(4).set_auto_ack(false) ;
  NordicRF24 radio(&a, &a, 22, &a, config) ;
  radio.open_writing_pipe(node1, 5) ;
  a.clear_events() ;

  const uint8_t payload[4] = {1,2,3,4} ;
  radio.write(payload, 4) ;

  int load = find_event(a, SimRF24::ev_command, W_TX_PAYLOAD) ;
  ASSERT_GE(load, 0) ;
  const std::vector<SimRF24::Event> &ev = a.events() ;
  ASSERT_LT(load+3, (int)ev.size()) ;
  EXPECT_EQ(SimRF24::ev_ce, ev[load+1].type) ;
  EXPECT_EQ(IHardwareGPIO::high, ev[load+1].code) ;
  EXPECT_EQ(SimRF24::ev_sleep, ev[load+2].type) ;
  EXPECT_GE(ev[load+2].us, 10u) ;
  EXPECT_EQ(SimRF24::ev_ce, ev[load+3].type) ;
  EXPECT_EQ(IHardwareGPIO::low, ev[load+3].code) ;
  EXPECT_EQ(1u, a.transmissions()) ;
}

TEST_F(NordicRF24Test, PowerDownAndUp)
{
  NordicRF24 radio(&a, &a, 22, &a) ;
  radio.start_listening() ;
  radio.power_down() ;
  EXPECT_EQ(RF24Mode::mode_power_down, radio.get_mode()) ;
  EXPECT_FALSE(a.powered()) ;
  EXPECT_FALSE(a.ce()) ;

  a.clear_events() ;
  radio.power_up() ;
  EXPECT_TRUE(a.powered()) ;
  EXPECT_EQ(RF24Mode::mode_standby, radio.get_mode()) ;
  int cfg = find_event(a, SimRF24::ev_write_reg, REG_CONFIG) ;
  ASSERT_GE(cfg, 0) ;
  EXPECT_EQ(SimRF24::ev_sleep, a.events()[cfg+1].type) ;
  EXPECT_GE(a.events()[cfg+1].us, 1500u) ;
}

TEST_F(NordicRF24Test, RuntimeSettings)
{
  NordicRF24 radio(&a, &a, 22, &a) ;

  radio.set_channel(8) ;
  EXPECT_EQ(8, a.reg(REG_RF_CH)) ;
  EXPECT_THROW(radio.set_channel(126), RF24ConfigErr) ;
  EXPECT_EQ(8, a.reg(REG_RF_CH)) ;
  EXPECT_EQ(8, radio.get_config().channel()) ;

  radio.set_power_level(RF24_NEG12DBM) ;
  EXPECT_EQ(0x02, a.reg(REG_RF_SETUP)) ;
  radio.set_data_rate(RF24_2MBPS) ;
  EXPECT_EQ(RF_SETUP_DR_HIGH | 0x02, a.reg(REG_RF_SETUP)) ;

  radio.set_retries(4, 10) ;
  EXPECT_EQ(0x4A, a.reg(REG_SETUP_RETR)) ;
  EXPECT_THROW(radio.set_retries(16, 1), RF24ConfigErr) ;
  EXPECT_EQ(0x4A, a.reg(REG_SETUP_RETR)) ;

  radio.set_crc(RF24_CRC_1BYTE) ;
  EXPECT_EQ(CONFIG_EN_CRC | CONFIG_PWR_UP, a.reg(REG_CONFIG)) ;
  EXPECT_THROW(radio.set_crc(RF24_CRC_DISABLED), RF24ConfigErr) ;
  EXPECT_EQ(CONFIG_EN_CRC | CONFIG_PWR_UP, a.reg(REG_CONFIG)) ;

  radio.set_interrupts(RF24Interrupts::none()) ;
  EXPECT_EQ(CONFIG_MASK_RX_DR | CONFIG_MASK_TX_DS | CONFIG_MASK_MAX_RT |
	    CONFIG_EN_CRC | CONFIG_PWR_UP, a.reg(REG_CONFIG)) ;
}

TEST_F(NordicRF24Test, ChannelMismatchNotHeard)
{
  RF24Config config ;
  config.set_payload_size(4) ;
  NordicRF24 sender(&a, &a, 22, &a, config) ;
  NordicRF24 receiver(&b, &b, 22, &b, config) ;
  receiver.open_reading_pipe(1, node1, 5) ;
  receiver.start_listening() ;
  sender.open_writing_pipe(node1, 5) ;
  sender.set_channel(90) ;

  const uint8_t payload[4] = {1,2,3,4} ;
  EXPECT_THROW(sender.write(payload, 4), RF24MaxRetryErr) ;
  receiver.set_channel(90) ;
  EXPECT_NO_THROW(sender.write(payload, 4)) ;
}

TEST_F(NordicRF24Test, CarrierDetect)
{
  NordicRF24 radio(&a, &a, 22, &a) ;
  radio.start_listening() ;
  EXPECT_FALSE(radio.carrier_detect()) ;
  a.set_reg(REG_CD, 0x01) ;
  EXPECT_TRUE(radio.carrier_detect()) ;
}

TEST_F(NordicRF24Test, ClearInterrupts)
{
  NordicRF24 radio(&a, &a, 22, &a) ;
  a.raise_flags(STATUS_RX_DR | STATUS_TX_DS) ;
  radio.clear_interrupts(RF24Interrupts().add(RF24Interrupts::data_sent)) ;
  EXPECT_TRUE(radio.status().data_ready()) ;
  EXPECT_FALSE(radio.status().data_sent()) ;
  radio.clear_interrupts() ;
  EXPECT_FALSE(radio.status().data_ready()) ;
}
