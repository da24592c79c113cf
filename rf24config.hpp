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

#ifndef __RF24_CONFIG
#define __RF24_CONFIG

#include "rf24registers.hpp"
#include "rf24status.hpp"
#include <stdint.h>

enum RF24DataRate{
  RF24_250KBPS = 1,
  RF24_1MBPS = 2,
  RF24_2MBPS = 3
};

enum RF24PowerLevel{
  RF24_NEG18DBM = 0,
  RF24_NEG12DBM = 1,
  RF24_NEG6DBM = 2,
  RF24_0DBM = 3
};

enum RF24Crc{
  RF24_CRC_DISABLED = 0,
  RF24_CRC_1BYTE = 1,
  RF24_CRC_2BYTE = 2
};

// Radio settings applied by NordicRF24 at construction.
// Every setter validates its own argument and throws RF24ConfigErr naming
// the field. Nothing is clamped so a config that exists is always encodable.
// Defaults: channel 76, 1 Mbps, 0 dBm, 2 byte CRC, 5 byte addresses,
// 5 retries at 250 us, auto ack on, static payload width taken from
// the first write.
class RF24Config{
public:
  RF24Config() ;

  RF24Config &set_channel(uint8_t channel) ;
  RF24Config &set_data_rate(RF24DataRate rate) ;
  RF24Config &set_power_level(RF24PowerLevel level) ;
  RF24Config &set_crc(RF24Crc crc) ;
  RF24Config &set_address_width(uint8_t width) ;
  // delay is in 250 us steps: (delay+1) * 250 us
  RF24Config &set_retries(uint8_t delay, uint8_t count) ;
  RF24Config &set_payload_size(uint8_t size) ;
  // Dynamic payloads require auto acknowledgement
  RF24Config &set_dynamic_payloads(bool enable) ;
  // Auto acknowledgement requires CRC
  RF24Config &set_auto_ack(bool enable) ;
  RF24Config &set_interrupts(const RF24Interrupts &irq) ;

  uint8_t channel() const {return m_channel;}
  RF24DataRate data_rate() const {return m_data_rate;}
  RF24PowerLevel power_level() const {return m_power_level;}
  RF24Crc crc() const {return m_crc;}
  uint8_t address_width() const {return m_address_width;}
  uint8_t retry_delay() const {return m_retry_delay;}
  uint8_t retry_count() const {return m_retry_count;}
  // Returns 0 if the width has not been set yet
  uint8_t payload_size() const {return m_payload_size;}
  bool is_payload_size_set() const {return m_payload_size != 0;}
  bool dynamic_payloads() const {return m_dynamic_payloads;}
  bool auto_ack() const {return m_auto_ack;}
  const RF24Interrupts &interrupts() const {return m_interrupts;}

  // Register encodings
  uint8_t setup_aw() const ;
  uint8_t setup_retr() const ;
  uint8_t rf_setup() const ;
  uint8_t feature() const ;
  // CRC and interrupt mask bits of CONFIG. PWR_UP and PRIM_RX are owned
  // by the mode state machine
  uint8_t config_bits() const ;

  // Worst case time in micro seconds for a single payload to be
  // acknowledged or to exhaust its retries with the current settings
  uint32_t max_transmit_time_us() const ;

protected:
  uint8_t m_channel ;
  RF24DataRate m_data_rate ;
  RF24PowerLevel m_power_level ;
  RF24Crc m_crc ;
  uint8_t m_address_width ;
  uint8_t m_retry_delay ;
  uint8_t m_retry_count ;
  uint8_t m_payload_size ;
  bool m_dynamic_payloads ;
  bool m_auto_ack ;
  RF24Interrupts m_interrupts ;
};

#endif
