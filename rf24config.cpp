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

#include "rf24config.hpp"
#include "rf24exception.hpp"

RF24Config::RF24Config()
{
  m_channel = 76 ;
  m_data_rate = RF24_1MBPS ;
  m_power_level = RF24_0DBM ;
  m_crc = RF24_CRC_2BYTE ;
  m_address_width = MAX_RF24_ADDRESS_LEN ;
  m_retry_delay = 0 ;
  m_retry_count = 5 ;
  m_payload_size = 0 ; // taken from first use
  m_dynamic_payloads = false ;
  m_auto_ack = true ;
  m_interrupts = RF24Interrupts::all() ;
}

RF24Config &RF24Config::set_channel(uint8_t channel)
{
  if (channel > RF24_MAX_CHANNEL) throw RF24ConfigErr("channel", "must be 0 to 125") ;
  m_channel = channel ;
  return *this ;
}

RF24Config &RF24Config::set_data_rate(RF24DataRate rate)
{
  switch(rate){
  case RF24_250KBPS:
  case RF24_1MBPS:
  case RF24_2MBPS:
    break ;
  default:
    throw RF24ConfigErr("data rate", "must be 250 kbps, 1 Mbps or 2 Mbps") ;
  }
  m_data_rate = rate ;
  return *this ;
}

RF24Config &RF24Config::set_power_level(RF24PowerLevel level)
{
  if (level < RF24_NEG18DBM || level > RF24_0DBM)
    throw RF24ConfigErr("power level", "must be -18, -12, -6 or 0 dBm") ;
  m_power_level = level ;
  return *this ;
}

RF24Config &RF24Config::set_crc(RF24Crc crc)
{
  if (crc < RF24_CRC_DISABLED || crc > RF24_CRC_2BYTE)
    throw RF24ConfigErr("crc", "must be disabled, 1 or 2 bytes") ;
  // The chip forces CRC on while any pipe acknowledges
  if (crc == RF24_CRC_DISABLED && m_auto_ack)
    throw RF24ConfigErr("crc", "cannot be disabled while auto ack is enabled") ;
  m_crc = crc ;
  return *this ;
}

RF24Config &RF24Config::set_address_width(uint8_t width)
{
  if (width < MIN_RF24_ADDRESS_LEN || width > MAX_RF24_ADDRESS_LEN)
    throw RF24ConfigErr("address width", "must be 3, 4 or 5 bytes") ;
  m_address_width = width ;
  return *this ;
}

RF24Config &RF24Config::set_retries(uint8_t delay, uint8_t count)
{
  // Only 4 bit values accepted
  if (delay > 0x0F) throw RF24ConfigErr("retry delay", "must be 0 to 15") ;
  if (count > 0x0F) throw RF24ConfigErr("retry count", "must be 0 to 15") ;
  m_retry_delay = delay ;
  m_retry_count = count ;
  return *this ;
}

RF24Config &RF24Config::set_payload_size(uint8_t size)
{
  if (size < 1 || size > RF24_MAX_PAYLOAD)
    throw RF24ConfigErr("payload size", "must be 1 to 32 bytes") ;
  m_payload_size = size ;
  return *this ;
}

RF24Config &RF24Config::set_dynamic_payloads(bool enable)
{
  if (enable && !m_auto_ack)
    throw RF24ConfigErr("dynamic payloads", "require auto ack") ;
  m_dynamic_payloads = enable ;
  return *this ;
}

RF24Config &RF24Config::set_auto_ack(bool enable)
{
  if (enable && m_crc == RF24_CRC_DISABLED)
    throw RF24ConfigErr("auto ack", "requires crc") ;
  if (!enable && m_dynamic_payloads)
    throw RF24ConfigErr("auto ack", "required by dynamic payloads") ;
  m_auto_ack = enable ;
  return *this ;
}

RF24Config &RF24Config::set_interrupts(const RF24Interrupts &irq)
{
  m_interrupts = irq ;
  return *this ;
}

uint8_t RF24Config::setup_aw() const
{
  return m_address_width - 2 ;
}

uint8_t RF24Config::setup_retr() const
{
  return (m_retry_delay << 4) | m_retry_count ;
}

uint8_t RF24Config::rf_setup() const
{
  uint8_t reg = 0 ;
  reg |= (m_data_rate == RF24_250KBPS?RF_SETUP_DR_LOW:0) |
    (m_data_rate == RF24_2MBPS?RF_SETUP_DR_HIGH:0) |
    (m_power_level << 1) ;
  return reg ;
}

uint8_t RF24Config::feature() const
{
  return m_dynamic_payloads?FEATURE_EN_DPL:0 ;
}

uint8_t RF24Config::config_bits() const
{
  uint8_t reg = m_interrupts.config_mask() ;
  if (m_crc != RF24_CRC_DISABLED) reg |= CONFIG_EN_CRC ;
  if (m_crc == RF24_CRC_2BYTE) reg |= CONFIG_CRCO ;
  return reg ;
}

uint32_t RF24Config::max_transmit_time_us() const
{
  uint32_t bps = 1000000 ;
  if (m_data_rate == RF24_250KBPS) bps = 250000 ;
  else if (m_data_rate == RF24_2MBPS) bps = 2000000 ;

  // preamble + address + payload + crc, plus 9 bit packet control field
  uint32_t overhead = 1 + m_address_width + m_crc ;
  uint32_t packet_bits = (overhead + RF24_MAX_PAYLOAD) * 8 + 9 ;
  uint32_t packet_us = (packet_bits * 1000000) / bps + 1 ;
  uint32_t attempt_us = RF24_RX_SETTLE_US + packet_us ;

  if (!m_auto_ack) return attempt_us ;

  uint32_t ack_us = ((overhead * 8 + 9) * 1000000) / bps + 1 ;
  attempt_us += RF24_RX_SETTLE_US + ack_us + (m_retry_delay + 1) * 250 ;
  return attempt_us * (m_retry_count + 1) ;
}
