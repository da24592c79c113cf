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

#include "rf24pipes.hpp"
#include "rf24exception.hpp"
#include "rf24debug.hpp"
#include <string.h>

RF24Pipes::RF24Pipes(RF24Protocol &protocol, const RF24Config &config)
  : m_protocol(protocol), m_config(config)
{
  m_en_rxaddr = 0 ;
  m_en_aa = 0 ;
  m_dynpd = 0 ;
  for (int i=0; i < RF24_PIPES; i++){
    m_width[i] = RF24_MAX_PAYLOAD ;
    m_width_set[i] = false ;
  }
  memset(m_tx_address, 0, MAX_RF24_ADDRESS_LEN) ;
  memset(m_p0_address, 0, MAX_RF24_ADDRESS_LEN) ;
  memset(m_p1_address, 0, MAX_RF24_ADDRESS_LEN) ;
  m_tx_set = false ;
  m_p0_reading = false ;
  m_p1_set = false ;
  m_p0_owner = pipe0_unset ;
}

void RF24Pipes::reset()
{
  uint8_t width = m_config.is_payload_size_set()?m_config.payload_size():RF24_MAX_PAYLOAD ;

  m_en_rxaddr = 0 ;
  m_en_aa = 0 ;
  m_dynpd = 0 ;
  m_tx_set = false ;
  m_p0_reading = false ;
  m_p1_set = false ;
  m_p0_owner = pipe0_unset ;

  m_protocol.write_register(REG_DYNPD, m_dynpd) ;
  m_protocol.write_register(REG_EN_AA, m_en_aa) ;
  m_protocol.write_register(REG_EN_RXADDR, m_en_rxaddr) ;
  for (int i=0; i < RF24_PIPES; i++){
    m_width[i] = width ;
    m_width_set[i] = false ;
    m_protocol.write_register(REG_RX_PW_BASE+i, width) ;
  }
}

void RF24Pipes::check_pipe(uint8_t pipe) const
{
  if (pipe >= RF24_PIPES) throw RF24PipeErr("pipe must be 0 to 5") ;
}

void RF24Pipes::check_address(uint8_t len) const
{
  if (len != m_config.address_width())
    throw RF24AddressLengthErr("address length must equal the configured address width") ;
}

void RF24Pipes::update_mask(uint8_t reg, uint8_t &mask, uint8_t pipe, bool set)
{
  uint8_t val = set?(mask | _BV(pipe)):(mask & ~_BV(pipe)) ;
  if (val == mask) return ;
  m_protocol.write_register(reg, val) ;
  mask = val ;
}

void RF24Pipes::enable_pipe(uint8_t pipe, bool enabled)
{
  if (enabled){
    if (m_config.auto_ack()) update_mask(REG_EN_AA, m_en_aa, pipe, true) ;
    if (m_config.dynamic_payloads()) update_mask(REG_DYNPD, m_dynpd, pipe, true) ;
  }
  update_mask(REG_EN_RXADDR, m_en_rxaddr, pipe, enabled) ;
}

void RF24Pipes::write_pipe0(const uint8_t *address, pipe0_owner owner)
{
  m_protocol.write_register(REG_RX_ADDR_BASE, address, m_config.address_width()) ;
  m_p0_owner = owner ;
}

void RF24Pipes::open_writing_pipe(const uint8_t *address, uint8_t len)
{
  check_address(len) ;

  m_protocol.write_register(REG_TX_ADDR, address, len) ;
  memcpy(m_tx_address, address, len) ;
  m_tx_set = true ;

  // Acknowledgements arrive on pipe 0 addressed to our own TX address
  write_pipe0(m_tx_address, pipe0_tx_shadow) ;
  enable_pipe(0, true) ;
}

void RF24Pipes::open_reading_pipe(uint8_t pipe, const uint8_t *address, uint8_t len)
{
  check_pipe(pipe) ;
  check_address(len) ;

  if (pipe == 0){
    memcpy(m_p0_address, address, len) ;
    m_p0_reading = true ;
    write_pipe0(m_p0_address, pipe0_reading) ;
  }else if (pipe == 1){
    m_protocol.write_register(REG_RX_ADDR_BASE+1, address, len) ;
    memcpy(m_p1_address, address, len) ;
    m_p1_set = true ;
  }else{
    // Pipes 2-5 share the upper bytes of pipe 1
    if (!m_p1_set) throw RF24PipeErr("pipe 1 address must be opened before pipes 2 to 5") ;
    if (memcmp(address+1, m_p1_address+1, len-1) != 0)
      throw RF24PipeErr("pipes 2 to 5 must share the upper address bytes of pipe 1") ;
    m_protocol.write_register(REG_RX_ADDR_BASE+pipe, address, 1) ;
  }

  enable_pipe(pipe, true) ;
}

void RF24Pipes::close_reading_pipe(uint8_t pipe)
{
  check_pipe(pipe) ;
  if (pipe == 0) m_p0_reading = false ;
  update_mask(REG_EN_RXADDR, m_en_rxaddr, pipe, false) ;
}

void RF24Pipes::set_payload_width(uint8_t pipe, uint8_t width)
{
  check_pipe(pipe) ;
  if (width < 1 || width > RF24_MAX_PAYLOAD)
    throw RF24ConfigErr("payload width", "must be 1 to 32 bytes") ;
  m_protocol.write_register(REG_RX_PW_BASE+pipe, width) ;
  m_width[pipe] = width ;
  m_width_set[pipe] = true ;
}

void RF24Pipes::adopt_payload_width(uint8_t width)
{
  for (int i=0; i < RF24_PIPES; i++){
    if (m_width_set[i] || m_width[i] == width) continue ;
    m_protocol.write_register(REG_RX_PW_BASE+i, width) ;
    m_width[i] = width ;
  }
}

uint8_t RF24Pipes::payload_width(uint8_t pipe) const
{
  check_pipe(pipe) ;
  return m_width[pipe] ;
}

void RF24Pipes::shadow_for_transmit()
{
  if (!m_tx_set) return ;
  if (m_p0_owner != pipe0_tx_shadow){
    DPRINT("Pipe 0 shadowing TX address\n") ;
    write_pipe0(m_tx_address, pipe0_tx_shadow) ;
  }
  enable_pipe(0, true) ;
}

void RF24Pipes::restore_for_listening()
{
  if (m_p0_reading){
    if (m_p0_owner != pipe0_reading){
      DPRINT("Pipe 0 restored to reading address\n") ;
      write_pipe0(m_p0_address, pipe0_reading) ;
    }
    enable_pipe(0, true) ;
  }else if (m_p0_owner == pipe0_tx_shadow){
    // Don't listen on our own TX address
    update_mask(REG_EN_RXADDR, m_en_rxaddr, 0, false) ;
  }
}

bool RF24Pipes::is_pipe_enabled(uint8_t pipe) const
{
  check_pipe(pipe) ;
  return (m_en_rxaddr & _BV(pipe)) != 0 ;
}

bool RF24Pipes::is_pipe_ack(uint8_t pipe) const
{
  check_pipe(pipe) ;
  return (m_en_aa & _BV(pipe)) != 0 ;
}

bool RF24Pipes::is_dynamic_payload(uint8_t pipe) const
{
  check_pipe(pipe) ;
  return (m_dynpd & _BV(pipe)) != 0 ;
}
