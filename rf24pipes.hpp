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

#ifndef __RF24_PIPES
#define __RF24_PIPES

#include "rf24protocol.hpp"
#include "rf24config.hpp"
#include <stdint.h>

// Pipe and address registers: TX_ADDR, RX_ADDR_Pn, EN_RXADDR, EN_AA,
// DYNPD and RX_PW_Pn.
//
// Pipe 0 has two users. It is a normal reading pipe, but while
// transmitting with auto ack it must hold the TX address to receive the
// acknowledgement. pipe0_owner records which address is in the register so
// the reading address can be put back deterministically before listening.
class RF24Pipes{
public:
  enum pipe0_owner{pipe0_unset, pipe0_reading, pipe0_tx_shadow} ;

  RF24Pipes(RF24Protocol &protocol, const RF24Config &config) ;

  // Writes DYNPD, EN_AA, EN_RXADDR and RX_PW_P0-5 with all pipes closed
  void reset() ;

  // Address length must equal the configured width. Addresses are
  // written least significant byte first.
  void open_writing_pipe(const uint8_t *address, uint8_t len) ;
  // Pipes 2-5 only store address[0]; the remaining bytes must match
  // the pipe 1 address, which has to be opened first.
  void open_reading_pipe(uint8_t pipe, const uint8_t *address, uint8_t len) ;
  void close_reading_pipe(uint8_t pipe) ;

  // Static payload width for a single pipe
  void set_payload_width(uint8_t pipe, uint8_t width) ;
  // Applies width to every pipe without its own width
  void adopt_payload_width(uint8_t width) ;
  uint8_t payload_width(uint8_t pipe) const ;

  // Point pipe 0 at the TX address before sending
  void shadow_for_transmit() ;
  // Give pipe 0 back to its reading address, or close it if it never had one
  void restore_for_listening() ;

  bool is_pipe_enabled(uint8_t pipe) const ;
  bool is_pipe_ack(uint8_t pipe) const ;
  bool is_dynamic_payload(uint8_t pipe) const ;
  bool has_tx_address() const {return m_tx_set;}
  pipe0_owner get_pipe0_owner() const {return m_p0_owner;}

protected:
  void check_pipe(uint8_t pipe) const ;
  void check_address(uint8_t len) const ;
  void enable_pipe(uint8_t pipe, bool enabled) ;
  void update_mask(uint8_t reg, uint8_t &mask, uint8_t pipe, bool set) ;
  void write_pipe0(const uint8_t *address, pipe0_owner owner) ;

  RF24Protocol &m_protocol ;
  const RF24Config &m_config ;

  uint8_t m_en_rxaddr ;
  uint8_t m_en_aa ;
  uint8_t m_dynpd ;
  uint8_t m_width[RF24_PIPES] ;
  bool m_width_set[RF24_PIPES] ;

  uint8_t m_tx_address[MAX_RF24_ADDRESS_LEN] ;
  bool m_tx_set ;
  uint8_t m_p0_address[MAX_RF24_ADDRESS_LEN] ;
  bool m_p0_reading ;
  uint8_t m_p1_address[MAX_RF24_ADDRESS_LEN] ;
  bool m_p1_set ;
  pipe0_owner m_p0_owner ;
};

#endif
