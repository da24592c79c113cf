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

#ifndef __RF24_PROTOCOL
#define __RF24_PROTOCOL

#include "hardware.hpp"
#include "rf24registers.hpp"
#include "rf24status.hpp"
#include <stddef.h>
#include <stdint.h>

// Frames commands and register accesses into single SPI transactions.
// Each call selects the chip for exactly one transfer, releases it on every
// exit path and returns the STATUS byte clocked out with the first byte.
// Transport failures throw RF24TransportErr and are never retried here.
class RF24Protocol{
public:
  explicit RF24Protocol(IHardwareSPI *pSPI) ;

  RF24Status read_register(uint8_t addr, uint8_t *val, uint8_t len) ;
  RF24Status write_register(uint8_t addr, const uint8_t *val, uint8_t len) ;

  // Single byte register helpers
  uint8_t read_register(uint8_t addr) ;
  RF24Status write_register(uint8_t addr, uint8_t val) ;

  // Sends opcode followed by len bytes. tx may be NULL to clock out
  // zeros, rx may be NULL if the response is not needed.
  RF24Status send_command(uint8_t opcode, const uint8_t *tx = NULL,
			  uint8_t *rx = NULL, uint8_t len = 0) ;

  // NOP command, cheapest way to read STATUS
  RF24Status status() ;

protected:
  RF24Status transfer(uint8_t len) ;

  IHardwareSPI *m_pSPI ;
  uint8_t m_txbuf[MAX_RXTXBUF], m_rxbuf[MAX_RXTXBUF] ;
};

#endif
