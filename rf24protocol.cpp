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

#include "rf24protocol.hpp"
#include "rf24exception.hpp"
#include "rf24debug.hpp"
#include <string.h>

// Holds chip-select asserted for its lifetime. release() reports a failed
// deselect, the destructor only covers exception paths.
class SpiSelect{
public:
  explicit SpiSelect(IHardwareSPI *pSPI) : m_pSPI(pSPI), m_selected(false){
    if (!m_pSPI->select(true)) throw RF24TransportErr("cannot assert chip select") ;
    m_selected = true ;
  }
  ~SpiSelect(){
    if (m_selected && !m_pSPI->select(false)){
      EPRINT("Failed to release chip select\n") ;
    }
  }
  void release(){
    m_selected = false ;
    if (!m_pSPI->select(false)) throw RF24TransportErr("cannot release chip select") ;
  }
private:
  IHardwareSPI *m_pSPI ;
  bool m_selected ;
};

RF24Protocol::RF24Protocol(IHardwareSPI *pSPI)
{
  if (!pSPI) throw RF24Exception("SPI interface required") ;
  m_pSPI = pSPI ;
  memset(m_txbuf, 0, MAX_RXTXBUF) ;
  memset(m_rxbuf, 0, MAX_RXTXBUF) ;
}

RF24Status RF24Protocol::transfer(uint8_t len)
{
  SpiSelect cs(m_pSPI) ;
  if (!m_pSPI->transfer(m_txbuf, m_rxbuf, len)) throw RF24TransportErr("SPI transfer failed") ;
  cs.release() ;
  return RF24Status(*m_rxbuf) ;
}

RF24Status RF24Protocol::read_register(uint8_t addr, uint8_t *val, uint8_t len)
{
  if (len >= MAX_RXTXBUF) throw RF24Exception("register read too long") ;

  *m_txbuf = RF24_READ_REG | (addr & RF24_REG_MASK) ;
  memset(m_txbuf+1, 0, len) ;
  RF24Status status = transfer(len+1) ;
  if (val) memcpy(val, m_rxbuf+1, len) ;
  return status ;
}

RF24Status RF24Protocol::write_register(uint8_t addr, const uint8_t *val, uint8_t len)
{
  if (len >= MAX_RXTXBUF) throw RF24Exception("register write too long") ;

  *m_txbuf = RF24_WRITE_REG | (addr & RF24_REG_MASK) ;
  memcpy(m_txbuf+1, val, len) ;
  return transfer(len+1) ;
}

uint8_t RF24Protocol::read_register(uint8_t addr)
{
  uint8_t reg = 0 ;
  read_register(addr, &reg, 1) ;
  return reg ;
}

RF24Status RF24Protocol::write_register(uint8_t addr, uint8_t val)
{
  return write_register(addr, &val, 1) ;
}

RF24Status RF24Protocol::send_command(uint8_t opcode, const uint8_t *tx, uint8_t *rx, uint8_t len)
{
  if (len >= MAX_RXTXBUF) throw RF24Exception("command too long") ;

  *m_txbuf = opcode ;
  if (tx) memcpy(m_txbuf+1, tx, len) ;
  else memset(m_txbuf+1, 0, len) ;
  RF24Status status = transfer(len+1) ;
  if (rx) memcpy(rx, m_rxbuf+1, len) ;
  return status ;
}

RF24Status RF24Protocol::status()
{
  return send_command(RF24_NOP) ;
}
