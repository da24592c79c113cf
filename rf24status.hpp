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

#ifndef __RF24_STATUS
#define __RF24_STATUS

#include "rf24registers.hpp"
#include <stdint.h>

// Decoded STATUS byte. Every bus transaction returns one of these as its
// first received byte so it is only valid for the transaction that produced it.
class RF24Status{
public:
  RF24Status() : m_status(0){}
  explicit RF24Status(uint8_t status) : m_status(status){}

  uint8_t raw() const {return m_status;}

  // Bit 7 always reads zero on a responding chip. A floating MISO line
  // reads 0xFF
  bool is_valid() const {return (m_status & _BV(7)) == 0;}

  bool data_ready() const {return (m_status & STATUS_RX_DR) != 0;}
  bool data_sent() const {return (m_status & STATUS_TX_DS) != 0;}
  bool max_retry() const {return (m_status & STATUS_MAX_RT) != 0;}
  bool tx_full() const {return (m_status & STATUS_TX_FULL) != 0;}

  // Pipe number of the payload at the head of the RX FIFO, or
  // RF24_PIPE_EMPTY (0x07) if empty
  uint8_t rx_pipe() const {return (m_status >> 1) & 0x07;}

  // 0x06 is unused by the chip and treated as empty
  bool rx_empty() const {return rx_pipe() >= RF24_PIPES;}

private:
  uint8_t m_status ;
};

// FIFO_STATUS register
class RF24FifoStatus{
public:
  RF24FifoStatus() : m_fifo(_BV(0) | _BV(4)){}
  explicit RF24FifoStatus(uint8_t fifo) : m_fifo(fifo){}

  uint8_t raw() const {return m_fifo;}
  bool rx_empty() const {return (m_fifo & _BV(0)) != 0;}
  bool rx_full() const {return (m_fifo & _BV(1)) != 0;}
  bool tx_empty() const {return (m_fifo & _BV(4)) != 0;}
  bool tx_full() const {return (m_fifo & _BV(5)) != 0;}
  bool tx_reuse() const {return (m_fifo & _BV(6)) != 0;}

private:
  uint8_t m_fifo ;
};

// Set of interrupt sources. Bit values match the STATUS register so the
// same set can be written back to clear flags.
class RF24Interrupts{
public:
  enum kind{
    max_retry = STATUS_MAX_RT,
    data_sent = STATUS_TX_DS,
    data_ready = STATUS_RX_DR
  };

  RF24Interrupts() : m_irq(0){}
  explicit RF24Interrupts(uint8_t bits) : m_irq(bits & all_bits()){}

  static RF24Interrupts none(){return RF24Interrupts();}
  static RF24Interrupts all(){return RF24Interrupts(all_bits());}

  RF24Interrupts &add(kind k){m_irq |= k; return *this;}
  RF24Interrupts &remove(kind k){m_irq &= ~k; return *this;}
  bool contains(kind k) const {return (m_irq & k) != 0;}
  uint8_t raw() const {return m_irq;}

  // CONFIG register mask bits. A set mask bit disables the IRQ pin
  // for that source
  uint8_t config_mask() const ;

private:
  static uint8_t all_bits(){return STATUS_MAX_RT | STATUS_TX_DS | STATUS_RX_DR;}
  uint8_t m_irq ;
};

#endif
