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

#ifndef __RF24_MODE
#define __RF24_MODE

#include "hardware.hpp"
#include "rf24protocol.hpp"
#include <stdint.h>

// Owns the chip operating mode: the CE line and the PWR_UP/PRIM_RX bits of
// CONFIG. Nothing else in the driver touches either, so the settling delays
// between them are always honoured.
//
//   power_down -> standby          PWR_UP set, block >= 1.5 ms
//   standby    -> listening        PRIM_RX set, CE high, block 130 us
//   listening  -> standby          CE low, PRIM_RX cleared
//   standby    -> transmitting     CE pulsed high >= 10 us with a loaded TX FIFO
//   transmitting -> standby        once the driver has seen the outcome
//   any        -> power_down       CE low, PWR_UP cleared
class RF24Mode{
public:
  enum state{mode_power_down, mode_standby, mode_transmitting, mode_listening} ;

  RF24Mode(RF24Protocol &protocol, IHardwareGPIO *pGPIO, uint8_t ce, IHardwareTimer *pTimer) ;

  state get_state() const {return m_state;}
  static const char *state_name(state s) ;

  // Drop CE and take the CRC and IRQ mask bits of CONFIG. Nothing is
  // written until the next transition. Leaves the mode as power_down.
  void reset(uint8_t config_bits) ;

  // Rewrites the CRC and IRQ mask bits keeping the current mode
  void set_config_bits(uint8_t config_bits) ;

  void power_up() ;
  void power_down() ;
  void start_listening() ;
  void stop_listening() ;

  // Pulses CE to send the payload at the head of the TX FIFO
  void pulse_transmit() ;
  // Transmission outcome observed, chip is back in standby
  void end_transmit() ;

  uint8_t config_register() const {return m_config;}

protected:
  void set_ce(IHardwareGPIO::gpio_val val) ;
  void write_config() ;

  RF24Protocol &m_protocol ;
  IHardwareGPIO *m_pGPIO ;
  IHardwareTimer *m_pTimer ;
  uint8_t m_ce ;
  uint8_t m_config ;
  state m_state ;
};

#endif
