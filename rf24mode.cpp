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

#include "rf24mode.hpp"
#include "rf24exception.hpp"
#include "rf24debug.hpp"

#define CONFIG_MODE_BITS (CONFIG_PWR_UP | CONFIG_PRIM_RX)

RF24Mode::RF24Mode(RF24Protocol &protocol, IHardwareGPIO *pGPIO, uint8_t ce, IHardwareTimer *pTimer)
  : m_protocol(protocol)
{
  if (!pGPIO) throw RF24Exception("GPIO interface required") ;
  if (!pTimer) throw RF24Exception("timer interface required") ;
  m_pGPIO = pGPIO ;
  m_pTimer = pTimer ;
  m_ce = ce ;
  m_config = 0 ;
  m_state = mode_power_down ;

  if (!m_pGPIO->setup(m_ce, IHardwareGPIO::gpio_output))
    throw RF24TransportErr("cannot set GPIO output pin for CE") ;
  set_ce(IHardwareGPIO::low) ;
}

const char *RF24Mode::state_name(state s)
{
  switch(s){
  case mode_power_down:
    return "power down" ;
  case mode_standby:
    return "standby" ;
  case mode_transmitting:
    return "transmitting" ;
  case mode_listening:
    return "listening" ;
  }
  return "unknown" ;
}

void RF24Mode::set_ce(IHardwareGPIO::gpio_val val)
{
  if (!m_pGPIO->output(m_ce, val)) throw RF24TransportErr("cannot set CE") ;
}

void RF24Mode::write_config()
{
  m_protocol.write_register(REG_CONFIG, m_config) ;
}

void RF24Mode::reset(uint8_t config_bits)
{
  set_ce(IHardwareGPIO::low) ;
  m_config = config_bits & ~CONFIG_MODE_BITS ;
  m_state = mode_power_down ;
}

void RF24Mode::set_config_bits(uint8_t config_bits)
{
  m_config = (m_config & CONFIG_MODE_BITS) | (config_bits & ~CONFIG_MODE_BITS) ;
  write_config() ;
}

void RF24Mode::power_up()
{
  if (m_state != mode_power_down) return ;

  m_config |= CONFIG_PWR_UP ;
  m_config &= ~CONFIG_PRIM_RX ;
  write_config() ;
  // Crystal start up. No register access is reliable before this
  m_pTimer->microSleep(RF24_POWERUP_DELAY_US) ;
  m_state = mode_standby ;
  DPRINT("RF24 mode: standby\n") ;
}

void RF24Mode::power_down()
{
  set_ce(IHardwareGPIO::low) ;
  m_config &= ~CONFIG_MODE_BITS ;
  write_config() ;
  m_state = mode_power_down ;
  DPRINT("RF24 mode: power down\n") ;
}

void RF24Mode::start_listening()
{
  if (m_state == mode_listening) return ;
  if (m_state == mode_power_down) power_up() ;

  m_config |= CONFIG_PRIM_RX ;
  write_config() ;
  set_ce(IHardwareGPIO::high) ;
  // 130 micro second wait recommended in the RF24 datasheet
  m_pTimer->microSleep(RF24_RX_SETTLE_US) ;
  m_state = mode_listening ;
  DPRINT("RF24 mode: listening\n") ;
}

void RF24Mode::stop_listening()
{
  if (m_state != mode_listening) return ;

  // Any packet being received is dropped
  set_ce(IHardwareGPIO::low) ;
  m_config &= ~CONFIG_PRIM_RX ;
  write_config() ;
  m_pTimer->microSleep(RF24_RX_SETTLE_US) ;
  m_state = mode_standby ;
  DPRINT("RF24 mode: standby\n") ;
}

void RF24Mode::pulse_transmit()
{
  if (m_state == mode_listening) stop_listening() ;
  if (m_state == mode_power_down) power_up() ;

  set_ce(IHardwareGPIO::high) ;
  m_pTimer->microSleep(RF24_CE_PULSE_US) ;
  set_ce(IHardwareGPIO::low) ;
  m_state = mode_transmitting ;
}

void RF24Mode::end_transmit()
{
  if (m_state == mode_transmitting) m_state = mode_standby ;
}
