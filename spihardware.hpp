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

#ifndef __RF24_SPIHARDWARE
#define __RF24_SPIHARDWARE

#include "hardware.hpp"
#include <stdint.h>

// Linux spidev SPI. Chip select is driven by the kernel for the length
// of each transfer so select() only tracks the caller's framing.
class spiHw : public IHardwareSPI{
public:
  spiHw() ;
  virtual ~spiHw() ;

  // Opens /dev/spidev<bus>.<cs>
  bool spiopen(int bus, int cs) ;
  void spiclose() ;

  bool setMode(uint8_t mode) ;
  bool setCSHigh(bool high) ;
  bool setSpeed(uint32_t hz) ;
  uint32_t getSpeed() const {return m_speed;}

  virtual bool select(bool assert_cs) ;
  virtual bool transfer(const uint8_t *tx, uint8_t *rx, uint16_t len) ;

protected:
  bool write_mode() ;

  int m_fd ;
  uint8_t m_mode ;
  uint8_t m_bits ;
  uint32_t m_speed ;
  bool m_selected ;
};

#endif
