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

#ifndef __RF24_HARDWARE
#define __RF24_HARDWARE

#include <stdint.h>

// Capability interfaces consumed by the driver. The driver never owns
// these objects; the caller keeps them alive for the driver lifetime.

class IHardwareSPI{
public:
  virtual ~IHardwareSPI(){}

  // Assert (true) or release (false) chip-select
  virtual bool select(bool assert_cs) = 0 ;

  // Full duplex transfer of len bytes, most significant bit first.
  // rx may equal tx. Returns false on a transport failure.
  virtual bool transfer(const uint8_t *tx, uint8_t *rx, uint16_t len) = 0 ;
};

class IHardwareGPIO{
public:
  enum gpio_dir{gpio_input, gpio_output} ;
  enum gpio_val{low = 0, high = 1} ;

  virtual ~IHardwareGPIO(){}

  virtual bool setup(uint8_t pin, gpio_dir dir) = 0 ;
  virtual bool output(uint8_t pin, gpio_val val) = 0 ;
};

// Delays must block for at least the requested real time. The driver
// relies on this for the chip settling times and cannot detect a short sleep.
class IHardwareTimer{
public:
  virtual ~IHardwareTimer(){}

  virtual void microSleep(unsigned int us) = 0 ;
  virtual void milliSleep(unsigned int ms) = 0 ;
};

#endif
