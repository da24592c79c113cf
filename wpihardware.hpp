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

#ifndef __RF24_WPIHARDWARE
#define __RF24_WPIHARDWARE

#include "hardware.hpp"

// wiringPi GPIO and timing. Pins use BCM GPIO numbering.
class wPi : public IHardwareGPIO, public IHardwareTimer{
public:
  wPi() ;
  virtual ~wPi(){}

  virtual bool setup(uint8_t pin, gpio_dir dir) ;
  virtual bool output(uint8_t pin, gpio_val val) ;

  virtual void microSleep(unsigned int us) ;
  virtual void milliSleep(unsigned int ms) ;

protected:
  bool m_ready ;
};

#endif
