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

#include "wpihardware.hpp"
#include "rf24debug.hpp"
#include <wiringPi.h>

wPi::wPi()
{
  m_ready = (wiringPiSetupGpio() >= 0) ;
  if (!m_ready) EPRINT("wiringPi setup failed\n") ;
}

bool wPi::setup(uint8_t pin, gpio_dir dir)
{
  if (!m_ready) return false ;
  pinMode(pin, dir == gpio_output?OUTPUT:INPUT) ;
  return true ;
}

bool wPi::output(uint8_t pin, gpio_val val)
{
  if (!m_ready) return false ;
  digitalWrite(pin, val == high?HIGH:LOW) ;
  return true ;
}

void wPi::microSleep(unsigned int us)
{
  delayMicroseconds(us) ;
}

void wPi::milliSleep(unsigned int ms)
{
  delay(ms) ;
}
