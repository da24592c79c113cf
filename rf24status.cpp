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

#include "rf24status.hpp"

uint8_t RF24Interrupts::config_mask() const
{
  uint8_t reg = 0 ;
  reg |= (contains(data_ready)?0:CONFIG_MASK_RX_DR) |
    (contains(data_sent)?0:CONFIG_MASK_TX_DS) |
    (contains(max_retry)?0:CONFIG_MASK_MAX_RT) ;
  return reg ;
}
