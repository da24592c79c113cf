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

#ifndef __RADIO_UTILITY
#define __RADIO_UTILITY

#include "nordicrf24.hpp"
#include <stdio.h>

extern "C"
{

  /* Print the state of the radio to stdout */
  void print_state(NordicRF24 *pRadio);

  /* As print_state but to any stream */
  void fprint_state(FILE *out, NordicRF24 *pRadio);

  /* 
     Convert a hex address string to a byte representation.
     str - hex string, most significant byte first
     rf24addr - output address for use with radio, least significant byte first
     len - address length (max 5 bytes for NRF24 radio, but will generate longer addresses)
     returns 1 on success and 0 on failure
  */
  int straddr_to_addr(const char *str, uint8_t *rf24addr, const unsigned int len);

  /* 
     Convert an address to a hex string. 
     szaddress must be allocated to at least address_len * 2 + 1
  */
  void addr_to_straddr(const uint8_t *rf24addr, char *szaddress, const uint8_t address_len);

  /*
     Convert a decimal channel string, 0 to 125.
     returns 1 on success and 0 on failure, channel is untouched on failure
  */
  int strchannel_to_channel(const char *str, uint8_t *channel);

}


#endif
