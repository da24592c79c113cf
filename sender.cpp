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

#include "nordicrf24.hpp"
#include "wpihardware.hpp"
#include "spihardware.hpp"
#include "radioutil.hpp"
#include <stdio.h>
#include <unistd.h>
#include <string.h>
#include <stdlib.h>

#define ADDR_WIDTH 5

int main(int argc, char **argv)
{
  const char usage[] = "Usage: %s -c ce -m message [-o channel] [-a address] [-s 250|1|2] [-w width] [-d] [-r count] [-n] [-v]\n" ;
  int opt = 0 ;
  int opt_ce = 0, opt_speed = 1, opt_width = 0, opt_retries = 15 ;
  bool opt_dynamic = false, opt_verbose = false, opt_message = false, opt_noack = false ;
  uint8_t rf24address[ADDR_WIDTH] = {0xC2,0xC2,0xC2,0xC2,0xC2} ;
  uint8_t opt_channel = 76 ;
  char szMessage[RF24_MAX_PAYLOAD+1] ;
  RF24DataRate rate = RF24_1MBPS ;

  memset(szMessage, 0, sizeof(szMessage)) ;

  while ((opt = getopt(argc, argv, "c:m:o:a:s:w:dr:nv")) != -1) {
    switch (opt) {
    case 'c': // CE pin
      opt_ce = atoi(optarg) ;
      break ;
    case 'm': // message
      opt_message = true ;
      strncpy(szMessage, optarg, RF24_MAX_PAYLOAD) ;
      break;
    case 'o': // channel
      if (!strchannel_to_channel(optarg, &opt_channel)){
	fprintf(stderr, "Invalid channel, use 0 to 125\n") ;
	return EXIT_FAILURE ;
      }
      break;
    case 's': // speed
      opt_speed = atoi(optarg) ;
      break ;
    case 'w': // static payload width
      opt_width = atoi(optarg) ;
      break ;
    case 'd': // dynamic payloads
      opt_dynamic = true ;
      break ;
    case 'r': // retries
      opt_retries = atoi(optarg) ;
      break ;
    case 'n': // no acknowledgement
      opt_noack = true ;
      break ;
    case 'v':
      opt_verbose = true ;
      break ;
    case 'a': // address
      if (!straddr_to_addr(optarg, rf24address, ADDR_WIDTH)){
	fprintf(stderr, "Invalid address\n") ;
	return EXIT_FAILURE ;
      }
      break;
    default: // ? opt
      fprintf(stderr, usage, argv[0]);
      return EXIT_FAILURE ;
    }
  }

  if (!opt_ce || !opt_message){
    fprintf(stderr, usage, argv[0]);
    return EXIT_FAILURE ;
  }

  if (opt_dynamic && opt_noack){
    fprintf(stderr, "Dynamic payloads need acknowledgements\n") ;
    return EXIT_FAILURE ;
  }

  switch (opt_speed){
  case 1:
    rate = RF24_1MBPS ;
    break ;
  case 2:
    rate = RF24_2MBPS ;
    break ;
  case 250:
    rate = RF24_250KBPS ;
    break ;
  default:
    fprintf(stderr, "Invalid speed option. Use 250, 1 or 2\n") ;
    return EXIT_FAILURE ;
  }

  wPi pi ;
  spiHw spi ;

  // Pi has only one bus available on the user pins. 
  // Two devices 0,0 and 0,1 are available (CS0 & CS1). 
  if (!spi.spiopen(0,0)){
    fprintf(stderr, "Cannot Open SPI\n") ;
    return EXIT_FAILURE ;
  }
  spi.setCSHigh(false) ;
  spi.setMode(0) ;
  spi.setSpeed(6000000) ;

  uint8_t len = strlen(szMessage) ;
  try{
    RF24Config config ;
    config.set_channel(opt_channel)
      .set_data_rate(rate)
      .set_retries(15, opt_retries) ;
    if (opt_noack) config.set_auto_ack(false) ;
    if (opt_dynamic){
      config.set_dynamic_payloads(true) ;
    }else if (opt_width){
      // Pad the message out to the receivers width
      config.set_payload_size(opt_width) ;
      len = opt_width ;
    }

    NordicRF24 radio(&spi, &pi, opt_ce, &pi, config) ;
    radio.open_writing_pipe(rf24address, ADDR_WIDTH) ;
    if (opt_verbose) print_state(&radio) ;

    radio.write((uint8_t*)szMessage, len) ;
    printf("Sent %d bytes\n", len) ;
    radio.power_down() ;
  }catch(RF24MaxRetryErr &e){
    fprintf(stderr, "Message failed to deliver after %u retries\n", e.attempts()) ;
    return EXIT_FAILURE ;
  }catch(RF24Exception &e){
    fprintf(stderr, "%s\n", e.what()) ;
    return EXIT_FAILURE ;
  }

  return EXIT_SUCCESS ;
}
