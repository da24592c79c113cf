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
#include <signal.h>
#include <stdlib.h>

#define ADDR_WIDTH 5

static volatile sig_atomic_t running = 1 ;

void siginterrupt(int sig)
{
  running = 0 ;
}

int main(int argc, char **argv)
{
  const char usage[] = "Usage: %s -c ce [-o channel] [-a address] [-s 250|1|2] [-w width] [-d] [-v]\n" ;
  int opt = 0 ;
  int opt_ce = 0, opt_speed = 1, opt_width = 0 ;
  bool opt_dynamic = false, opt_verbose = false ;
  uint8_t rf24address[ADDR_WIDTH] = {0xC2,0xC2,0xC2,0xC2,0xC2} ;
  uint8_t opt_channel = 76 ;
  RF24DataRate rate = RF24_1MBPS ;
  struct sigaction siginthandle ;

  siginthandle.sa_handler = siginterrupt ;
  sigemptyset(&siginthandle.sa_mask) ;
  siginthandle.sa_flags = 0 ;

  if (sigaction(SIGINT, &siginthandle, NULL) < 0){
    fprintf(stderr,"Failed to set signal handler\n") ;
    return EXIT_FAILURE ;
  }

  while ((opt = getopt(argc, argv, "c:o:a:s:w:dv")) != -1) {
    switch (opt) {
    case 'c': // CE pin
      opt_ce = atoi(optarg) ;
      break ;
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

  if (!opt_ce || (!opt_dynamic && !opt_width)){
    fprintf(stderr, usage, argv[0]);
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

  if (!spi.spiopen(0,0)){
    fprintf(stderr, "Cannot Open SPI\n") ;
    return EXIT_FAILURE ;
  }
  spi.setCSHigh(false) ;
  spi.setMode(0) ;
  spi.setSpeed(6000000) ;

  try{
    RF24Config config ;
    config.set_channel(opt_channel).set_data_rate(rate) ;
    if (opt_dynamic) config.set_dynamic_payloads(true) ;
    else config.set_payload_size(opt_width) ;

    NordicRF24 radio(&spi, &pi, opt_ce, &pi, config) ;
    radio.open_reading_pipe(1, rf24address, ADDR_WIDTH) ;
    radio.start_listening() ;
    if (opt_verbose) print_state(&radio) ;

    uint8_t buffer[RF24_MAX_PAYLOAD+1] ;
    uint8_t pipe = 0 ;
    while(running){
      uint8_t bytes = radio.read(buffer, RF24_MAX_PAYLOAD, &pipe) ;
      while(bytes){
	buffer[bytes] = '\0' ;
	fprintf(stdout, "PIPE %d DATA: %s hex{", pipe, buffer) ;
	for (uint8_t i=0; i<bytes;i++){
	  fprintf(stdout, " %02X ", buffer[i]) ;
	}
	fprintf(stdout, "}\n") ;
	fflush(stdout) ;
	bytes = radio.read(buffer, RF24_MAX_PAYLOAD, &pipe) ;
      }
      pi.milliSleep(10) ; // stop overloading the CPU
    }
    printf("\nExiting and powering down radio\n") ;
    radio.power_down() ;
  }catch(RF24Exception &e){
    fprintf(stderr, "%s\n", e.what()) ;
    return EXIT_FAILURE ;
  }

  return EXIT_SUCCESS ;
}
