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

#include <unistd.h>
#include <stdlib.h>
#include <stdio.h>
#include "nordicrf24.hpp"
#include "wpihardware.hpp"
#include "spihardware.hpp"
#include "radioutil.hpp"
#include <string.h>

void print_info(NordicRF24 *pRadio)
{
  RF24FifoStatus fifo = pRadio->fifo_status() ;
  RF24Status status = pRadio->status() ;

  printf("Radio %s\n", pRadio->is_connected()?"connected":"not responding") ;
  printf("Worst case transmit:\t%u us\n", pRadio->max_transmit_time_us()) ;
  printf("Status flags----------\n") ;
  printf("Data ready:\t%s\n", status.data_ready()?"yes":"no") ;
  printf("Data sent:\t%s\n", status.data_sent()?"yes":"no") ;
  printf("Max retry:\t%s\n", status.max_retry()?"yes":"no") ;
  printf("FIFO status-----------\n") ;
  printf("RX empty:\t%s\n", fifo.rx_empty()?"yes":"no") ;
  printf("RX full:\t%s\n", fifo.rx_full()?"yes":"no") ;
  printf("TX empty:\t%s\n", fifo.tx_empty()?"yes":"no") ;
  printf("TX full:\t%s\n", fifo.tx_full()?"yes":"no") ;
  printf("TX reuse:\t%s\n", fifo.tx_reuse()?"yes":"no") ;
}

void scan_channels(NordicRF24 *r, IHardwareTimer *t)
{
  const int columns = 10 ;
  const int retries = 99 ;
  int col = 0, signal_count = 0;
  uint8_t original_channel = r->get_config().channel() ;
  
  r->start_listening() ;

  printf("CHAN\t") ;
  for (col=0; col < columns; col++) printf("%02X\t", col) ;
  printf("\n====\t") ;
  for (col=0; col < columns; col++) printf("==\t") ;
  printf("\n") ;
  col = 0;
  for (unsigned int chan=0; chan <= RF24_MAX_CHANNEL; chan++){
    if (col == 0) printf("%02X =\t", chan);

    r->set_channel(chan) ;
    signal_count = 0;
    for (int j=0; j < retries; j++){
      t->microSleep(174) ; // Tstby2a +Tdelay_AGC
      if (r->carrier_detect()) signal_count++ ;
    }
    if (signal_count == 0){
      printf("--\t") ;
    }else{
      printf("%02d\t", signal_count) ;
    }

    col++;
    if (col >= columns){
      col = 0 ;
      printf("\n") ;
    }
  }
  printf("\n") ;
  r->stop_listening() ;
  r->set_channel(original_channel) ;
}

int main(int argc, char *argv[])
{
  const char usage[] = "Usage: %s -c ce [-o channel] [-p] [-i] [-s] [-d]\n" ;
  int opt = 0, print = 0, info = 0, scan = 0, down = 0;
  int ce = 0 ;
  bool set_chan = false ;
  uint8_t chan = 0 ;
  
  while ((opt = getopt(argc, argv, "o:pisdc:")) != -1) {
    switch (opt) {
    case 'o': // channel
      if (!strchannel_to_channel(optarg, &chan)){
	fprintf(stderr, "Invalid channel, use 0 to 125\n") ;
	return EXIT_FAILURE ;
      }
      set_chan = true ;
      break;
    case 'p': // print state
      print = 1 ;
      break ;
    case 'i':
      info = 1 ;
      break;
    case 's':
      scan = 1;
      break ;
    case 'd': // leave powered down
      down = 1 ;
      break ;
    case 'c': // CE pin
      ce = atoi(optarg) ;
      break ;
    default: // ? opt
      fprintf(stderr, usage, argv[0]);
      return EXIT_FAILURE ;
    }
  }
  
  if (!ce){
    fprintf(stderr, usage, argv[0]);
    return EXIT_FAILURE ;
  }

  printf("Using pins CE %d\n", ce) ;

  wPi pi ;
  spiHw spi ;

  if (!spi.spiopen(0,0)){ // init SPI
    fprintf(stderr, "Cannot Open SPI\n") ;
    return EXIT_FAILURE;
  }
  spi.setCSHigh(false) ;
  spi.setMode(0) ;
  spi.setSpeed(6000000) ;

  try{
    // Construction resets the radio to the default configuration
    NordicRF24 radio(&spi, &pi, ce, &pi) ;

    if (set_chan){
      printf("Setting channel %d\n", chan) ;
      radio.set_channel(chan) ;
    }
    if (print){
      print_state(&radio) ;
    }
    if (info){
      if (print) printf("\n\n") ;
      print_info(&radio);
    }
    if (scan){
      scan_channels(&radio, &pi) ;
    }
    if (down) radio.power_down() ;
  }catch(RF24Exception &e){
    fprintf(stderr, "%s\n", e.what()) ;
    return EXIT_FAILURE ;
  }
  
  return EXIT_SUCCESS;
}
