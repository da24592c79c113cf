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

#include "radioutil.hpp"
#include <stdlib.h>
#include <string.h>

static const char *yesno(bool b)
{
  return b?"true":"false" ;
}

static void print_address(FILE *out, const uint8_t *address, uint8_t width)
{
  char szaddr[MAX_RF24_ADDRESS_LEN*2+1] ;
  addr_to_straddr(address, szaddr, width) ;
  fprintf(out, "%s", szaddr) ;
}

void print_state(NordicRF24 *pRadio)
{
  fprint_state(stdout, pRadio) ;
}

void fprint_state(FILE *out, NordicRF24 *pRadio)
{
  const RF24Config &cfg = pRadio->get_config() ;
  uint8_t addr_width = cfg.address_width() ;
  uint8_t address[MAX_RF24_ADDRESS_LEN] ;
  uint8_t lost = 0, retrans = 0 ;
  const char *crc[] = {"disabled", "1 byte", "2 byte"} ;
  const char *rate[] = {"", "250 Kbps", "1 Mbps", "2 Mbps"} ;
  const char *power[] = {"-18 dBm", "-12 dBm", "-6 dBm", "0 dBm"} ;

  RF24Status status = pRadio->status() ;
  RF24FifoStatus fifo = pRadio->fifo_status() ;
  pRadio->read_observe(lost, retrans) ;

  fprintf(out, "Mode: %s\n", RF24Mode::state_name(pRadio->get_mode())) ;
  fprintf(out, "Data Ready Interrupt: %s\n", yesno(cfg.interrupts().contains(RF24Interrupts::data_ready))) ;
  fprintf(out, "Data Sent Interrupt: %s\n", yesno(cfg.interrupts().contains(RF24Interrupts::data_sent))) ;
  fprintf(out, "Max Retry Interrupt: %s\n", yesno(cfg.interrupts().contains(RF24Interrupts::max_retry))) ;
  fprintf(out, "CRC: %s\n", crc[cfg.crc()]) ;
  fprintf(out, "Address Width: %d\n", addr_width) ;
  fprintf(out, "Retry Delay: %d\n", cfg.retry_delay()) ;
  fprintf(out, "Retry Count: %d\n", cfg.retry_count()) ;
  fprintf(out, "Channel: %d\n", cfg.channel()) ;
  fprintf(out, "Power Level: %s\n", power[cfg.power_level()]) ;
  fprintf(out, "Data Rate: %s\n", rate[cfg.data_rate()]) ;
  fprintf(out, "Auto ACK: %s\n", yesno(cfg.auto_ack())) ;
  fprintf(out, "Dynamic Payloads: %s\n", yesno(cfg.dynamic_payloads())) ;
  fprintf(out, "Status: 0x%02X\n", status.raw()) ;
  fprintf(out, "FIFO Status: 0x%02X\n", fifo.raw()) ;
  fprintf(out, "Packets Lost: %d, Retransmitted: %d\n", lost, retrans) ;
  
  for (uint8_t i=0; i < RF24_PIPES;i++){
    fprintf(out, "Pipe %d Enabled: %s\n", i, yesno(pRadio->is_pipe_enabled(i))) ;
    fprintf(out, "Pipe %d ACK: %s\n", i, yesno(pRadio->is_pipe_ack(i))) ;
    fprintf(out, "Pipe %d Address: ", i) ;
    if (i < 2){
      pRadio->read_register(REG_RX_ADDR_BASE+i, address, addr_width) ;
      print_address(out, address, addr_width) ;
    }else{
      // Only the low byte is held for pipes 2-5
      pRadio->read_register(REG_RX_ADDR_BASE+1, address, addr_width) ;
      pRadio->read_register(REG_RX_ADDR_BASE+i, address, 1) ;
      print_address(out, address, addr_width) ;
    }
    fprintf(out, "\nPipe %d Payload Width: %d\n\n", i, pRadio->get_payload_width(i)) ;
  }

  pRadio->read_register(REG_TX_ADDR, address, addr_width) ;
  fprintf(out, "Transmit Address: ") ;
  print_address(out, address, addr_width) ;
  fprintf(out, "\n") ;
}

int straddr_to_addr(const char *str, uint8_t *rf24addr, const unsigned int len)
{
  int shift = 4;
  if (len == 0) return 0 ;
  
  memset(rf24addr, 0, len) ;
  if (strlen(str) != len * 2) return 0 ;
  // Write backwards so MSB is at the end of the buffer
  // and LSB is written first
  uint8_t *p = rf24addr+len-1 ; 
  for (unsigned int i = 0; i < len * 2; i++){
    if (str[i] >= '0' && str[i] <= '9'){
      *p |= ((str[i] - '0') << shift) ;
    }else if(str[i] >= 'A' && str[i] <= 'F'){
      *p |= ((str[i] - 'A' + 10) << shift) ;
    }else if(str[i] >= 'a' && str[i] <= 'f'){
      *p |= ((str[i] - 'a' + 10) << shift) ;
    }else{
      memset(rf24addr, 0, len) ;
      return 0 ;
    }
    
    if (shift == 0){
      p-- ;
    }
    shift = (shift == 0)?4:0 ;
  }
  return 1 ;
}

int strchannel_to_channel(const char *str, uint8_t *channel)
{
  char *end = NULL ;
  if (!str || *str == '\0') return 0 ;
  long val = strtol(str, &end, 10) ;
  if (*end != '\0' || val < 0 || val > RF24_MAX_CHANNEL) return 0 ;
  *channel = (uint8_t)val ;
  return 1 ;
}

void addr_to_straddr(const uint8_t *rf24addr, char *szaddress, const uint8_t address_len)
{
  char *p = szaddress;
  *p = '\0' ;
  for (int i=address_len-1; i >= 0; i--){    
    snprintf(p, 3, "%02X",rf24addr[i]) ;
    p += 2;
  }
}
