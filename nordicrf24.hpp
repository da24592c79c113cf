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

#ifndef __NORDIC_RF24
#define __NORDIC_RF24

#include "hardware.hpp"
#include "rf24config.hpp"
#include "rf24exception.hpp"
#include "rf24mode.hpp"
#include "rf24pipes.hpp"
#include "rf24protocol.hpp"
#include "rf24status.hpp"
#include <stddef.h>
#include <stdint.h>

// nRF24L01(+) driver. Single threaded and blocking: every call runs to
// completion on the caller's thread using the timer for the chip's
// settling times. Callers sharing an instance between threads must lock
// around it.
//
// All failures are thrown as RF24Exception subclasses, see rf24exception.hpp
class NordicRF24{
public:
  enum tx_state{tx_idle, tx_pending, tx_complete} ;

  // Configures and powers up the chip. Throws RF24NotConnectedErr if the
  // chip does not read back its CONFIG register.
  NordicRF24(IHardwareSPI *pSPI, IHardwareGPIO *pGPIO, uint8_t ce,
	     IHardwareTimer *pTimer, const RF24Config &config = RF24Config()) ;

  NordicRF24(const NordicRF24 &) = delete ;
  NordicRF24 &operator=(const NordicRF24 &) = delete ;

  // Reads SETUP_AW and compares with the configured address width
  bool is_connected() ;

  const RF24Config &get_config() const {return m_config;}
  RF24Mode::state get_mode() const {return m_mode.get_state();}

  // Pipes
  void open_writing_pipe(const uint8_t *address, uint8_t len) ;
  void open_reading_pipe(uint8_t pipe, const uint8_t *address, uint8_t len) ;
  void close_reading_pipe(uint8_t pipe) ;
  void set_payload_width(uint8_t pipe, uint8_t width) ;
  uint8_t get_payload_width(uint8_t pipe) const {return m_pipes.payload_width(pipe);}
  bool is_pipe_enabled(uint8_t pipe) const {return m_pipes.is_pipe_enabled(pipe);}
  bool is_pipe_ack(uint8_t pipe) const {return m_pipes.is_pipe_ack(pipe);}

  // Receiving
  void start_listening() ;
  void stop_listening() ;
  // True if RX_DR is raised or the RX FIFO holds a payload
  bool data_available() ;
  // As data_available, also returning the pipe of the next payload
  bool data_available_on_pipe(uint8_t &pipe) ;
  // Reads the next payload into buffer. Returns the payload width or 0 if
  // nothing was waiting. pipe is set to the receiving pipe if not NULL.
  // Throws RF24NotListeningErr outside listening mode.
  uint8_t read(uint8_t *buffer, uint8_t size, uint8_t *pipe = NULL) ;

  // Transmitting
  // Sends one payload and blocks until it is acknowledged or the retries
  // run out (RF24MaxRetryErr, TX FIFO flushed). Returns to listening
  // afterwards if it was listening. Blocks for at most
  // max_transmit_time_us() per queued payload.
  void write(const uint8_t *payload, uint8_t len) ;
  // Queues a payload and starts sending without waiting. Returns false
  // if the TX FIFO is full; queued payloads are left untouched.
  bool start_write(const uint8_t *payload, uint8_t len) ;
  // Non-blocking check on queued payloads. Throws RF24MaxRetryErr after
  // flushing the TX FIFO if a payload was not acknowledged.
  tx_state poll_write() ;
  uint32_t max_transmit_time_us() const {return m_config.max_transmit_time_us();}

  // Runtime settings
  void set_channel(uint8_t channel) ;
  void set_power_level(RF24PowerLevel level) ;
  void set_data_rate(RF24DataRate rate) ;
  void set_retries(uint8_t delay, uint8_t count) ;
  void set_crc(RF24Crc crc) ;
  void set_interrupts(const RF24Interrupts &irq) ;

  // Chip level
  void power_up() ;
  void power_down() ;
  RF24Status status() ;
  RF24FifoStatus fifo_status() ;
  void flush_tx() ;
  void flush_rx() ;
  void clear_interrupts(const RF24Interrupts &irq = RF24Interrupts::all()) ;
  // OBSERVE_TX counters
  void read_observe(uint8_t &packets_lost, uint8_t &retransmitted) ;
  // Received power detector, only meaningful while listening
  bool carrier_detect() ;
  // Raw register read for diagnostics
  RF24Status read_register(uint8_t addr, uint8_t *val, uint8_t len) ;

protected:
  void apply_config() ;
  void prepare_payload(const uint8_t *payload, uint8_t len) ;
  void discard_stale() ;
  void discard_failed() ;
  void wait_for_space() ;
  void wait_for_sent() ;
  void poll_sleep(uint32_t &waited) ;

  RF24Config m_config ;
  RF24Protocol m_protocol ;
  RF24Mode m_mode ;
  RF24Pipes m_pipes ;
  IHardwareTimer *m_pTimer ;
};

#endif
