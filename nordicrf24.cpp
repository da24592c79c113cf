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
#include "rf24debug.hpp"

NordicRF24::NordicRF24(IHardwareSPI *pSPI, IHardwareGPIO *pGPIO, uint8_t ce,
		       IHardwareTimer *pTimer, const RF24Config &config)
  : m_config(config),
    m_protocol(pSPI),
    m_mode(m_protocol, pGPIO, ce, pTimer),
    m_pipes(m_protocol, m_config)
{
  m_pTimer = pTimer ;

  // Must allow the radio time to settle after power on else
  // configuration bits will not necessarily stick
  m_pTimer->milliSleep(5) ;
  apply_config() ;
}

void NordicRF24::apply_config()
{
  // Fixed order. Address width before any address, RF settings before
  // leaving power down and CONFIG last as it powers the chip up.
  m_mode.reset(m_config.config_bits()) ;
  m_protocol.write_register(REG_SETUP_AW, m_config.setup_aw()) ;
  m_protocol.write_register(REG_SETUP_RETR, m_config.setup_retr()) ;
  m_protocol.write_register(REG_RF_CH, m_config.channel()) ;
  m_protocol.write_register(REG_RF_SETUP, m_config.rf_setup()) ;
  m_protocol.write_register(REG_FEATURE, m_config.feature()) ;
  m_pipes.reset() ;
  clear_interrupts() ;
  flush_rx() ;
  flush_tx() ;
  m_mode.power_up() ;

  uint8_t reg = m_protocol.read_register(REG_CONFIG) ;
  if (reg != m_mode.config_register()){
    EPRINT("CONFIG read back 0x%02X, expected 0x%02X\n", reg, m_mode.config_register()) ;
    throw RF24NotConnectedErr("CONFIG register did not read back") ;
  }
}

bool NordicRF24::is_connected()
{
  return m_protocol.read_register(REG_SETUP_AW) == m_config.setup_aw() ;
}

void NordicRF24::open_writing_pipe(const uint8_t *address, uint8_t len)
{
  if (!address) throw RF24Exception("address required") ;
  m_pipes.open_writing_pipe(address, len) ;
  // The TX address has just been shadowed into pipe 0
  if (m_mode.get_state() == RF24Mode::mode_listening) m_pipes.restore_for_listening() ;
}

void NordicRF24::open_reading_pipe(uint8_t pipe, const uint8_t *address, uint8_t len)
{
  if (!address) throw RF24Exception("address required") ;
  m_pipes.open_reading_pipe(pipe, address, len) ;
}

void NordicRF24::close_reading_pipe(uint8_t pipe)
{
  m_pipes.close_reading_pipe(pipe) ;
}

void NordicRF24::set_payload_width(uint8_t pipe, uint8_t width)
{
  m_pipes.set_payload_width(pipe, width) ;
}

void NordicRF24::start_listening()
{
  m_pipes.restore_for_listening() ;
  m_mode.start_listening() ;
}

void NordicRF24::stop_listening()
{
  m_mode.stop_listening() ;
  m_pipes.shadow_for_transmit() ;
}

bool NordicRF24::data_available()
{
  RF24Status s = m_protocol.status() ;
  if (!s.is_valid()) return false ;
  return s.data_ready() || !s.rx_empty() ;
}

bool NordicRF24::data_available_on_pipe(uint8_t &pipe)
{
  RF24Status s = m_protocol.status() ;
  if (!s.is_valid() || s.rx_empty()) return false ;
  pipe = s.rx_pipe() ;
  return true ;
}

uint8_t NordicRF24::read(uint8_t *buffer, uint8_t size, uint8_t *pipe)
{
  if (!buffer) throw RF24Exception("buffer required") ;
  if (m_mode.get_state() != RF24Mode::mode_listening)
    throw RF24NotListeningErr("start_listening before reading") ;

  RF24Status s = m_protocol.status() ;
  if (!s.is_valid() || s.rx_empty()) return 0 ;

  uint8_t rx_pipe = s.rx_pipe() ;
  uint8_t width = 0 ;
  if (m_config.dynamic_payloads()){
    m_protocol.send_command(R_RX_PL_WID, NULL, &width, 1) ;
    if (width == 0 || width > RF24_MAX_PAYLOAD){
      // Corrupt value. The FIFO cannot be trusted
      EPRINT("Dynamic payload width %u, flushing RX\n", width) ;
      flush_rx() ;
      clear_interrupts(RF24Interrupts().add(RF24Interrupts::data_ready)) ;
      throw RF24CorruptPayloadErr("reported width out of range") ;
    }
  }else{
    width = m_pipes.payload_width(rx_pipe) ;
  }
  if (width > size) throw RF24PayloadTooLargeErr("buffer smaller than the received payload") ;

  m_protocol.send_command(R_RX_PAYLOAD, NULL, buffer, width) ;
  clear_interrupts(RF24Interrupts().add(RF24Interrupts::data_ready)) ;
  if (pipe) *pipe = rx_pipe ;
  return width ;
}

void NordicRF24::prepare_payload(const uint8_t *payload, uint8_t len)
{
  if (!payload) throw RF24Exception("payload required") ;
  if (len > RF24_MAX_PAYLOAD) throw RF24PayloadTooLargeErr("payloads are at most 32 bytes") ;
  if (len == 0) throw RF24SizeMismatchErr("payloads are at least 1 byte") ;
  if (m_config.dynamic_payloads()) return ;

  if (!m_config.is_payload_size_set()){
    // First use fixes the static width
    m_config.set_payload_size(len) ;
    m_pipes.adopt_payload_width(len) ;
    return ;
  }
  if (len != m_config.payload_size())
    throw RF24SizeMismatchErr("payload length must equal the static payload size") ;
}

void NordicRF24::discard_failed()
{
  flush_tx() ;
  clear_interrupts(RF24Interrupts().add(RF24Interrupts::max_retry).add(RF24Interrupts::data_sent)) ;
  m_mode.end_transmit() ;
}

void NordicRF24::discard_stale()
{
  // A failed payload left behind by an unpolled start_write blocks the FIFO
  if (m_protocol.status().max_retry()){
    EPRINT("Flushing unacknowledged payloads from an earlier write\n") ;
    discard_failed() ;
  }
}

void NordicRF24::poll_sleep(uint32_t &waited)
{
  if (waited >= max_transmit_time_us() * (RF24_FIFO_DEPTH + 1))
    throw RF24TimeoutErr("transmit did not complete in the worst case time") ;
  m_pTimer->microSleep(RF24_TX_POLL_US) ;
  waited += RF24_TX_POLL_US ;
}

void NordicRF24::wait_for_space()
{
  uint32_t waited = 0 ;
  while (m_protocol.status().tx_full()){
    poll_write() ;
    poll_sleep(waited) ;
  }
}

void NordicRF24::wait_for_sent()
{
  uint32_t waited = 0 ;
  while (poll_write() == tx_pending){
    poll_sleep(waited) ;
  }
}

void NordicRF24::write(const uint8_t *payload, uint8_t len)
{
  prepare_payload(payload, len) ;

  bool was_listening = (m_mode.get_state() == RF24Mode::mode_listening) ;
  try{
    if (was_listening) stop_listening() ;
    else m_pipes.shadow_for_transmit() ;
    discard_stale() ;
    wait_for_space() ;
    m_protocol.send_command(W_TX_PAYLOAD, payload, NULL, len) ;
    m_mode.pulse_transmit() ;
    wait_for_sent() ;
  }catch(RF24Exception &){
    if (was_listening) start_listening() ;
    throw ;
  }
  if (was_listening) start_listening() ;
}

bool NordicRF24::start_write(const uint8_t *payload, uint8_t len)
{
  prepare_payload(payload, len) ;

  if (m_mode.get_state() == RF24Mode::mode_listening) stop_listening() ;
  else m_pipes.shadow_for_transmit() ;
  discard_stale() ;
  if (m_protocol.status().tx_full()) return false ;

  m_protocol.send_command(W_TX_PAYLOAD, payload, NULL, len) ;
  m_mode.pulse_transmit() ;
  return true ;
}

NordicRF24::tx_state NordicRF24::poll_write()
{
  // FIFO before STATUS: a payload leaving the FIFO has already raised
  // TX_DS by the time STATUS is read, so an empty FIFO with no flag is idle
  RF24FifoStatus fifo = fifo_status() ;
  RF24Status s = m_protocol.status() ;
  if (s.max_retry()){
    EPRINT("Max retries reached, flushing TX\n") ;
    discard_failed() ;
    throw RF24MaxRetryErr(m_config.retry_count()) ;
  }

  if (s.data_sent()){
    clear_interrupts(RF24Interrupts().add(RF24Interrupts::data_sent)) ;
    if (!fifo.tx_empty()) fifo = fifo_status() ;
    if (!fifo.tx_empty()){
      // Next queued payload
      m_mode.pulse_transmit() ;
      return tx_pending ;
    }
    m_mode.end_transmit() ;
    return tx_complete ;
  }

  if (fifo.tx_empty()){
    m_mode.end_transmit() ;
    return tx_idle ;
  }
  // Loaded but never sent
  if (m_mode.get_state() != RF24Mode::mode_transmitting) m_mode.pulse_transmit() ;
  return tx_pending ;
}

void NordicRF24::set_channel(uint8_t channel)
{
  RF24Config updated = m_config ;
  updated.set_channel(channel) ;
  m_protocol.write_register(REG_RF_CH, updated.channel()) ;
  m_config = updated ;
}

void NordicRF24::set_power_level(RF24PowerLevel level)
{
  RF24Config updated = m_config ;
  updated.set_power_level(level) ;
  m_protocol.write_register(REG_RF_SETUP, updated.rf_setup()) ;
  m_config = updated ;
}

void NordicRF24::set_data_rate(RF24DataRate rate)
{
  RF24Config updated = m_config ;
  updated.set_data_rate(rate) ;
  m_protocol.write_register(REG_RF_SETUP, updated.rf_setup()) ;
  m_config = updated ;
}

void NordicRF24::set_retries(uint8_t delay, uint8_t count)
{
  RF24Config updated = m_config ;
  updated.set_retries(delay, count) ;
  m_protocol.write_register(REG_SETUP_RETR, updated.setup_retr()) ;
  m_config = updated ;
}

void NordicRF24::set_crc(RF24Crc crc)
{
  RF24Config updated = m_config ;
  updated.set_crc(crc) ;
  m_mode.set_config_bits(updated.config_bits()) ;
  m_config = updated ;
}

void NordicRF24::set_interrupts(const RF24Interrupts &irq)
{
  RF24Config updated = m_config ;
  updated.set_interrupts(irq) ;
  m_mode.set_config_bits(updated.config_bits()) ;
  m_config = updated ;
}

void NordicRF24::power_up()
{
  m_mode.power_up() ;
}

void NordicRF24::power_down()
{
  m_mode.power_down() ;
}

RF24Status NordicRF24::status()
{
  return m_protocol.status() ;
}

RF24FifoStatus NordicRF24::fifo_status()
{
  return RF24FifoStatus(m_protocol.read_register(REG_FIFO_STATUS)) ;
}

void NordicRF24::flush_tx()
{
  m_protocol.send_command(FLUSH_TX) ;
}

void NordicRF24::flush_rx()
{
  m_protocol.send_command(FLUSH_RX) ;
}

void NordicRF24::clear_interrupts(const RF24Interrupts &irq)
{
  m_protocol.write_register(REG_STATUS, irq.raw()) ;
}

void NordicRF24::read_observe(uint8_t &packets_lost, uint8_t &retransmitted)
{
  uint8_t reg = m_protocol.read_register(REG_OBSERVE_TX) ;
  packets_lost = reg >> 4 ;
  retransmitted = reg & 0x0F ;
}

bool NordicRF24::carrier_detect()
{
  return (m_protocol.read_register(REG_CD) & _BV(0)) != 0 ;
}

RF24Status NordicRF24::read_register(uint8_t addr, uint8_t *val, uint8_t len)
{
  return m_protocol.read_register(addr, val, len) ;
}
