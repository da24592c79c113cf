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

#include "spihardware.hpp"
#include "rf24debug.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <sys/ioctl.h>
#include <linux/spi/spidev.h>

spiHw::spiHw()
{
  m_fd = -1 ;
  m_mode = SPI_MODE_0 ;
  m_bits = 8 ;
  m_speed = 1000000 ;
  m_selected = false ;
}

spiHw::~spiHw()
{
  spiclose() ;
}

bool spiHw::spiopen(int bus, int cs)
{
  char szdev[32] ;

  spiclose() ;
  snprintf(szdev, sizeof(szdev), "/dev/spidev%d.%d", bus, cs) ;
  m_fd = open(szdev, O_RDWR) ;
  if (m_fd < 0){
    EPRINT("Cannot open %s: %s\n", szdev, strerror(errno)) ;
    return false ;
  }
  if (ioctl(m_fd, SPI_IOC_WR_BITS_PER_WORD, &m_bits) < 0 ||
      ioctl(m_fd, SPI_IOC_WR_MAX_SPEED_HZ, &m_speed) < 0 ||
      !write_mode()){
    EPRINT("Cannot configure %s: %s\n", szdev, strerror(errno)) ;
    spiclose() ;
    return false ;
  }
  DPRINT("Opened %s\n", szdev) ;
  return true ;
}

void spiHw::spiclose()
{
  if (m_fd >= 0) close(m_fd) ;
  m_fd = -1 ;
  m_selected = false ;
}

bool spiHw::write_mode()
{
  if (m_fd < 0) return true ; // applied on open
  return ioctl(m_fd, SPI_IOC_WR_MODE, &m_mode) >= 0 ;
}

bool spiHw::setMode(uint8_t mode)
{
  if (mode > 3) return false ;
  m_mode = (m_mode & ~(SPI_CPHA | SPI_CPOL)) | mode ;
  return write_mode() ;
}

bool spiHw::setCSHigh(bool high)
{
  if (high) m_mode |= SPI_CS_HIGH ;
  else m_mode &= ~SPI_CS_HIGH ;
  return write_mode() ;
}

bool spiHw::setSpeed(uint32_t hz)
{
  m_speed = hz ;
  if (m_fd < 0) return true ;
  return ioctl(m_fd, SPI_IOC_WR_MAX_SPEED_HZ, &m_speed) >= 0 ;
}

bool spiHw::select(bool assert_cs)
{
  if (m_fd < 0) return false ;
  m_selected = assert_cs ;
  return true ;
}

bool spiHw::transfer(const uint8_t *tx, uint8_t *rx, uint16_t len)
{
  struct spi_ioc_transfer xfer ;

  if (m_fd < 0 || !m_selected) return false ;

  memset(&xfer, 0, sizeof(xfer)) ;
  xfer.tx_buf = (unsigned long)tx ;
  xfer.rx_buf = (unsigned long)rx ;
  xfer.len = len ;
  xfer.speed_hz = m_speed ;
  xfer.bits_per_word = m_bits ;

  if (ioctl(m_fd, SPI_IOC_MESSAGE(1), &xfer) < 0){
    EPRINT("SPI transfer failed: %s\n", strerror(errno)) ;
    return false ;
  }
  return true ;
}
