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

#ifndef __RF24_REGISTERS
#define __RF24_REGISTERS

#ifndef _BV
#define _BV(x) (1 << (x))
#endif

#define MAX_RXTXBUF 33
#define RF24_MAX_PAYLOAD 32
#define RF24_PIPES 6
#define RF24_FIFO_DEPTH 3
#define MIN_RF24_ADDRESS_LEN 3
#define MAX_RF24_ADDRESS_LEN 5
#define RF24_MAX_CHANNEL 125
#define RF24_PIPE_EMPTY 0x07

// Commands
#define RF24_READ_REG 0x00
#define RF24_WRITE_REG 0x20
#define RF24_REG_MASK 0x1F
#define R_RX_PAYLOAD 0x61
#define W_TX_PAYLOAD 0xA0
#define FLUSH_TX 0xE1
#define FLUSH_RX 0xE2
#define REUSE_TX_PL 0xE3
#define R_RX_PL_WID 0x60
#define W_ACK_PAYLOAD 0xA8
#define W_TX_PAYLOAD_NO_ACK 0xB0
#define RF24_NOP 0xFF

// Registers
#define REG_CONFIG 0x00
#define REG_EN_AA 0x01
#define REG_EN_RXADDR 0x02
#define REG_SETUP_AW 0x03
#define REG_SETUP_RETR 0x04
#define REG_RF_CH 0x05
#define REG_RF_SETUP 0x06
#define REG_STATUS 0x07
#define REG_OBSERVE_TX 0x08
#define REG_CD 0x09
#define REG_RX_ADDR_BASE 0x0A
#define REG_TX_ADDR 0x10
#define REG_RX_PW_BASE 0x11
#define REG_FIFO_STATUS 0x17
#define REG_DYNPD 0x1C
#define REG_FEATURE 0x1D

// CONFIG bits
#define CONFIG_MASK_RX_DR _BV(6)
#define CONFIG_MASK_TX_DS _BV(5)
#define CONFIG_MASK_MAX_RT _BV(4)
#define CONFIG_EN_CRC _BV(3)
#define CONFIG_CRCO _BV(2)
#define CONFIG_PWR_UP _BV(1)
#define CONFIG_PRIM_RX _BV(0)

// STATUS bits
#define STATUS_RX_DR _BV(6)
#define STATUS_TX_DS _BV(5)
#define STATUS_MAX_RT _BV(4)
#define STATUS_TX_FULL _BV(0)

// RF_SETUP bits
#define RF_SETUP_CONT_WAVE _BV(7)
#define RF_SETUP_DR_LOW _BV(5)
#define RF_SETUP_PLL_LOCK _BV(4)
#define RF_SETUP_DR_HIGH _BV(3)

// FEATURE bits
#define FEATURE_EN_DPL _BV(2)
#define FEATURE_EN_ACK_PAY _BV(1)
#define FEATURE_EN_DYN_ACK _BV(0)

// Timing (micro seconds)
#define RF24_POWERUP_DELAY_US 5000 // 1.5 ms minimum, worst case crystal start
#define RF24_RX_SETTLE_US 130
#define RF24_CE_PULSE_US 15 // 10 us minimum
#define RF24_TX_POLL_US 100

#endif
