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

#ifndef __RF24_EXCEPTION
#define __RF24_EXCEPTION

#include <exception>
#include <stdio.h>
#include <stdint.h>

#define RF24_EXCEPTION_LEN 128

class RF24Exception : public std::exception{
public:
  RF24Exception(){
    m_szerr[0] = '\0' ;
  }
  explicit RF24Exception(const char *sz){
    do_except("RF24 exception: ", sz) ;
  }
  virtual ~RF24Exception() throw(){}

  virtual const char *what() const throw(){return m_szerr;}

protected:
  void do_except(const char *prefix, const char *sz){
    snprintf(m_szerr, RF24_EXCEPTION_LEN, "%s%s", prefix, sz) ;
  }

  char m_szerr[RF24_EXCEPTION_LEN] ;
};

// Bus transfer or chip-select failure. Never retried by the driver
class RF24TransportErr : public RF24Exception{
public:
  explicit RF24TransportErr(const char *sz){
    do_except("Transport error: ", sz) ;
  }
};

// Out of range configuration value. field() names the setting
class RF24ConfigErr : public RF24Exception{
public:
  RF24ConfigErr(const char *field, const char *sz){
    m_field = field ;
    char szmsg[RF24_EXCEPTION_LEN] ;
    snprintf(szmsg, RF24_EXCEPTION_LEN, "%s %s", field, sz) ;
    do_except("Invalid config: ", szmsg) ;
  }
  const char *field() const {return m_field;}
protected:
  const char *m_field ;
};

class RF24AddressLengthErr : public RF24Exception{
public:
  explicit RF24AddressLengthErr(const char *sz){
    do_except("Invalid address length: ", sz) ;
  }
};

class RF24PipeErr : public RF24Exception{
public:
  explicit RF24PipeErr(const char *sz){
    do_except("Invalid pipe: ", sz) ;
  }
};

class RF24PayloadTooLargeErr : public RF24Exception{
public:
  explicit RF24PayloadTooLargeErr(const char *sz){
    do_except("Payload too large: ", sz) ;
  }
};

class RF24SizeMismatchErr : public RF24Exception{
public:
  explicit RF24SizeMismatchErr(const char *sz){
    do_except("Payload size mismatch: ", sz) ;
  }
};

class RF24NotConnectedErr : public RF24Exception{
public:
  explicit RF24NotConnectedErr(const char *sz){
    do_except("Radio not connected: ", sz) ;
  }
};

class RF24NotListeningErr : public RF24Exception{
public:
  explicit RF24NotListeningErr(const char *sz){
    do_except("Not listening: ", sz) ;
  }
};

// Hardware retransmit budget exhausted. The TX FIFO has been flushed
class RF24MaxRetryErr : public RF24Exception{
public:
  explicit RF24MaxRetryErr(uint8_t attempts){
    char szmsg[RF24_EXCEPTION_LEN] ;
    m_attempts = attempts ;
    snprintf(szmsg, RF24_EXCEPTION_LEN, "no acknowledgement after %u retries", attempts) ;
    do_except("Max retries: ", szmsg) ;
  }
  uint8_t attempts() const {return m_attempts;}
protected:
  uint8_t m_attempts ;
};

// Reported dynamic width out of range. The RX FIFO has been flushed
class RF24CorruptPayloadErr : public RF24Exception{
public:
  explicit RF24CorruptPayloadErr(const char *sz){
    do_except("Corrupt payload: ", sz) ;
  }
};

class RF24TimeoutErr : public RF24Exception{
public:
  explicit RF24TimeoutErr(const char *sz){
    do_except("Timeout: ", sz) ;
  }
};

#endif
