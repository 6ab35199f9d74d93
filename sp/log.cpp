#include "log.hpp"
#include <unistd.h>
#include <stdio.h>
#include <time.h>
#include <atomic>
#include <thread>
#include <mutex>
#include <vector>
#include <iostream>
#include <algorithm>

namespace sp
{

  // background writer of completed log lines to stderr
  class log_impl
  {
  public:
    log_impl();
    ~log_impl();
    void start();
    void stop();
    void run();
    void add( std::string& line );

  private:
    typedef std::vector<std::string> line_vec_t;
    typedef std::atomic<bool> atomic_t;
    atomic_t    is_run_;
    atomic_t    is_wtr_;
    std::mutex  mtx_;
    std::thread thrd_;
    line_vec_t  logv_;
  };

}

using namespace sp;

static void run_log( log_impl *iptr )
{
  iptr->run();
}

log_impl::log_impl()
: is_run_( true ),
  is_wtr_( false )
{
}

log_impl::~log_impl()
{
  stop();
}

void log_impl::start()
{
  std::lock_guard<std::mutex> lck( mtx_ );
  if ( !thrd_.joinable() ) {
    thrd_ = std::thread( run_log, this );
  }
}

void log_impl::stop()
{
  is_run_ = false;
  if ( thrd_.joinable() ) {
    thrd_.join();
  }
}

void log_impl::add( std::string& line )
{
  std::lock_guard<std::mutex> lck( mtx_ );
  logv_.emplace_back();
  logv_.back().swap( line );
  is_wtr_ = true;
}

void log_impl::run()
{
  struct timespec ts[1];
  ts->tv_sec  = 0;
  ts->tv_nsec = 1000000;
  line_vec_t logv;
  for(;;) {
    if ( is_wtr_ ) {
      // get lines to log
      mtx_.lock();
      is_wtr_ = false;
      logv_.swap( logv );
      mtx_.unlock();

      // write the lines to stderr
      for( const std::string& line: logv ) {
        std::cerr << line << std::endl;
      }
      logv.clear();
    } else if ( !is_run_ ) {
      break;
    } else {
      // sleep a bit
      clock_nanosleep( CLOCK_REALTIME, 0, ts, NULL );
    }
  }
}

int log::level_ = 0;
static log_impl impl_;

void log::set_level( int t )
{
  level_ = 1;
  while( level_ < (int)t ) {
    level_ <<= 1;
    level_ |= 1;
  }
  impl_.start();
}

log_line log::add( str topic, int level )
{
  return log_line( topic, level );
}

static const char spaces[] =
"                                                                         ";

static int log_pid = getpid();

void log_wtr::add( char val )
{
  buf_ += val;
}

void log_wtr::add( str val )
{
  buf_.append( val.str_, val.len_ );
}

void log_wtr::add_i64( int64_t val )
{
  char buf[32];
  snprintf( buf, sizeof( buf ), "%ld", (long)val );
  buf_ += buf;
}

void log_wtr::add_u64( uint64_t val )
{
  char buf[32];
  snprintf( buf, sizeof( buf ), "%lu", (unsigned long)val );
  buf_ += buf;
}

void log_wtr::detach( std::string& res )
{
  res.swap( buf_ );
  buf_.clear();
}

log_line::log_line( str topic, int lvl )
: is_first_( true )
{
  char tbuf[32];
  nsecs_to_utc6( get_now(), tbuf );
  wtr_.add( '[' );
  wtr_.add( str( tbuf, 27 ) );
  wtr_.add( ' ' );
  wtr_.add_i64( log_pid );
  wtr_.add( ' ' );
  switch(lvl) {
    case SP_LOG_DBG_LVL: wtr_.add( "DBG" );break;
    case SP_LOG_INF_LVL: wtr_.add( "INF" );break;
    case SP_LOG_WRN_LVL: wtr_.add( "WRN" );break;
    case SP_LOG_ERR_LVL: wtr_.add( "ERR" );break;
  }
  wtr_.add( ' ' );
  const size_t topic_len = 40;
  size_t len = std::min( topic.len_, topic_len );
  wtr_.add( str( topic.str_, len ) );
  if ( len < topic_len ) {
    wtr_.add( str( spaces, topic_len-len ) );
  }
  wtr_.add( ']' );
  wtr_.add( ' ' );
}

void log_line::add_key( str key )
{
  if ( !is_first_ ) {
    wtr_.add( ',' );
  } else {
    is_first_ = false;
  }
  wtr_.add( key );
  wtr_.add( '=' );
}

log_line& log_line::add( str key, str val )
{
  add_key( key );
  wtr_.add( val );
  return *this;
}

log_line& log_line::add( str key, int32_t val )
{
  add_key( key );
  wtr_.add_i64( val );
  return *this;
}

log_line& log_line::add( str key, int64_t val )
{
  add_key( key );
  wtr_.add_i64( val );
  return *this;
}

log_line& log_line::add( str key, uint64_t val )
{
  add_key( key );
  wtr_.add_u64( val );
  return *this;
}

log_line& log_line::add( str key, uint32_t val )
{
  add_key( key );
  wtr_.add_u64( val );
  return *this;
}

log_line& log_line::add( str key, const hash& pk )
{
  add_key( key );
  std::string res;
  pk.enc_base58( res );
  wtr_.add( res );
  return *this;
}

void log_line::end()
{
  std::string line;
  wtr_.detach( line );
  impl_.add( line );
}
