#pragma once

#include <sp/key_pair.hpp>
#include <sp/misc.hpp>

#define SP_LOG_DBG_LVL (1U<<3)
#define SP_LOG_INF_LVL (1U<<2)
#define SP_LOG_WRN_LVL (1U<<1)
#define SP_LOG_ERR_LVL (1U<<0)

#define SP_LOG_TXT(X,LVL) \
if (sp::log::has_level(LVL)) sp::log::add(X,LVL)
#define SP_LOG_DBG(X) SP_LOG_TXT(X,SP_LOG_DBG_LVL)
#define SP_LOG_INF(X) SP_LOG_TXT(X,SP_LOG_INF_LVL)
#define SP_LOG_WRN(X) SP_LOG_TXT(X,SP_LOG_WRN_LVL)
#define SP_LOG_ERR(X) SP_LOG_TXT(X,SP_LOG_ERR_LVL)

namespace sp
{

  // log line text buffer
  class log_wtr
  {
  public:
    void add( char );
    void add( str );
    void add_i64( int64_t );
    void add_u64( uint64_t );
    void detach( std::string& );
  private:
    std::string buf_;
  };

  // log line
  class log_line
  {
  public:
    log_line& add( str key, str val );
    log_line& add( str key, const hash& val );
    log_line& add( str key, int32_t );
    log_line& add( str key, int64_t );
    log_line& add( str key, uint64_t );
    log_line& add( str key, uint32_t );
    void end();
    friend class log;
  private:
    log_line( str, int lvl );
    void add_key( str );
    bool    is_first_;
    log_wtr wtr_;
  };

  // log reporting
  class log
  {
  public:

    static void set_level( int level );
    static bool has_level( int level );
    static log_line add( str topic, int level );
  private:
    static int level_;
  };

  inline bool log::has_level( int level )
  {
    return level&level_;
  }

}
