#include "key_store.hpp"
#include "log.hpp"
#include <sys/types.h>
#include <sys/stat.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <algorithm>

using namespace sp;

static bool write_key_file(
    const std::string& key_file, const key_pair& kp )
{
  std::string txt( 1, '[' );
  for( size_t i = 0; i != key_pair::len; ++i ) {
    if ( i ) {
      txt += ',';
    }
    txt += std::to_string( kp.data()[i] );
  }
  txt += ']';
  int fd = ::open( key_file.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0600 );
  if ( fd<0 ) {
    return false;
  }
  const char *buf = txt.c_str();
  size_t len = txt.size();
  do {
    ssize_t num = ::write( fd, buf, len );
    if ( num < 0 ) {
      ::close( fd );
      return false;
    }
    len -= num;
    buf += num;
  } while( len );
  bool ok = 0 == fchmod( fd, 0400 );
  ::close( fd );
  return ok;
}

key_store::entry::entry( const key_pair& kp )
: kp_( kp ),
  sgn_( kp_ )
{
}

key_store::key_store()
{
}

key_store::~key_store()
{
  clear();
}

void key_store::clear()
{
  for( entry *e : kvec_ ) {
    delete e;
  }
  kvec_.clear();
  kmap_.clear();
}

void key_store::set_dir( const std::string& dirn )
{
  dir_ = dirn;
}

std::string key_store::get_dir() const
{
  return dir_;
}

bool key_store::create()
{
  struct stat fst[1];
  if ( 0 == ::stat( dir_.c_str(), fst ) ) {
    if ( 0 != chmod( dir_.c_str(), 0700 ) ) {
      return set_err_msg( "failed to chmod key_store directory", errno );
    }
  } else {
    if ( 0 != mkdir( dir_.c_str(), 0700 ) ) {
      return set_err_msg( "failed to create key_store directory", errno );
    }
  }
  return true;
}

bool key_store::init()
{
  reset_err();
  clear();
  struct stat fst[1];
  if ( dir_.empty() || 0 != ::stat( dir_.c_str(), fst ) ) {
    return set_err_msg( "cant find key_store directory", errno );
  }
  if ( !S_ISDIR(fst->st_mode) ) {
    return set_err_msg( "key_store path not a directory" );
  }
  if ( fst->st_uid != getuid() || fst->st_uid != geteuid() ) {
    return set_err_msg( "user must own the key_store directory" );
  }
  if ( ! (fst->st_mode & S_IRUSR ) ) {
    return set_err_msg(
        "user must have read access to key_store directory");
  }
  if ( ! (fst->st_mode & S_IWUSR ) ) {
    return set_err_msg(
        "user must have write access to key_store directory");
  }
  if ( fst->st_mode & ( S_IRWXG | S_IRWXO ) ) {
    return set_err_msg( "key store directory must be restricted to user "
       "read/write permissions" );
  }
  if ( dir_.back() != '/' ) {
    dir_ += '/';
  }
  return load_dir();
}

bool key_store::load_dir()
{
  DIR *dp = ::opendir( dir_.c_str() );
  if ( !dp ) {
    return set_err_msg( "failed to open key_store directory", errno );
  }
  std::vector<std::string> files;
  static const char sfx[] = ".json";
  static const size_t sfx_len = sizeof( sfx ) - 1;
  for( struct dirent *de; ( de = ::readdir( dp ) ); ) {
    std::string name( de->d_name );
    if ( name.size() > sfx_len &&
         0 == name.compare( name.size() - sfx_len, sfx_len, sfx ) ) {
      files.push_back( name );
    }
  }
  ::closedir( dp );

  // load in name order so signer order is reproducible
  std::sort( files.begin(), files.end() );
  for( const std::string& name : files ) {
    key_pair kp;
    if ( !kp.init_from_file( dir_ + name ) ) {
      clear();
      return set_err( err_code::e_invalid_key,
          "invalid key file [file=" + dir_ + name + "]" );
    }
    pub_key pk( kp );
    if ( find_entry( pk ) ) {
      continue;
    }
    add_entry( kp );
    SP_LOG_DBG( "loaded key" )
      .add( "file", name )
      .add( "pub_key", pk )
      .end();
  }
  SP_LOG_DBG( "initialized key_store" )
    .add( "dir", dir_ )
    .add( "num_keys", (uint64_t)kvec_.size() )
    .end();
  return true;
}

std::string key_store::get_key_pair_file( const pub_key& pk ) const
{
  return dir_ + pk.to_base58() + ".json";
}

void key_store::add_entry( const key_pair& kp )
{
  pub_key pk( kp );
  key_map_t::iter_t it = kmap_.add( pk );
  kmap_.ref( it ) = (uint32_t)kvec_.size();
  kvec_.push_back( new entry( kp ) );
}

key_store::entry *key_store::find_entry( const pub_key& pk )
{
  key_map_t::iter_t it = kmap_.find( pk );
  return it ? kvec_[kmap_.obj( it )] : nullptr;
}

bool key_store::add_key_pair( const key_pair& kp )
{
  reset_err();
  pub_key pk( kp );
  if ( find_entry( pk ) ) {
    return true;
  }
  std::string file = get_key_pair_file( pk );
  if ( !write_key_file( file, kp ) ) {
    return set_err_msg( "failed to write key file [file=" + file + "]",
                        errno );
  }
  add_entry( kp );
  SP_LOG_DBG( "added key" )
    .add( "pub_key", pk )
    .end();
  return true;
}

bool key_store::create_key_pair( pub_key& res )
{
  reset_err();
  key_pair kp;
  if ( !kp.gen() ) {
    return set_err( err_code::e_crypto, "failed to generate key pair" );
  }
  if ( !add_key_pair( kp ) ) {
    return false;
  }
  kp.get_pub_key( res );
  return true;
}

const key_pair *key_store::get_key_pair( const pub_key& pk )
{
  entry *e = find_entry( pk );
  return e ? &e->kp_ : nullptr;
}

signer *key_store::get_signer( const pub_key& pk )
{
  entry *e = find_entry( pk );
  return e ? &e->sgn_ : nullptr;
}

void key_store::get_signers( std::vector<signer*>& res )
{
  res.clear();
  for( entry *e : kvec_ ) {
    res.push_back( &e->sgn_ );
  }
}
