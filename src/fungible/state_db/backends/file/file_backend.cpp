#include <fungible/state_db/backends/file/file_backend.hpp>
#include <fungible/state_db/error.hpp>

#include <fstream>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/vector.hpp>

#include <fungible/log.hpp>

namespace fungible::state_db::backends::file {

static constexpr std::uint32_t snapshot_magic   = 0x4647'4e42; // "FGNB"
static constexpr std::uint32_t snapshot_version = 1;

file_backend::file_backend():
    map::map_backend()
{}

file_backend::~file_backend() {}

std::error_code file_backend::open( const std::filesystem::path& p )
{
  _path = p;
  _map.clear();
  set_revision( 0 );

  if( !std::filesystem::exists( p ) )
  {
    LOG_INFO( fungible::log::instance(), "Creating new state at {}", p.string() );
    return state_db_errc::ok;
  }

  return load();
}

std::error_code file_backend::close()
{
  if( !_path )
    return state_db_errc::ok;

  auto error = flush();
  _path.reset();
  return error;
}

bool file_backend::is_open() const noexcept
{
  return _path.has_value();
}

void file_backend::start_write_batch()
{
  ++_batch_depth;
}

std::error_code file_backend::end_write_batch()
{
  if( _batch_depth )
    --_batch_depth;

  _dirty = true;

  if( _batch_depth )
    return state_db_errc::ok;

  return flush();
}

std::error_code file_backend::store_metadata()
{
  _dirty = true;
  return state_db_errc::ok;
}

std::error_code file_backend::load()
{
  std::ifstream ifs( *_path, std::ios::binary );
  if( !ifs )
  {
    LOG_ERROR( fungible::log::instance(), "Unable to read state file {}", _path->string() );
    return state_db_errc::io_error;
  }

  try
  {
    boost::archive::binary_iarchive ia( ifs );

    std::uint32_t magic = 0, version = 0;
    std::uint64_t revision = 0;

    ia >> magic;
    ia >> version;

    if( magic != snapshot_magic || version != snapshot_version )
    {
      LOG_ERROR( fungible::log::instance(),
                 "State file {} has unexpected header (magic: {}, version: {})",
                 _path->string(),
                 magic,
                 version );
      return state_db_errc::corrupt_state;
    }

    ia >> revision;
    ia >> _map;
    set_revision( revision );
  }
  catch( const boost::archive::archive_exception& e )
  {
    LOG_ERROR( fungible::log::instance(), "Unable to decode state file {}: {}", _path->string(), e.what() );
    _map.clear();
    return state_db_errc::corrupt_state;
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( fungible::log::instance(), "Unable to load state file {}: {}", _path->string(), e.what() );
    _map.clear();
    return state_db_errc::io_error;
  }

  LOG_INFO( fungible::log::instance(),
            "Loaded {} objects at revision {} from {}",
            _map.size(),
            revision(),
            _path->string() );

  return state_db_errc::ok;
}

std::error_code file_backend::flush()
{
  if( !_path )
    return state_db_errc::not_open;

  if( !_dirty )
    return state_db_errc::ok;

  auto temp_path = *_path;
  temp_path += ".tmp";

  {
    std::ofstream ofs( temp_path, std::ios::binary | std::ios::trunc );
    if( !ofs )
    {
      LOG_ERROR( fungible::log::instance(), "Unable to open {} for writing", temp_path.string() );
      return state_db_errc::io_error;
    }

    try
    {
      boost::archive::binary_oarchive oa( ofs );
      auto rev = revision();

      oa << snapshot_magic;
      oa << snapshot_version;
      oa << rev;
      oa << _map;
    }
    catch( const boost::archive::archive_exception& e )
    {
      LOG_ERROR( fungible::log::instance(), "Unable to encode state: {}", e.what() );
      return state_db_errc::io_error;
    }

    ofs.flush();
    if( !ofs )
      return state_db_errc::io_error;
  }

  std::error_code ec;
  std::filesystem::rename( temp_path, *_path, ec );
  if( ec )
  {
    LOG_ERROR( fungible::log::instance(), "Unable to replace state file {}: {}", _path->string(), ec.message() );
    return state_db_errc::io_error;
  }

  _dirty = false;
  LOG_DEBUG( fungible::log::instance(), "Wrote {} objects at revision {}", _map.size(), revision() );

  return state_db_errc::ok;
}

} // namespace fungible::state_db::backends::file
