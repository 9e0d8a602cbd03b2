#pragma once

#include <filesystem>
#include <optional>

#include <fungible/state_db/backends/map/map_backend.hpp>

namespace fungible::state_db::backends::file {

/**
 * An in-memory map backend that mirrors its contents to a snapshot file.
 *
 * The snapshot is read once on open and rewritten when the outermost write
 * batch ends. Writes go to a temporary file that is renamed over the
 * snapshot, so a crash leaves either the old or the new state on disk.
 */
class file_backend final: public map::map_backend
{
public:
  file_backend();
  file_backend( const file_backend& )            = delete;
  file_backend( file_backend&& )                 = delete;
  file_backend& operator=( const file_backend& ) = delete;
  file_backend& operator=( file_backend&& )      = delete;
  ~file_backend() final;

  std::error_code open( const std::filesystem::path& p );
  std::error_code close();
  bool is_open() const noexcept;

  void start_write_batch() final;
  std::error_code end_write_batch() final;

  std::error_code store_metadata() final;

  std::error_code flush();

private:
  std::error_code load();

  std::optional< std::filesystem::path > _path;
  std::uint32_t _batch_depth = 0;
  bool _dirty                = false;
};

} // namespace fungible::state_db::backends::file
