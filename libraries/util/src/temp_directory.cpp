#include <resledger/util/temp_directory.hpp>
#include <resledger/util/exception.hpp>

#include <fmt/format.h>

#include <random>

namespace resledger::util {

   temp_directory::temp_directory( const std::filesystem::path& parent ) {
      std::random_device rd;
      std::uniform_int_distribution<uint32_t> dist;
      for( int attempt = 0; attempt < 16; ++attempt ) {
         auto candidate = parent / fmt::format( "resledger-{:08x}-{:08x}", dist( rd ), dist( rd ) );
         if( std::filesystem::create_directories( candidate ) ) {
            _path = std::move( candidate );
            return;
         }
      }
      RESLEDGER_THROW( assert_exception, "unable to create a temporary directory under {}", parent.string() );
   }

   temp_directory::~temp_directory() {
      std::error_code ec;
      std::filesystem::remove_all( _path, ec );
      if( ec )
         wlog( "unable to remove temporary directory {}: {}", _path.string(), ec.message() );
   }

} // namespace resledger::util
