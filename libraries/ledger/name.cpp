#include <resledger/ledger/name.hpp>
#include <resledger/ledger/exceptions.hpp>

namespace resledger::ledger {

   void name::set( std::string_view str ) {
      const auto len = str.size();
      RESLEDGER_ASSERT( len <= 13, name_type_exception, "Name is longer than 13 characters ({}) ", str );
      value = string_to_uint64_t( str );
      RESLEDGER_ASSERT( to_string() == str, name_type_exception,
                        "Name not properly normalized (name: {}, normalized: {}) ",
                        str, to_string() );
   }

   std::string name::to_string()const {
      static const char* charmap = ".12345abcdefghijklmnopqrstuvwxyz";

      std::string str(13,'.');

      uint64_t tmp = value;
      for( uint32_t i = 0; i <= 12; ++i ) {
         char c = charmap[tmp & (i == 0 ? 0x0f : 0x1f)];
         str[12-i] = c;
         tmp >>= (i == 0 ? 4 : 5);
      }

      const auto last = str.find_last_not_of( '.' );
      str.resize( last == std::string::npos ? 0 : last + 1 );
      return str;
   }

} // resledger::ledger
