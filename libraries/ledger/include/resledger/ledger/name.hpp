#pragma once
#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace resledger::ledger {

   static constexpr uint64_t char_to_symbol( char c ) {
      if( c >= 'a' && c <= 'z' )
         return (c - 'a') + 6;
      if( c >= '1' && c <= '5' )
         return (c - '1') + 1;
      return 0;
   }

   // Each char of the string is encoded into a 5-bit chunk and left-shifted
   // to its 5-bit slot starting with the highest slot for the first char.
   // The 13th char, if str is long enough, is encoded into a 4-bit chunk
   // and placed in the lowest 4 bits. 64 = 12 * 5 + 4
   static constexpr uint64_t string_to_uint64_t( std::string_view str ) {
      uint64_t n = 0;
      std::size_t i = 0;
      for( ; i < str.size() && i < 12; ++i ) {
         n |= (char_to_symbol(str[i]) & 0x1f) << (64 - 5 * (i + 1));
      }

      // The for-loop encoded up to 60 high bits into uint64 'name' variable,
      // if (strlen(str) > 12) then encode str[12] into the low (remaining)
      // 4 bits of 'name'
      if( i < str.size() && i == 12 )
         n |= char_to_symbol(str[12]) & 0x0F;
      return n;
   }

   /// Immutable except for resledger::ledger::name::set
   struct name {
      private:
         uint64_t value = 0;

         void set( std::string_view str );

      public:
         constexpr bool empty()const { return 0 == value; }
         constexpr bool good()const  { return !empty(); }

         explicit name( std::string_view str ) { set( str ); }
         constexpr explicit name( uint64_t v ) : value(v) {}
         constexpr name() = default;

         std::string to_string()const;
         constexpr uint64_t to_uint64_t()const { return value; }

         friend constexpr bool operator==( const name& a, const name& b ) = default;
         friend constexpr auto operator<=>( const name& a, const name& b ) = default;
   };

} // resledger::ledger

constexpr resledger::ledger::name operator""_n( const char* s, std::size_t n ) {
   return resledger::ledger::name( resledger::ledger::string_to_uint64_t( std::string_view( s, n ) ) );
}

template<>
struct fmt::formatter<resledger::ledger::name> : fmt::formatter<std::string_view> {
   template<typename FormatContext>
   auto format( const resledger::ledger::name& n, FormatContext& ctx ) const -> decltype(ctx.out()) {
      return fmt::formatter<std::string_view>::format( n.to_string(), ctx );
   }
};

