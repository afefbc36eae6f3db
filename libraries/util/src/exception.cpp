#include <resledger/util/exception.hpp>

namespace resledger::util {

   exception::exception( std::string message )
   :_code(unspecified_exception_code), _name("exception"), _what("unspecified"), _message(std::move(message)) {}

   exception::exception( int64_t code, std::string name_value, std::string what_value, std::string message )
   :_code(code), _name(std::move(name_value)), _what(std::move(what_value)), _message(std::move(message)) {}

   void exception::append_context( std::string c ) {
      _context.push_back( std::move(c) );
   }

   std::string exception::to_string()const {
      if( _message.empty() )
         return fmt::format( "{}: {}", _name, _what );
      return fmt::format( "{}: {}", _name, _message );
   }

   std::string exception::to_detail_string()const {
      std::string result = fmt::format( "{} ({}): {}", _name, _code, _what );
      if( !_message.empty() ) {
         result += "\n    ";
         result += _message;
      }
      for( const auto& c : _context ) {
         result += "\n    ";
         result += c;
      }
      return result;
   }

   std::string format_context( const char* file, uint64_t line, const char* method, const std::string& msg ) {
      std::string_view f( file );
      if( auto pos = f.find_last_of( '/' ); pos != std::string_view::npos )
         f.remove_prefix( pos + 1 );
      return fmt::format( "{}:{} {}: {}", f, line, method, msg );
   }

} // namespace resledger::util
