#pragma once
/**
 * @file exception.hpp
 * @brief Base exception type and the assert/rethrow helpers built on it.
 */
#include <fmt/format.h>

#include <boost/preprocessor/stringize.hpp>

#include <cstdint>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace resledger::util {

   enum exception_code {
      unspecified_exception_code = 0,
      std_exception_code         = 1,
      assert_exception_code      = 2
   };

   /**
    *  @brief root of every exception thrown by resledger
    *
    *  Carries a numeric code, the type name, a short description of the exception kind and the
    *  formatted message of the throw site. Each catch-and-rethrow may append a context line
    *  (file, line, method and a message) which is reported by to_detail_string().
    */
   class exception : public std::exception {
      public:
         explicit exception( std::string message = {} );
         exception( int64_t code, std::string name_value, std::string what_value, std::string message = {} );
         ~exception() override = default;

         const char*        name()const  { return _name.c_str(); }
         int64_t            code()const  { return _code; }
         const char*        what()const noexcept override { return _what.c_str(); }
         const std::string& top_message()const { return _message; }

         const std::vector<std::string>& get_context()const { return _context; }
         void append_context( std::string c );

         /// name and message of the throw site
         std::string to_string()const;
         /// to_string() followed by every appended context line
         std::string to_detail_string()const;

      private:
         int64_t                  _code = unspecified_exception_code;
         std::string              _name;
         std::string              _what;
         std::string              _message;
         std::vector<std::string> _context;
   };

   std::string format_context( const char* file, uint64_t line, const char* method, const std::string& msg );

} // namespace resledger::util

#define RESLEDGER_DECLARE_DERIVED_EXCEPTION( TYPE, BASE, CODE, WHAT ) \
   class TYPE : public BASE { \
      public: \
         enum code_enum { code_value = CODE }; \
         explicit TYPE( std::string message = {} ) \
         :BASE( CODE, BOOST_PP_STRINGIZE(TYPE), WHAT, std::move(message) ){} \
         TYPE( int64_t code, std::string name_value, std::string what_value, std::string message ) \
         :BASE( code, std::move(name_value), std::move(what_value), std::move(message) ){} \
   };

#define RESLEDGER_DECLARE_EXCEPTION( TYPE, CODE, WHAT ) \
   RESLEDGER_DECLARE_DERIVED_EXCEPTION( TYPE, resledger::util::exception, CODE, WHAT )

namespace resledger::util {
   RESLEDGER_DECLARE_EXCEPTION( std_exception_wrapper, std_exception_code, "std exception" )
   RESLEDGER_DECLARE_EXCEPTION( assert_exception, assert_exception_code, "Assert Exception" )
}

#define RESLEDGER_THROW( exc_type, FORMAT, ... ) \
   throw exc_type( fmt::format( FORMAT __VA_OPT__(,) __VA_ARGS__ ) )

/**
 *  @brief throws exc_type with the formatted message when expr is false
 *
 *  @code
 *     RESLEDGER_ASSERT( amount > 0, invalid_resource_amount_exception, "amount must be positive, got {}", amount );
 *  @endcode
 */
#define RESLEDGER_ASSERT( expr, exc_type, FORMAT, ... ) \
   do { \
      if( !(expr) ) RESLEDGER_THROW( exc_type, FORMAT __VA_OPT__(,) __VA_ARGS__ ); \
   } while( 0 )

#define RESLEDGER_CHECK( expr, FORMAT, ... ) \
   RESLEDGER_ASSERT( expr, resledger::util::assert_exception, FORMAT __VA_OPT__(,) __VA_ARGS__ )

/**
 *  Appends the formatted context to a resledger exception in flight and rethrows it. A
 *  std::exception is wrapped into std_exception_wrapper first so callers only ever see
 *  resledger exceptions.
 */
#define RESLEDGER_CAPTURE_AND_RETHROW( FORMAT, ... ) \
   catch( resledger::util::exception& er ) { \
      er.append_context( resledger::util::format_context( __FILE__, __LINE__, __func__, \
                                                          fmt::format( FORMAT __VA_OPT__(,) __VA_ARGS__ ) ) ); \
      throw; \
   } catch( const std::exception& e ) { \
      resledger::util::std_exception_wrapper sew( e.what() ); \
      sew.append_context( resledger::util::format_context( __FILE__, __LINE__, __func__, \
                                                           fmt::format( FORMAT __VA_OPT__(,) __VA_ARGS__ ) ) ); \
      throw sew; \
   }

#define RESLEDGER_LOG_AND_RETHROW() \
   catch( const resledger::util::exception& er ) { \
      wlog( "{}", er.to_detail_string() ); \
      throw; \
   } catch( const std::exception& e ) { \
      wlog( "std::exception: {}", e.what() ); \
      throw; \
   }

#include <resledger/util/log/logger.hpp>
