#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace spdlog::sinks {
class sink;
}

namespace resledger::util
{
   constexpr const char* DEFAULT_LOGGER = "default";

   /**
    * Named scope for the log_level enumeration.
    *
    * Each level includes all higher levels such that debug includes error, but error does not
    * include debug.
    */
   class log_level
   {
      public:
         enum values
         {
             all,
             debug,
             info,
             warn,
             error,
             off
         };
         log_level( values v = off ):value(v){}
         explicit log_level( int v ):value( static_cast<values>(v)){}
         operator int()const { return value; }
         std::string to_string()const;
         static log_level from_string( const std::string& s );
         values value;
   };

   /**
    @code
      void resource_registry::update_price( ... ) {
         rl_dlog( ledger_log, "price of {} set to {}", id, price );
      }
    @endcode
    */
   class logger
   {
      public:
         static logger& default_logger();
         static logger  get( const std::string& name );
         static void update( const std::string& name, logger& log );

         logger();
         logger( const logger& c ) = default;
         logger( logger&& c ) noexcept = default;
         ~logger() = default;
         logger& operator=(const logger&) = default;
         logger& operator=(logger&&) noexcept = default;

         logger&    set_log_level( log_level e );
         log_level  get_log_level()const { return my->_level; }

         std::unique_ptr<spdlog::logger>& get_agent_logger()const;
         void update_agent_logger(std::unique_ptr<spdlog::logger>&& al);

         void  set_name( const std::string& n );
         std::string get_name()const;

         void set_enabled( bool e ) { my->_enabled = e; }
         bool is_enabled( log_level e )const { return my && my->_enabled && e >= my->_level; }
         bool is_enabled()const { return my && my->_enabled; }

      private:
         friend struct log_config;
         void add_sink(const std::shared_ptr<spdlog::sinks::sink>& s);
         std::vector<std::shared_ptr<spdlog::sinks::sink>>& get_sinks() const;

         class impl {
         public:
            impl();

            std::string                     _name;
            bool                            _enabled = true;
            log_level                       _level = log_level::info;
            std::unique_ptr<spdlog::logger> _agent_logger;
            std::vector<std::shared_ptr<spdlog::sinks::sink>> _sinks;
         };

         std::shared_ptr<impl> my;
   };

} // namespace resledger::util

#define RESLEDGER_MULTILINE_MACRO_BEGIN do {
#define RESLEDGER_MULTILINE_MACRO_END   } while (0)

#define RESLEDGER_FMT( FORMAT, ... ) \
   fmt::format( FORMAT __VA_OPT__(,) __VA_ARGS__ )

#define rl_tlog( LOGGER, FORMAT, ... ) \
  RESLEDGER_MULTILINE_MACRO_BEGIN \
   if( (LOGGER).is_enabled( resledger::util::log_level::all ) ) \
      SPDLOG_LOGGER_TRACE((LOGGER).get_agent_logger(), RESLEDGER_FMT( FORMAT __VA_OPT__(,) __VA_ARGS__ )); \
  RESLEDGER_MULTILINE_MACRO_END

#define rl_dlog( LOGGER, FORMAT, ... ) \
  RESLEDGER_MULTILINE_MACRO_BEGIN \
   if( (LOGGER).is_enabled( resledger::util::log_level::debug ) ) \
      SPDLOG_LOGGER_DEBUG((LOGGER).get_agent_logger(), RESLEDGER_FMT( FORMAT __VA_OPT__(,) __VA_ARGS__ )); \
  RESLEDGER_MULTILINE_MACRO_END

#define rl_ilog( LOGGER, FORMAT, ... ) \
  RESLEDGER_MULTILINE_MACRO_BEGIN \
   if( (LOGGER).is_enabled( resledger::util::log_level::info ) ) \
      SPDLOG_LOGGER_INFO((LOGGER).get_agent_logger(), RESLEDGER_FMT( FORMAT __VA_OPT__(,) __VA_ARGS__ )); \
  RESLEDGER_MULTILINE_MACRO_END

#define rl_wlog( LOGGER, FORMAT, ... ) \
  RESLEDGER_MULTILINE_MACRO_BEGIN \
   if( (LOGGER).is_enabled( resledger::util::log_level::warn ) ) \
      SPDLOG_LOGGER_WARN((LOGGER).get_agent_logger(), RESLEDGER_FMT( FORMAT __VA_OPT__(,) __VA_ARGS__ )); \
  RESLEDGER_MULTILINE_MACRO_END

#define rl_elog( LOGGER, FORMAT, ... ) \
  RESLEDGER_MULTILINE_MACRO_BEGIN \
   if( (LOGGER).is_enabled( resledger::util::log_level::error ) ) \
      SPDLOG_LOGGER_ERROR((LOGGER).get_agent_logger(), RESLEDGER_FMT( FORMAT __VA_OPT__(,) __VA_ARGS__ )); \
  RESLEDGER_MULTILINE_MACRO_END

#define tlog( FORMAT, ... ) \
   rl_tlog( resledger::util::logger::default_logger(), FORMAT __VA_OPT__(,) __VA_ARGS__ )

#define dlog( FORMAT, ... ) \
   rl_dlog( resledger::util::logger::default_logger(), FORMAT __VA_OPT__(,) __VA_ARGS__ )

#define ilog( FORMAT, ... ) \
   rl_ilog( resledger::util::logger::default_logger(), FORMAT __VA_OPT__(,) __VA_ARGS__ )

#define wlog( FORMAT, ... ) \
   rl_wlog( resledger::util::logger::default_logger(), FORMAT __VA_OPT__(,) __VA_ARGS__ )

#define elog( FORMAT, ... ) \
   rl_elog( resledger::util::logger::default_logger(), FORMAT __VA_OPT__(,) __VA_ARGS__ )

// this disables all normal logging statements -- useful when benchmarking something and
// logging is suspected of causing a slowdown.
#ifdef RESLEDGER_DISABLE_LOGGING
# undef elog
# define elog(...) RESLEDGER_MULTILINE_MACRO_BEGIN RESLEDGER_MULTILINE_MACRO_END
# undef wlog
# define wlog(...) RESLEDGER_MULTILINE_MACRO_BEGIN RESLEDGER_MULTILINE_MACRO_END
# undef ilog
# define ilog(...) RESLEDGER_MULTILINE_MACRO_BEGIN RESLEDGER_MULTILINE_MACRO_END
# undef dlog
# define dlog(...) RESLEDGER_MULTILINE_MACRO_BEGIN RESLEDGER_MULTILINE_MACRO_END
#endif
