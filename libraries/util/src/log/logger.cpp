#include <resledger/util/log/logger.hpp>
#include <resledger/util/log/logger_config.hpp>
#include <resledger/util/exception.hpp>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <boost/algorithm/string/case_conv.hpp>

namespace resledger::util {

   constexpr const char* DEFAULT_PATTERN = "%^%-5l %Y-%m-%dT%T.%e %k %20!s:%-5# %-20!! ] %v%$";

   class thread_name_formatter_flag : public spdlog::custom_flag_formatter {
      public:
         void format(const spdlog::details::log_msg&, const std::tm&, spdlog::memory_buf_t& dest) override {
            const std::string& some_txt = get_thread_name();
            dest.append(some_txt.data(), some_txt.data() + some_txt.size());
         }

         std::unique_ptr<custom_flag_formatter> clone() const override {
            return std::make_unique<thread_name_formatter_flag>();
         }
   };

   static void set_default_formatter( spdlog::logger& agent ) {
      auto formatter = std::make_unique<spdlog::pattern_formatter>(spdlog::pattern_time_type::utc);
      formatter->add_flag<thread_name_formatter_flag>('k').set_pattern(DEFAULT_PATTERN);
      agent.set_formatter(std::move(formatter));
   }

   std::string log_level::to_string()const {
      switch( value ) {
         case all:   return "all";
         case debug: return "debug";
         case info:  return "info";
         case warn:  return "warn";
         case error: return "error";
         case off:   return "off";
      }
      return "off";
   }

   log_level log_level::from_string( const std::string& s ) {
      const std::string l = boost::algorithm::to_lower_copy( s );
      if( l == "all" || l == "trace" ) return log_level::all;
      if( l == "debug" ) return log_level::debug;
      if( l == "info" )  return log_level::info;
      if( l == "warn" )  return log_level::warn;
      if( l == "error" ) return log_level::error;
      if( l == "off" )   return log_level::off;
      RESLEDGER_THROW( assert_exception, "unknown log level '{}'", s );
   }

   logger::impl::impl() {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_st>();
      sink->set_color(spdlog::level::debug, sink->green);
      sink->set_color(spdlog::level::info, sink->reset);
      sink->set_color(spdlog::level::warn, sink->yellow);
      sink->set_color(spdlog::level::err, sink->red);
      _agent_logger = std::make_unique<spdlog::logger>( "", sink );
      set_default_formatter( *_agent_logger );
      _agent_logger->set_level(spdlog::level::info);
   }

   logger::logger()
   :my( std::make_shared<impl>() ){}

   void logger::set_name( const std::string& n ) { my->_name = n; }
   std::string logger::get_name()const { return my->_name; }

   logger& logger::default_logger() {
      static logger the_default_logger;
      return the_default_logger;
   }

   logger logger::get( const std::string& s ) {
      return log_config::get_logger( s );
   }

   void logger::update( const std::string& name, logger& log ) {
      log_config::update_logger( name, log );
   }


   logger& logger::set_log_level(log_level ll) {
      my->_level = ll;
      switch (ll.value) {
      case log_level::all:
         my->_agent_logger->set_level(spdlog::level::trace);
         break;
      case log_level::debug:
         my->_agent_logger->set_level(spdlog::level::debug);
         break;
      case log_level::info:
         my->_agent_logger->set_level(spdlog::level::info);
         break;
      case log_level::warn:
         my->_agent_logger->set_level(spdlog::level::warn);
         break;
      case log_level::error:
         my->_agent_logger->set_level(spdlog::level::err);
         break;
      case log_level::off:
         my->_agent_logger->set_level(spdlog::level::off);
         break;
      }
      return *this;
   }

   std::unique_ptr<spdlog::logger>& logger::get_agent_logger() const { return my->_agent_logger; }

   void logger::update_agent_logger(std::unique_ptr<spdlog::logger>&& al) {
      my->_agent_logger = std::move(al);
      set_default_formatter( *my->_agent_logger );
      set_log_level(my->_level);
   }

   void logger::add_sink(const std::shared_ptr<spdlog::sinks::sink>& s) {
      my->_sinks.push_back(s);
   }

   std::vector<std::shared_ptr<spdlog::sinks::sink>>& logger::get_sinks() const {
      return my->_sinks;
   }

} // namespace resledger::util
