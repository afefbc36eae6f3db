#include <resledger/ledger/ledger_log.hpp>
#include <resledger/util/log/logger_config.hpp>

#include <boost/test/unit_test.hpp>

#include <cstring>

bool init_unit_test() {
   bool is_verbose = false;
   const auto& master = boost::unit_test::framework::master_test_suite();
   for( int i = 0; i < master.argc; ++i ) {
      if( std::strcmp( master.argv[i], "--verbose" ) == 0 ) {
         is_verbose = true;
         break;
      }
   }

   auto cfg = resledger::util::logging_config::default_config();
   cfg.loggers.front().level = is_verbose ? resledger::util::log_level::debug : resledger::util::log_level::off;

   resledger::util::logger_config ledger( resledger::ledger::ledger_logger_name );
   ledger.sinks.push_back( "stderr" );
   cfg.loggers.push_back( std::move(ledger) );

   return resledger::util::configure_logging( cfg );
}

int main( int argc, char* argv[] ) {
   return boost::unit_test::unit_test_main( &init_unit_test, argc, argv );
}
