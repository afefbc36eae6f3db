#include <resledger/testing/tester.hpp>
#include <resledger/util/temp_directory.hpp>

#include <boost/test/unit_test.hpp>

#include <fstream>
#include <memory>
#include <variant>

using namespace resledger;
using namespace resledger::ledger;
using namespace resledger::testing;

namespace {

controller::config state_config( const std::filesystem::path& dir ) {
   auto cfg = tester::default_config();
   cfg.state_dir   = dir;
   cfg.db_map_mode = pinnable_mapped_file::map_mode::mapped;
   return cfg;
}

action_result push_as( controller& c, account_name signer, const action_payload& data ) {
   try {
      std::visit( [&]( const auto& v ) { c.push_action( action( vector<account_name>{ signer }, v ) ); }, data );
   } catch( const util::exception& e ) {
      return tester::error( e.top_message() );
   }
   return tester::success();
}

} // namespace

BOOST_AUTO_TEST_SUITE(state_tests)

BOOST_AUTO_TEST_CASE( state_survives_reopen ) try {
   util::temp_directory tempdir;
   const auto dir = tempdir.path() / "state";
   const auto admin = tester::admin;

   {
      controller c( state_config( dir ) );
      BOOST_REQUIRE_EQUAL( tester::success(), push_as( c, admin, init{ 500, account_name() } ) );
      BOOST_REQUIRE_EQUAL( tester::success(),
                           push_as( c, admin, regresource{ 1, "cpu", 100, 10, 1, 50, 1 } ) );
      BOOST_REQUIRE_EQUAL( tester::success(), push_as( c, "alice"_n, submitreq{ "alice"_n, 1, 30, "" } ) );
      BOOST_REQUIRE_EQUAL( tester::success(), push_as( c, admin, approvereq{ 1 } ) );
      BOOST_REQUIRE_EQUAL( tester::success(), push_as( c, admin, updateprice{ 1, 12 } ) );
   }

   controller c( state_config( dir ) );
   BOOST_REQUIRE( c.get_global_properties().initialized );
   BOOST_REQUIRE_EQUAL( 500u, c.get_global_properties().max_amount );
   BOOST_REQUIRE_EQUAL( 1u, c.get_global_properties().total_requests );
   BOOST_REQUIRE_EQUAL( "cpu", to_string( c.get_resource( 1 ).name ) );
   BOOST_REQUIRE_EQUAL( 70u, c.get_resource( 1 ).available_quantity );
   BOOST_REQUIRE_EQUAL( 30u, c.get_balance( "alice"_n, 1 ) );
   BOOST_REQUIRE_EQUAL( 1u, c.get_price_history( 1 ).size() );

   BOOST_REQUIRE_EQUAL( tester::error( "ledger was already initialized" ),
                        push_as( c, admin, init{ 500, account_name() } ) );
   BOOST_REQUIRE_EQUAL( tester::success(), push_as( c, "alice"_n, submitreq{ "alice"_n, 1, 5, "" } ) );
   BOOST_REQUIRE_EQUAL( 2u, c.get_global_properties().total_requests );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE( unusable_state_directory ) try {
   util::temp_directory tempdir;
   const auto blocker = tempdir.path() / "not_a_directory";
   {
      std::ofstream out( blocker );
      out << "x";
   }
   BOOST_REQUIRE_EXCEPTION( std::make_unique<controller>( state_config( blocker / "state" ) ), database_exception,
                            resledger_exception_message_starts_with( "unable to open ledger state in" ) );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
