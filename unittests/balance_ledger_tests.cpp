#include <resledger/testing/tester.hpp>
#include <resledger/ledger/balance_ledger.hpp>
#include <resledger/ledger/resource_registry.hpp>

#include <boost/test/unit_test.hpp>

using namespace resledger;
using namespace resledger::ledger;
using namespace resledger::testing;

namespace {

class balance_tester : public tester {
public:
   balance_tester() {
      BOOST_REQUIRE_EQUAL( success(), initialize() );
      BOOST_REQUIRE_EQUAL( success(), register_resource( 1, "cpu", 100, 10, 1, 50 ) );
      BOOST_REQUIRE_EQUAL( success(), register_resource( 2, "ram", 500, 2, 10, 200 ) );
      produce_block();
   }

   void allocate( account_name owner, resource_type_id type, share_type amount ) {
      const auto id = submit_request( owner, type, amount );
      BOOST_REQUIRE_EQUAL( success(), approve( id ) );
   }

   /// available plus every balance of the type adds up to the supply
   void require_conserved( resource_type_id type, std::initializer_list<account_name> holders ) {
      share_type held = 0;
      for( const auto& h : holders )
         held += get_balance( h, type );
      BOOST_REQUIRE_EQUAL( held, control->get_balance_ledger().get_outstanding( type ) );
      const auto& res = control->get_resource( type );
      BOOST_REQUIRE_EQUAL( res.total_supply, res.available_quantity + held );
   }
};

} // namespace

BOOST_AUTO_TEST_SUITE(balance_ledger_tests)

BOOST_FIXTURE_TEST_CASE( balances_are_per_resource_type, balance_tester ) try {
   allocate( "alice"_n, 1, 30 );
   allocate( "alice"_n, 2, 100 );

   BOOST_REQUIRE_EQUAL( 30u, get_balance( "alice"_n, 1 ) );
   BOOST_REQUIRE_EQUAL( 100u, get_balance( "alice"_n, 2 ) );
   BOOST_REQUIRE_EQUAL( 130u, control->get_total_balance( "alice"_n ) );
   BOOST_REQUIRE_EQUAL( 0u, control->get_total_balance( "bob"_n ) );

   // units of one type cannot pay for another
   BOOST_REQUIRE_EQUAL( error( "alice holds 30 units of resource type 1, 40 needed" ),
                        transfer_units( "alice"_n, "bob"_n, 1, 40 ) );
   BOOST_REQUIRE_EQUAL( error( "alice holds 30 units of resource type 1, 31 needed" ), return_units( "alice"_n, 1, 31 ) );

   require_conserved( 1, { "alice"_n } );
   require_conserved( 2, { "alice"_n } );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( transfer_moves_units, balance_tester ) try {
   allocate( "alice"_n, 1, 30 );

   BOOST_REQUIRE_EQUAL( success(), transfer_units( "alice"_n, "bob"_n, 1, 10 ) );
   BOOST_REQUIRE_EQUAL( 20u, get_balance( "alice"_n, 1 ) );
   BOOST_REQUIRE_EQUAL( 10u, get_balance( "bob"_n, 1 ) );
   BOOST_REQUIRE_EQUAL( 70u, get_available( 1 ) );

   BOOST_REQUIRE_EQUAL( success(), transfer_units( "bob"_n, "carol"_n, 1, 10 ) );
   BOOST_REQUIRE_EQUAL( 0u, get_balance( "bob"_n, 1 ) );
   BOOST_REQUIRE_EQUAL( 10u, get_balance( "carol"_n, 1 ) );

   require_conserved( 1, { "alice"_n, "bob"_n, "carol"_n } );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( transfer_guards, balance_tester ) try {
   allocate( "alice"_n, 1, 30 );

   BOOST_REQUIRE_EXCEPTION( push_action( "bob"_n, ledger::transfer{ "alice"_n, "bob"_n, 1, 10 } ),
                            missing_auth_exception,
                            resledger_exception_message_is( "missing authority of alice" ) );

   BOOST_REQUIRE_EQUAL( error( "cannot transfer to self" ), transfer_units( "alice"_n, "alice"_n, 1, 10 ) );
   BOOST_REQUIRE_EQUAL( error( "resource type 3 does not exist" ), transfer_units( "alice"_n, "bob"_n, 3, 10 ) );
   BOOST_REQUIRE_EQUAL( error( "transfer amount must be positive" ), transfer_units( "alice"_n, "bob"_n, 1, 0 ) );
   BOOST_REQUIRE_EQUAL( success(), set_params( 5 ) );
   BOOST_REQUIRE_EQUAL( error( "transfer amount 6 exceeds the amount cap 5" ), transfer_units( "alice"_n, "bob"_n, 1, 6 ) );
   BOOST_REQUIRE_EQUAL( success(), set_params( 1000 ) );

   BOOST_REQUIRE_EQUAL( success(), lock_resource( 1 ) );
   BOOST_REQUIRE_EXCEPTION( push_action( "alice"_n, ledger::transfer{ "alice"_n, "bob"_n, 1, 10 } ),
                            resource_locked_exception,
                            resledger_exception_message_is( "resource type 1 is locked" ) );
   BOOST_REQUIRE_EQUAL( success(), unlock_resource( 1 ) );

   BOOST_REQUIRE_EQUAL( success(), push( admin, setpaused{ true } ) );
   BOOST_REQUIRE_EQUAL( error( "ledger is paused" ), transfer_units( "alice"_n, "bob"_n, 1, 10 ) );
   BOOST_REQUIRE_EQUAL( success(), push( admin, setpaused{ false } ) );

   BOOST_REQUIRE_EQUAL( 30u, get_balance( "alice"_n, 1 ) );
   BOOST_REQUIRE_EQUAL( 0u, get_balance( "bob"_n, 1 ) );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( transfer_eligibility, balance_tester ) try {
   allocate( "alice"_n, 1, 30 );

   BOOST_REQUIRE_EQUAL( success(), set_blacklist( "bob"_n, true ) );
   BOOST_REQUIRE_EXCEPTION( push_action( "alice"_n, ledger::transfer{ "alice"_n, "bob"_n, 1, 10 } ),
                            invalid_transfer_destination_exception,
                            resledger_exception_message_is( "bob is not eligible to receive resources" ) );

   BOOST_REQUIRE_EQUAL( success(), set_blacklist( "alice"_n, true ) );
   BOOST_REQUIRE_EXCEPTION( push_action( "alice"_n, ledger::transfer{ "alice"_n, "carol"_n, 1, 10 } ),
                            unauthorized_access_exception,
                            resledger_exception_message_is( "alice is not eligible to transfer" ) );

   // a blacklisted holder may still give units back to the pool
   BOOST_REQUIRE_EQUAL( success(), return_units( "alice"_n, 1, 30 ) );
   BOOST_REQUIRE_EQUAL( 100u, get_available( 1 ) );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( return_allocation, balance_tester ) try {
   allocate( "alice"_n, 1, 30 );

   BOOST_REQUIRE_EQUAL( success(), return_units( "alice"_n, 1, 10 ) );
   BOOST_REQUIRE_EQUAL( 20u, get_balance( "alice"_n, 1 ) );
   BOOST_REQUIRE_EQUAL( 80u, get_available( 1 ) );
   require_conserved( 1, { "alice"_n } );

   BOOST_REQUIRE_EQUAL( error( "return amount must be positive" ), return_units( "alice"_n, 1, 0 ) );
   BOOST_REQUIRE_EQUAL( error( "resource type 4 does not exist" ), return_units( "alice"_n, 4, 10 ) );
   BOOST_REQUIRE_EQUAL( error( "bob holds 0 units of resource type 1, 1 needed" ), return_units( "bob"_n, 1, 1 ) );
   BOOST_REQUIRE_EXCEPTION( push_action( "bob"_n, returnalloc{ "alice"_n, 1, 5 } ),
                            missing_auth_exception,
                            resledger_exception_message_is( "missing authority of alice" ) );

   // returns work while paused
   BOOST_REQUIRE_EQUAL( success(), push( admin, setpaused{ true } ) );
   BOOST_REQUIRE_EQUAL( success(), return_units( "alice"_n, 1, 20 ) );
   BOOST_REQUIRE_EQUAL( 0u, get_balance( "alice"_n, 1 ) );
   BOOST_REQUIRE_EQUAL( 100u, get_available( 1 ) );
   require_conserved( 1, { "alice"_n } );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( available_never_exceeds_supply, balance_tester ) try {
   allocate( "alice"_n, 1, 50 );
   allocate( "bob"_n, 1, 50 );
   BOOST_REQUIRE_EQUAL( 0u, get_available( 1 ) );

   BOOST_REQUIRE_EQUAL( success(), transfer_units( "bob"_n, "alice"_n, 1, 50 ) );
   BOOST_REQUIRE_EQUAL( success(), return_units( "alice"_n, 1, 100 ) );
   BOOST_REQUIRE_EQUAL( 100u, get_available( 1 ) );
   BOOST_REQUIRE_EQUAL( error( "alice holds 0 units of resource type 1, 1 needed" ), return_units( "alice"_n, 1, 1 ) );

   // the pool cannot be credited past its supply
   BOOST_REQUIRE_THROW( control->get_mutable_resource_registry().credit_available( 1, 1 ), invalid_resource_amount_exception );
   BOOST_REQUIRE_EQUAL( 100u, get_available( 1 ) );
   require_conserved( 1, { "alice"_n, "bob"_n } );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
