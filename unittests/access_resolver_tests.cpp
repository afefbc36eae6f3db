#include <resledger/testing/tester.hpp>
#include <resledger/ledger/access_resolver.hpp>

#include <boost/test/unit_test.hpp>

using namespace resledger;
using namespace resledger::ledger;
using namespace resledger::testing;

BOOST_AUTO_TEST_SUITE(access_resolver_tests)

BOOST_FIXTURE_TEST_CASE( tiers_follow_roles, tester ) try {
   // no role row means a non-blacklisted user
   BOOST_REQUIRE_EQUAL( 1, control->get_tier( "alice"_n ) );
   BOOST_REQUIRE( control->is_eligible( "alice"_n ) );

   const std::pair<role_type, int> roles[] = {
      { role_type::verified, 2 },
      { role_type::business, 3 },
      { role_type::premium,  4 },
      { role_type::admin,    5 },
      { role_type::user,     1 },
   };
   for( const auto& [role, tier] : roles ) {
      BOOST_REQUIRE_EQUAL( success(), set_role( "alice"_n, role ) );
      BOOST_REQUIRE_EQUAL( tier, control->get_tier( "alice"_n ) );
      BOOST_REQUIRE_EQUAL( to_string( role ), to_string( control->get_access_resolver().get_role( "alice"_n ) ) );
   }

   BOOST_REQUIRE_EQUAL( 1, control->get_tier( "bob"_n ) );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( blacklist_is_independent_of_role, tester ) try {
   BOOST_REQUIRE_EQUAL( success(), set_role( "alice"_n, role_type::premium ) );
   BOOST_REQUIRE_EQUAL( success(), set_blacklist( "alice"_n, true ) );
   BOOST_REQUIRE( !control->is_eligible( "alice"_n ) );
   BOOST_REQUIRE_EQUAL( 4, control->get_tier( "alice"_n ) );

   BOOST_REQUIRE_EQUAL( success(), set_blacklist( "alice"_n, false ) );
   BOOST_REQUIRE( control->is_eligible( "alice"_n ) );
   BOOST_REQUIRE_EQUAL( 4, control->get_tier( "alice"_n ) );

   // blacklisting an actor without a role row keeps the default role
   BOOST_REQUIRE_EQUAL( success(), set_blacklist( "bob"_n, true ) );
   BOOST_REQUIRE( !control->is_eligible( "bob"_n ) );
   BOOST_REQUIRE_EQUAL( 1, control->get_tier( "bob"_n ) );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( role_changes_are_admin_only, tester ) try {
   BOOST_REQUIRE_EQUAL( error( "alice is not the ledger administrator" ),
                        push( "alice"_n, setrole{ "alice"_n, role_type::admin } ) );
   BOOST_REQUIRE_EQUAL( 1, control->get_tier( "alice"_n ) );

   BOOST_REQUIRE_EXCEPTION( push_action( "alice"_n, setblacklist{ "bob"_n, true } ),
                            unauthorized_access_exception,
                            resledger_exception_message_is( "alice is not the ledger administrator" ) );
   BOOST_REQUIRE( control->is_eligible( "bob"_n ) );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( admin_cannot_be_blacklisted, tester ) try {
   BOOST_REQUIRE_EQUAL( error( "the ledger administrator cannot be blacklisted" ), set_blacklist( admin, true ) );
   BOOST_REQUIRE( control->is_eligible( admin ) );
   BOOST_REQUIRE_EQUAL( success(), set_blacklist( admin, false ) );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
