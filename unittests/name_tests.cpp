#include <resledger/ledger/name.hpp>
#include <resledger/ledger/exceptions.hpp>

#include <boost/test/unit_test.hpp>

#include <fmt/format.h>

using namespace resledger;
using namespace resledger::ledger;

BOOST_AUTO_TEST_SUITE(name_tests)

BOOST_AUTO_TEST_CASE( name_round_trip ) try {
   BOOST_REQUIRE_EQUAL( "alice", name( "alice" ).to_string() );
   BOOST_REQUIRE_EQUAL( "resledger", "resledger"_n.to_string() );
   BOOST_REQUIRE_EQUAL( "a.b.c", name( "a.b.c" ).to_string() );
   BOOST_REQUIRE_EQUAL( "", name().to_string() );
   BOOST_REQUIRE( name().empty() );
   BOOST_REQUIRE( "bob"_n.good() );
   BOOST_REQUIRE( name( "carol" ) == "carol"_n );
   BOOST_REQUIRE( "alice"_n < "bob"_n );
   BOOST_REQUIRE_EQUAL( "dave", fmt::format( "{}", "dave"_n ) );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_AUTO_TEST_CASE( invalid_names ) try {
   BOOST_REQUIRE_THROW( name( "abcdefghijklmn" ), name_type_exception );   // 14 characters
   BOOST_REQUIRE_THROW( name( "Alice" ), name_type_exception );            // upper case is not encodable
   BOOST_REQUIRE_THROW( name( "bob6" ), name_type_exception );             // digits are 1-5 only
   BOOST_REQUIRE_THROW( name( "alice." ), name_type_exception );           // trailing dots are dropped
   BOOST_REQUIRE_NO_THROW( name( "abcdefghijkl1" ) );
} RESLEDGER_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
