#pragma once
#include <resledger/ledger/name.hpp>

#include <chainbase/chainbase.hpp>

#include <boost/preprocessor/facilities/overload.hpp>
#include <boost/preprocessor/seq/for_each.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#define OBJECT_CTOR1(NAME) \
    NAME() = delete; \
    public: \
    template<typename Constructor> \
    NAME(Constructor&& c, chainbase::constructor_tag) \
    { c(*this); }
#define OBJECT_CTOR2_MACRO(x, y, field) ,field()
#define OBJECT_CTOR2(NAME, FIELDS) \
    NAME() = delete; \
    public: \
    template<typename Constructor> \
    NAME(Constructor&& c, chainbase::constructor_tag) \
    : id(0) BOOST_PP_SEQ_FOR_EACH(OBJECT_CTOR2_MACRO, _, FIELDS) \
    { c(*this); }
#define OBJECT_CTOR(...) BOOST_PP_OVERLOAD(OBJECT_CTOR, __VA_ARGS__)(__VA_ARGS__)

namespace resledger::ledger {
   using std::map;
   using std::optional;
   using std::set;
   using std::string;
   using std::vector;

   using chainbase::database;
   using chainbase::pinnable_mapped_file;
   using shared_string = chainbase::shared_string;

   using account_name     = name;
   using action_name      = name;
   using block_num_type   = uint32_t;
   using resource_type_id = uint64_t;
   using request_id_type  = uint64_t;
   using share_type       = uint64_t;

   inline string to_string( const shared_string& s ) {
      return string( s.begin(), s.end() );
   }

   /**
    * Type numbers of every table kept in the state database
    */
   enum object_type
   {
      null_object_type = 0,
      global_property_object_type,
      role_object_type,
      resource_object_type,
      price_history_object_type,
      request_object_type,
      balance_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

} // resledger::ledger
