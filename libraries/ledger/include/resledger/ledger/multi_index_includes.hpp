#pragma once

#include <chainbase/chainbase.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace resledger::ledger {

using boost::multi_index::indexed_by;
using boost::multi_index::ordered_unique;
using boost::multi_index::composite_key;
using boost::multi_index::composite_key_compare;
using boost::multi_index::member;
using boost::multi_index::tag;

struct by_id;

} // resledger::ledger
