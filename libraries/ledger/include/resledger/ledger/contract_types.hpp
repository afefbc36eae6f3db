#pragma once

#include <resledger/ledger/config.hpp>
#include <resledger/ledger/role_object.hpp>
#include <resledger/ledger/types.hpp>

namespace resledger::ledger {

struct init {
   share_type     max_amount = config::default_max_amount;
   account_name   emergency_contact;

   static action_name get_name() {
      return "init"_n;
   }
};

struct setparams {
   share_type     max_amount = 0;
   account_name   emergency_contact;

   static action_name get_name() {
      return "setparams"_n;
   }
};

struct setmaint {
   static action_name get_name() {
      return "setmaint"_n;
   }
};

struct clrmaint {
   static action_name get_name() {
      return "clrmaint"_n;
   }
};

struct setpaused {
   bool           paused = false;

   static action_name get_name() {
      return "setpaused"_n;
   }
};

struct setrole {
   account_name   account;
   role_type      role = role_type::user;

   static action_name get_name() {
      return "setrole"_n;
   }
};

struct setblacklist {
   account_name   account;
   bool           blacklisted = false;

   static action_name get_name() {
      return "setblacklist"_n;
   }
};

struct regresource {
   resource_type_id   resource_type = 0;
   string             name;
   share_type         total_supply = 0;
   share_type         unit_price = 0;
   share_type         min_allocation = 0;
   share_type         max_allocation = 0;
   uint8_t            priority_floor = 1;

   static action_name get_name() {
      return "regresource"_n;
   }
};

struct updateprice {
   resource_type_id   resource_type = 0;
   share_type         new_price = 0;

   static action_name get_name() {
      return "updateprice"_n;
   }
};

struct lockres {
   resource_type_id   resource_type = 0;

   static action_name get_name() {
      return "lockres"_n;
   }
};

struct unlockres {
   resource_type_id   resource_type = 0;

   static action_name get_name() {
      return "unlockres"_n;
   }
};

struct submitreq {
   account_name       requester;
   resource_type_id   resource_type = 0;
   share_type         amount = 0;
   string             purpose;

   static action_name get_name() {
      return "submitreq"_n;
   }
};

struct approvereq {
   request_id_type    request_id = 0;

   static action_name get_name() {
      return "approvereq"_n;
   }
};

struct rejectreq {
   request_id_type    request_id = 0;

   static action_name get_name() {
      return "rejectreq"_n;
   }
};

struct expirereq {
   request_id_type    request_id = 0;

   static action_name get_name() {
      return "expirereq"_n;
   }
};

struct transfer {
   account_name       from;
   account_name       to;
   resource_type_id   resource_type = 0;
   share_type         amount = 0;

   static action_name get_name() {
      return "transfer"_n;
   }
};

struct returnalloc {
   account_name       owner;
   resource_type_id   resource_type = 0;
   share_type         amount = 0;

   static action_name get_name() {
      return "returnalloc"_n;
   }
};

} // resledger::ledger
