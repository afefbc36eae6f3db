#pragma once
#include <resledger/util/log/logger.hpp>

#include <string>

namespace resledger::ledger {

   inline const std::string ledger_logger_name{"resledger_ledger"};

   /// picked up from the logging configuration by the controller, see controller::controller
   extern util::logger ledger_log;

} // resledger::ledger
