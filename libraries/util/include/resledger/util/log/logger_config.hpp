#pragma once

#include <resledger/util/log/logger.hpp>
#include <spdlog/spdlog.h>

#include <boost/property_tree/ptree_fwd.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace resledger::util {

   namespace sink {
      struct level_color {
         level_color( std::string l = "trace", std::string c = "yellow" )
         : level(std::move(l)), color(std::move(c)) {}

         std::string  level;
         std::string  color;
      };

      struct color_sink_config {
         std::vector<level_color>      level_colors;
      };

      struct daily_file_sink_config {
         std::string    base_filename;
         int32_t        rotation_hour = 0;
         int32_t        rotation_minute = 0;
         bool           truncate = false;
         uint32_t       max_files = 0;
      };

      struct rotating_file_sink_config {
         std::string    base_filename;
         uint32_t       max_size = 10; // MB
         uint32_t       max_files = 10;
      };
   } // namespace sink

   /**
    *  A sink entry of the logging configuration. `type` selects which of the sink configs in
    *  namespace sink is read from `args`.
    */
   struct sink_config {
      std::string                             name;
      std::string                             type;
      bool                                    enabled = true;
      sink::color_sink_config                 color;
      sink::daily_file_sink_config            daily_file;
      sink::rotating_file_sink_config         rotating_file;
   };

   struct logger_config {
      explicit logger_config(std::string name = {}):name(std::move(name)){}
      std::string                      name;
      std::optional<log_level>         level;
      /// if not set, then parents enabled is used.
      std::optional<bool>              enabled;
      std::vector<std::string>         sinks;
   };

   struct logging_config {
      static logging_config default_config();
      static logging_config from_ptree( const boost::property_tree::ptree& tree );
      static logging_config from_file( const std::filesystem::path& file );

      std::vector<sink_config>     sinks;
      std::vector<logger_config>   loggers;
   };

   struct log_config {
      static logger get_logger( const std::string& name );
      static void update_logger( const std::string& name, logger& log );

      static bool configure_logging( const logging_config& l );

   private:
      static log_config& get();

      friend class logger;

      std::mutex                                                             log_mutex;
      std::unordered_map<std::string, std::shared_ptr<spdlog::sinks::sink>>  sink_map;
      std::unordered_map<std::string, logger>                                logger_map;
   };

   void configure_logging( const std::filesystem::path& log_config );
   bool configure_logging( const logging_config& l );

   const std::string& get_thread_name();
}
