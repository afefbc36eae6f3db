#include <resledger/util/log/logger_config.hpp>
#include <resledger/util/exception.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <iostream>

namespace resledger::util {

   namespace {
      std::vector<std::string> read_string_array( const boost::property_tree::ptree& tree, const std::string& key ) {
         std::vector<std::string> result;
         if( auto child = tree.get_child_optional( key ) ) {
            for( const auto& item : *child )
               result.push_back( item.second.get_value<std::string>() );
         }
         return result;
      }

      sink::color_sink_config read_color_sink( const boost::property_tree::ptree& args ) {
         sink::color_sink_config cfg;
         if( auto colors = args.get_child_optional( "level_colors" ) ) {
            for( const auto& item : *colors ) {
               cfg.level_colors.emplace_back( item.second.get<std::string>( "level" ),
                                              item.second.get<std::string>( "color" ) );
            }
         }
         return cfg;
      }
   }

   log_config& log_config::get() {
      // allocate dynamically which will leak on exit but allow loggers to be used until the very end of execution
      static log_config* the = new log_config;
      return *the;
   }

   logger log_config::get_logger( const std::string& name ) {
      std::lock_guard g( log_config::get().log_mutex );
      return log_config::get().logger_map[name];
   }

   void log_config::update_logger( const std::string& name, logger& log ) {
      std::lock_guard g( log_config::get().log_mutex );
      auto& loggers = log_config::get().logger_map;
      if( loggers.find( name ) != loggers.end() ) {
         log = loggers[name];
      } else if( loggers.find( DEFAULT_LOGGER ) != loggers.end() ) {
         // no entry for logger, so share the default logger; do nothing if default logger is not configured
         log = loggers[DEFAULT_LOGGER];
         loggers.emplace( name, log );
      }
   }

   logging_config logging_config::from_ptree( const boost::property_tree::ptree& tree ) {
      logging_config cfg;
      try {
         if( auto sinks = tree.get_child_optional( "sinks" ) ) {
            for( const auto& item : *sinks ) {
               const auto& s = item.second;
               sink_config sc;
               sc.name    = s.get<std::string>( "name" );
               sc.type    = s.get<std::string>( "type" );
               sc.enabled = s.get<bool>( "enabled", true );

               const auto args = s.get_child( "args", boost::property_tree::ptree{} );
               if( sc.type == "stderr_color_sink" || sc.type == "stdout_color_sink" ) {
                  sc.color = read_color_sink( args );
               } else if( sc.type == "daily_file_sink" ) {
                  sc.daily_file.base_filename   = args.get<std::string>( "base_filename" );
                  sc.daily_file.rotation_hour   = args.get<int32_t>( "rotation_hour", 0 );
                  sc.daily_file.rotation_minute = args.get<int32_t>( "rotation_minute", 0 );
                  sc.daily_file.truncate        = args.get<bool>( "truncate", false );
                  sc.daily_file.max_files       = args.get<uint32_t>( "max_files", 0 );
               } else if( sc.type == "rotating_file_sink" ) {
                  sc.rotating_file.base_filename = args.get<std::string>( "base_filename" );
                  sc.rotating_file.max_size      = args.get<uint32_t>( "max_size", sc.rotating_file.max_size );
                  sc.rotating_file.max_files     = args.get<uint32_t>( "max_files", sc.rotating_file.max_files );
               }
               cfg.sinks.push_back( std::move(sc) );
            }
         }

         if( auto loggers = tree.get_child_optional( "loggers" ) ) {
            for( const auto& item : *loggers ) {
               const auto& l = item.second;
               logger_config lc( l.get<std::string>( "name" ) );
               if( auto level = l.get_optional<std::string>( "level" ) )
                  lc.level = log_level::from_string( *level );
               if( auto enabled = l.get_optional<bool>( "enabled" ) )
                  lc.enabled = *enabled;
               lc.sinks = read_string_array( l, "sinks" );
               cfg.loggers.push_back( std::move(lc) );
            }
         }
      } catch( const boost::property_tree::ptree_error& e ) {
         RESLEDGER_THROW( assert_exception, "invalid logging configuration: {}", e.what() );
      }
      return cfg;
   }

   logging_config logging_config::from_file( const std::filesystem::path& file ) {
      boost::property_tree::ptree tree;
      try {
         boost::property_tree::read_json( file.string(), tree );
      } catch( const boost::property_tree::json_parser_error& e ) {
         RESLEDGER_THROW( assert_exception, "unable to parse logging configuration {}: {}", file.string(), e.what() );
      }
      return from_ptree( tree );
   }

   void configure_logging( const std::filesystem::path& lc ) {
      RESLEDGER_ASSERT( configure_logging( logging_config::from_file( lc ) ), assert_exception,
                        "unable to apply logging configuration {}", lc.string() );
   }

   bool configure_logging( const logging_config& cfg ) {
      return log_config::configure_logging( cfg );
   }

   bool log_config::configure_logging( const logging_config& cfg ) {
      try {
         std::lock_guard g( log_config::get().log_mutex );
         log_config::get().logger_map.clear();
         log_config::get().sink_map.clear();

         logger::default_logger() = log_config::get().logger_map[DEFAULT_LOGGER];
         logger& default_logger = logger::default_logger();

         auto config_colors = [](auto& sink, const std::vector<sink::level_color>& colors) {
            for (const auto& it : colors) {
               if (it.color == "yellow")
                  sink->set_color(spdlog::level::from_str(it.level), sink->yellow);
               else if (it.color == "red")
                  sink->set_color(spdlog::level::from_str(it.level), sink->red);
               else if (it.color == "green")
                  sink->set_color(spdlog::level::from_str(it.level), sink->green);
               else
                  sink->set_color(spdlog::level::from_str(it.level), sink->reset);
            }
         };

         for( const auto& sc : cfg.sinks ) {
            if( !sc.enabled )
               continue;
            if (sc.type == "stderr_color_sink") {
               auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
               config_colors(sink, sc.color.level_colors);
               log_config::get().sink_map[sc.name] = sink;
            } else if (sc.type == "stdout_color_sink") {
               auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
               config_colors(sink, sc.color.level_colors);
               log_config::get().sink_map[sc.name] = sink;
            } else if (sc.type == "daily_file_sink") {
               const auto& c = sc.daily_file;
               log_config::get().sink_map[sc.name] = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                       c.base_filename, c.rotation_hour, c.rotation_minute, c.truncate, c.max_files);
            } else if (sc.type == "rotating_file_sink") {
               const auto& c = sc.rotating_file;
               log_config::get().sink_map[sc.name] = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                       c.base_filename, std::size_t(c.max_size)*1024*1024, c.max_files);
            } else {
               std::cerr << "\nWARNING: Unknown sink type: " << sc.type << std::endl;
            }
         }

         for (bool first_pass = true; ; first_pass = false) { // process default first
            for( const auto& lc : cfg.loggers ) {
               if (first_pass && lc.name != DEFAULT_LOGGER)
                  continue;
               if (!first_pass && lc.name == DEFAULT_LOGGER)
                  continue;
               auto lgr = log_config::get().logger_map[lc.name];

               lgr.set_name(lc.name);
               lgr.set_enabled( lc.enabled ? *lc.enabled : default_logger.is_enabled() );
               lgr.set_log_level( lc.level ? *lc.level : default_logger.get_log_level() );

               for( const auto& s : lc.sinks ) {
                  auto sink_it = log_config::get().sink_map.find(s);
                  if (sink_it != log_config::get().sink_map.end()) {
                     lgr.add_sink(sink_it->second);
                  }
               }
               if (!lgr.get_sinks().empty())
                  lgr.update_agent_logger(
                     std::make_unique<spdlog::logger>("", lgr.get_sinks().begin(), lgr.get_sinks().end()));
            }
            if (!first_pass)
               break;
         }

         return true;
      } catch( const exception& e ) {
         std::cerr << e.to_detail_string() << "\n";
      } catch( const spdlog::spdlog_ex& e ) {
         std::cerr << "unable to create log sink: " << e.what() << "\n";
      }
      return false;
   }

   logging_config logging_config::default_config() {
      logging_config cfg;

      sink_config stderr_sink;
      stderr_sink.name = "stderr";
      stderr_sink.type = "stderr_color_sink";
      stderr_sink.color.level_colors = { {"debug", "green"}, {"warn", "yellow"}, {"error", "red"} };
      cfg.sinks.push_back( std::move(stderr_sink) );

      logger_config dlc( DEFAULT_LOGGER );
      dlc.level = log_level::info;
      dlc.sinks.push_back( "stderr" );
      cfg.loggers.push_back( std::move(dlc) );
      return cfg;
   }

   static thread_local std::string thread_name;

   const std::string& get_thread_name() {
      if( thread_name.empty() )
         thread_name = "main";
      return thread_name;
   }
}
