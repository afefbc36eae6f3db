#pragma once

#include <filesystem>

namespace resledger::util {

   /**
    *  A uniquely named directory created on construction and removed, with its contents, on
    *  destruction.
    */
   class temp_directory {
      public:
         explicit temp_directory( const std::filesystem::path& parent = std::filesystem::temp_directory_path() );
         ~temp_directory();

         temp_directory( const temp_directory& ) = delete;
         temp_directory& operator=( const temp_directory& ) = delete;

         const std::filesystem::path& path()const { return _path; }

      private:
         std::filesystem::path _path;
   };

} // namespace resledger::util
