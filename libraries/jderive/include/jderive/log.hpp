#pragma once

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace jderive
{
   namespace loggers
   {
      enum class level : std::uint32_t
      {
         debug,
         info,
         notice,
         warning,
         error,
      };
      std::ostream& operator<<(std::ostream&, const level&);
      std::istream& operator>>(std::istream& is, level& l);
      // Records carry Channel "jderive" and a Severity of type `level`. Sinks and core
      // filters belong to the application; the library only drops records below the
      // level set with configure().
      using common_logger = boost::log::sources::severity_logger_mt<level>;
      BOOST_LOG_GLOBAL_LOGGER(generic, common_logger)

      /// Parses a level name. Throws conversion_error(invalid_value) for an unknown name.
      level parse_level(std::string_view name);

      // jderive only emits records at or above `min`. The default is warning.
      void configure(level min);
      void configure(std::string_view min);

      bool enabled(level l);
   }  // namespace loggers

#define JDERIVE_LOG(logger, log_level)                                          \
   if (!::jderive::loggers::enabled(::jderive::loggers::level::log_level)) \
   {                                                                       \
   }                                                                       \
   else                                                                    \
      BOOST_LOG_SEV(logger, ::jderive::loggers::level::log_level)
}  // namespace jderive
