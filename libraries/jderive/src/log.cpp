#include <jderive/check.hpp>
#include <jderive/log.hpp>

#include <boost/log/attributes/constant.hpp>

#include <atomic>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>

namespace jderive::loggers
{
   BOOST_LOG_GLOBAL_LOGGER_INIT(generic, common_logger)
   {
      common_logger logger;
      logger.add_attribute("Channel", boost::log::attributes::constant(std::string("jderive")));
      return logger;
   }

   namespace
   {
      std::atomic<level> threshold{level::warning};
   }  // namespace

   std::ostream& operator<<(std::ostream& os, const level& l)
   {
      switch (l)
      {
         case level::debug:
            os << "debug";
            break;
         case level::info:
            os << "info";
            break;
         case level::notice:
            os << "notice";
            break;
         case level::warning:
            os << "warning";
            break;
         case level::error:
            os << "error";
            break;
      }
      return os;
   }
   std::istream& operator>>(std::istream& is, level& l)
   {
      std::string s;
      if (is >> s)
      {
         if (s == "debug")
         {
            l = level::debug;
         }
         else if (s == "info")
         {
            l = level::info;
         }
         else if (s == "notice")
         {
            l = level::notice;
         }
         else if (s == "warning")
         {
            l = level::warning;
         }
         else if (s == "error")
         {
            l = level::error;
         }
         else
         {
            abort_error(conversion_errc::invalid_value, "log level \"" + s + "\"");
         }
      }
      return is;
   }

   level parse_level(std::string_view name)
   {
      level              result = level::warning;
      std::istringstream is{std::string(name)};
      is >> result;
      check(!is.fail(), conversion_errc::invalid_value, "log level");
      return result;
   }

   void configure(level min)
   {
      threshold.store(min, std::memory_order_relaxed);
   }

   void configure(std::string_view min)
   {
      configure(parse_level(min));
   }

   bool enabled(level l)
   {
      return l >= threshold.load(std::memory_order_relaxed);
   }
}  // namespace jderive::loggers
