#include <jderive/jderive.hpp>

namespace jderive
{
   session_options load_options(std::string_view json)
   {
      derivation_session strict{session_options{.allow_unknown_fields = false}};
      auto               options = strict.derive<session_options>().read(parse_json(json));
      loggers::configure(loggers::parse_level(options.log_level));
      JDERIVE_LOG(loggers::generic::get(), debug)
          << "Loaded options: omit_defaults=" << options.omit_defaults
          << " allow_unknown_fields=" << options.allow_unknown_fields
          << " log_level=" << options.log_level;
      return options;
   }
}  // namespace jderive
