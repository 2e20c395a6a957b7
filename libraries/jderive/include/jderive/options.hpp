#pragma once

#include <jderive/reflect.hpp>

#include <string>
#include <string_view>

namespace jderive
{
   struct session_options
   {
      /// Leave out fields whose value equals their default when writing
      bool omit_defaults = true;
      /// Ignore object members no field maps to when reading. When false they
      /// are rejected with unexpected_field.
      bool allow_unknown_fields = true;
      /// Minimum severity that reaches the log (debug, info, notice, warning, error)
      std::string log_level = "warning";
   };
   JDERIVE_REFLECT(session_options,
                   defaulted(omit_defaults),
                   defaulted(allow_unknown_fields),
                   defaulted(log_level))

   /// Reads options from JSON text and applies their log level. Unknown keys are
   /// rejected. Throws json_error or conversion_error.
   session_options load_options(std::string_view json);
}  // namespace jderive
