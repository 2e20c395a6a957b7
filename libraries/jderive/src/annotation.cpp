#include <jderive/annotation.hpp>
#include <jderive/check.hpp>

namespace jderive
{
   std::string resolve_name(const annotation& a, std::string_view fallback, std::string_view symbol)
   {
      if (!a.present)
         return std::string(fallback);
      check(a.well_formed(), derivation_errc::malformed_annotation, symbol,
            "the key is not a string literal");
      return a.literal;
   }
}  // namespace jderive
