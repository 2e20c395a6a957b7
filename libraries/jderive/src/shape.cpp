#include <jderive/shape.hpp>

namespace jderive
{
   std::string_view kind_to_str(shape_kind k)
   {
      switch (k)
      {
            // clang-format off
         case shape_kind::sum:       return "sum";
         case shape_kind::singleton: return "singleton";
         case shape_kind::product:   return "product";
         case shape_kind::builtin:   return "builtin";
            // clang-format on

         default:
            return "unknown";
      }
   }
}  // namespace jderive
