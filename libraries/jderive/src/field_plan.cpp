#include <jderive/field_plan.hpp>

#include <set>

namespace jderive
{
   void validate_plan(const std::vector<field_plan>& plan, std::string_view type_name)
   {
      std::set<std::string_view> keys;
      for (std::size_t i = 0; i < plan.size(); ++i)
      {
         const auto& field = plan[i];
         check(keys.insert(field.serialized_name).second, derivation_errc::duplicate_key,
               type_name, field.serialized_name);
         check(!field.is_variadic || i + 1 == plan.size(), derivation_errc::misplaced_variadic,
               type_name, field.original_name);
      }
   }
}  // namespace jderive
