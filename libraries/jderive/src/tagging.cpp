#include <jderive/check.hpp>
#include <jderive/tagging.hpp>

namespace jderive
{
   tree tag_value(std::string_view tag, tree payload)
   {
      auto result = tree::make_object();
      result.emplace(std::string(tag), std::move(payload));
      return result;
   }

   const std::string& peek_tag(const tree& value)
   {
      check(value.is_object() && value.as_object().size() == 1, conversion_errc::expected_tagged);
      return value.as_object().front().key;
   }

   const tree& untag(const tree& value, std::string_view tag)
   {
      const auto& actual = peek_tag(value);
      check(actual == tag, conversion_errc::unknown_variant, actual);
      return value.as_object().front().value;
   }
}  // namespace jderive
