#pragma once

#include <jderive/tree.hpp>

#include <string>
#include <string_view>

namespace jderive
{
   // A value of a sum type travels as an object with exactly one member: the tag of
   // its alternative mapped to the untagged payload, e.g. {"Circle":{"r":3}}.

   tree tag_value(std::string_view tag, tree payload);

   /// The tag of a tagged value. Throws conversion_error(expected_tagged) if the
   /// value is not a one-member object.
   const std::string& peek_tag(const tree& value);

   /// The payload of a value tagged with `tag`. Throws expected_tagged or
   /// unknown_variant.
   const tree& untag(const tree& value, std::string_view tag);
}  // namespace jderive
