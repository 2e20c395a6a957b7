#pragma once

#include <jderive/tree.hpp>

#include <string>
#include <string_view>

namespace jderive
{
   /// Parses JSON text into a tree. Numbers keep their original text.
   /// Throws json_error carrying the byte offset of the failure.
   tree parse_json(std::string_view json);

   std::string format_json(const tree& value, bool pretty = false);
}  // namespace jderive
