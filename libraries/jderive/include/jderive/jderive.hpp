#pragma once

#include <jderive/annotation.hpp>
#include <jderive/builtin.hpp>
#include <jderive/error.hpp>
#include <jderive/json.hpp>
#include <jderive/knot.hpp>
#include <jderive/log.hpp>
#include <jderive/options.hpp>
#include <jderive/reflect.hpp>
#include <jderive/session.hpp>
#include <jderive/shape.hpp>
#include <jderive/synthesize.hpp>
#include <jderive/tagging.hpp>
#include <jderive/tree.hpp>

#include <string>
#include <string_view>

namespace jderive
{
   template <typename T>
   tree to_tree(const T& value)
   {
      return default_session().derive<T>().write(value);
   }

   template <typename T>
   read_result_t<T> from_tree(const tree& value)
   {
      return default_session().derive<T>().read(value);
   }

   template <typename T>
   std::string convert_to_json(const T& value, bool pretty = false)
   {
      return format_json(to_tree(value), pretty);
   }

   /// Parses JSON text into a T. Sum types come back as std::unique_ptr<T>.
   template <typename T>
   read_result_t<T> convert_from_json(std::string_view json)
   {
      return from_tree<T>(parse_json(json));
   }
}  // namespace jderive
