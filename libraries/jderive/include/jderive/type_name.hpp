#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <typeinfo>
#include <variant>
#include <vector>

#include <boost/core/demangle.hpp>

namespace jderive
{
   template <typename T>
   std::string type_name();

   /// Rewrites a demangled name into the same text on every compiler: drops the
   /// struct, class, enum and union keywords MSVC prints and the blanks around
   /// template arguments.
   std::string portable_type_name(std::string_view demangled);

   /// A demangled name that names a type in an anonymous namespace
   bool is_anonymous_type_name(std::string_view name);

   /// `ns::Outer<int>::Box` for `ns::Outer<int>::Box<a, b>`
   std::string_view template_name(std::string_view name);

   // clang-format off
   inline std::string get_type_name(const bool*) { return "bool"; }
   inline std::string get_type_name(const int8_t*) { return "int8"; }
   inline std::string get_type_name(const uint8_t*) { return "uint8"; }
   inline std::string get_type_name(const int16_t*) { return "int16"; }
   inline std::string get_type_name(const uint16_t*) { return "uint16"; }
   inline std::string get_type_name(const int32_t*) { return "int32"; }
   inline std::string get_type_name(const uint32_t*) { return "uint32"; }
   inline std::string get_type_name(const int64_t*) { return "int64"; }
   inline std::string get_type_name(const uint64_t*) { return "uint64"; }
   inline std::string get_type_name(const float*) { return "float32"; }
   inline std::string get_type_name(const double*) { return "double"; }
   inline std::string get_type_name(const char*) { return "char"; }
   inline std::string get_type_name(const std::string*) { return "string"; }
   // clang-format on

   template <typename T>
   std::string get_type_name(const std::vector<T>*)
   {
      return type_name<T>() + "[]";
   }

   template <typename T, std::size_t N>
   std::string get_type_name(const std::array<T, N>*)
   {
      return type_name<T>() + "[" + std::to_string(N) + "]";
   }

   template <typename T>
   std::string get_type_name(const std::optional<T>*)
   {
      return type_name<T>() + "?";
   }

   template <typename... T>
   std::string get_type_name(const std::variant<T...>*)
   {
      return (std::string("variant") + ... + ("_" + type_name<T>()));
   }

   template <typename... T>
   std::string get_type_name(const std::tuple<T...>*)
   {
      return (std::string("tuple") + ... + ("_" + type_name<T>()));
   }

   template <typename K, typename V>
   std::string get_type_name(const std::map<K, V>*)
   {
      return "map_" + type_name<K>() + "_" + type_name<V>();
   }

   // Everything else, reflected types included, goes by its fully-qualified C++ name
   template <typename T>
   std::string get_type_name(const T*)
   {
      return portable_type_name(boost::core::demangle(typeid(T).name()));
   }

   // Class templates spell their arguments the way jderive names them: Box<int32>
   template <template <typename...> class C, typename... A>
   std::string get_type_name(const C<A...>*)
   {
      auto name   = portable_type_name(boost::core::demangle(typeid(C<A...>).name()));
      auto result = std::string(template_name(name)) + "<";
      bool first  = true;
      ((result += (first ? "" : ",") + type_name<A>(), first = false), ...);
      return result + ">";
   }

   template <typename T>
   std::string type_name()
   {
      return get_type_name(static_cast<const T*>(nullptr));
   }
}  // namespace jderive
