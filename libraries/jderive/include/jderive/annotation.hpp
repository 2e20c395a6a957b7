#pragma once

#include <string>
#include <string_view>

namespace jderive
{
   /// A rename annotation as written in a reflection macro. `literal` is null
   /// when the argument was something other than a string literal.
   struct annotation
   {
      bool        present = false;
      const char* literal = nullptr;

      constexpr bool well_formed() const { return !present || literal != nullptr; }
   };

   constexpr annotation make_annotation()
   {
      return {};
   }

   constexpr annotation make_annotation(const char* literal)
   {
      return {true, literal};
   }

   template <typename T>
   constexpr annotation make_annotation(const T&)
   {
      return {true, nullptr};
   }

   /// Returns the annotation's literal, or `fallback` when there is no annotation.
   /// Throws derivation_error(malformed_annotation) naming `symbol` when the
   /// annotation is present but not a string literal.
   std::string resolve_name(const annotation& a, std::string_view fallback, std::string_view symbol);

   // Types without JDERIVE_KEY
   template <typename T>
   constexpr annotation jderive_type_key(const T*)
   {
      return {};
   }

   template <typename T>
   constexpr annotation type_key()
   {
      return jderive_type_key(static_cast<const T*>(nullptr));
   }
}  // namespace jderive

/**
 * JDERIVE_KEY(<type>, "<tag>")
 * Overrides the discriminant tag of an alternative of a sum type. Place it in
 * the namespace of the type.
 */
#define JDERIVE_KEY(TYPE, KEY)                                          \
   constexpr ::jderive::annotation jderive_type_key(const TYPE*)        \
   {                                                                    \
      return ::jderive::make_annotation(KEY);                           \
   }
