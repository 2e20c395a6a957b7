#pragma once

#include <jderive/annotation.hpp>
#include <jderive/check.hpp>
#include <jderive/field_plan.hpp>
#include <jderive/reflect.hpp>
#include <jderive/tree.hpp>
#include <jderive/type_name.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace jderive
{
   enum class shape_kind : std::uint8_t
   {
      sum,
      singleton,
      product,
      builtin,
   };

   std::string_view kind_to_str(shape_kind k);

   /// What derivation learned about a type
   struct type_shape
   {
      shape_kind                 kind = shape_kind::builtin;
      std::string                name;
      std::optional<std::string> tag;       // set when the type has a sum-typed ancestor
      std::vector<field_plan>    fields;    // products
      std::vector<std::string>   variants;  // sums, in declaration order
   };

   // clang-format off
   template <typename T>
   concept builtin_type =
       std::is_arithmetic_v<T> || std::is_enum_v<T> || std::is_same_v<T, std::string> ||
       std::is_same_v<T, tree> || is_std_vector_v<T> || is_std_array_v<T> ||
       is_std_optional_v<T> || is_std_map_v<T> || is_std_pair_v<T> || is_std_tuple_v<T> ||
       is_std_variant_v<T> || is_std_unique_ptr_v<T> || is_std_shared_ptr_v<T>;
   // clang-format on

   /// A polymorphic class nobody declared the alternatives of
   template <typename T>
   constexpr bool is_open_hierarchy = std::is_polymorphic_v<T> && !reflect<T>::is_defined;

   /// Alternatives are owned and destroyed through a pointer to the sum type
   template <typename T>
   constexpr bool is_sum_base = std::is_polymorphic_v<T> && std::has_virtual_destructor_v<T>;

   template <typename T>
   constexpr bool has_sum_ancestor();

   template <typename... B>
   constexpr bool any_sum(TypeList<B...>*)
   {
      return ((reflect<B>::is_sum || has_sum_ancestor<B>()) || ...);
   }

   /// Walks the reflected bases transitively
   template <typename T>
   constexpr bool has_sum_ancestor()
   {
      if constexpr (reflect<T>::is_defined)
         return any_sum((typename reflect<T>::bases*)nullptr);
      else
         return false;
   }

   template <typename B, typename... Bs>
   constexpr bool lists_base(TypeList<Bs...>*)
   {
      return (std::is_same_v<B, Bs> || ...);
   }

   template <typename T, typename... F>
   concept brace_constructible = requires(F&&... f) { T{static_cast<F&&>(f)...}; };

   template <typename T, auto... M>
   constexpr bool constructible_from(MemberList<M...>*)
   {
      return brace_constructible<T, member_type<M>...> ||
             std::is_constructible_v<T, member_type<M>...>;
   }

   template <auto... M>
   constexpr bool deconstructible_by(MemberList<M...>*)
   {
      return (is_deconstructor_member<M> && ...);
   }

   template <typename T>
   constexpr bool any_defaulted()
   {
      for (const auto& f : reflect<T>::fields())
         if (f.defaulted)
            return true;
      return false;
   }

   /// Some constructor takes the reflected fields in order. Defaulted fields take their
   /// values from a default-constructed instance, so they also need a default constructor.
   template <typename T>
   constexpr bool has_constructor =
       constructible_from<T>((typename reflect<T>::data_members*)nullptr) &&
       (!any_defaulted<T>() || std::is_default_constructible_v<T>);

   template <typename T>
   constexpr bool has_deconstructor =
       deconstructible_by((typename reflect<T>::data_members*)nullptr);

   /// Discriminant tag of T: its JDERIVE_KEY, else its fully-qualified name.
   /// Types in an anonymous namespace have no name to fall back on.
   template <typename T>
   std::string tag_of()
   {
      auto name = type_name<T>();
      auto key  = type_key<T>();
      check(key.present || !is_anonymous_type_name(name), derivation_errc::anonymous_tag, name);
      return resolve_name(key, name, name);
   }

   template <typename... A>
   std::vector<std::string> alternative_names(TypeList<A...>*)
   {
      return {type_name<A>()...};
   }

   /// Classifies T and checks that a converter can be derived for it.
   /// Throws derivation_error.
   template <typename T>
   type_shape classify()
   {
      static_assert(reflect<T>::is_defined || builtin_type<T> || is_open_hierarchy<T>,
                    "jderive: declare the type with JDERIVE_REFLECT, JDERIVE_REFLECT_SUM or "
                    "JDERIVE_REFLECT_SINGLETON");
      type_shape shape;
      shape.name = type_name<T>();
      if constexpr (has_sum_ancestor<T>())
         shape.tag = tag_of<T>();

      if constexpr (reflect<T>::is_sum)
      {
         static_assert(is_sum_base<T>, "jderive: sum types need a virtual destructor");
         shape.kind     = shape_kind::sum;
         shape.variants = alternative_names((typename reflect<T>::alternatives*)nullptr);
         check(!shape.variants.empty(), derivation_errc::no_variants, shape.name);
      }
      else if constexpr (is_open_hierarchy<T>)
      {
         shape.kind = shape_kind::sum;
         abort_error(derivation_errc::not_sealed, shape.name);
      }
      else if constexpr (reflect<T>::is_singleton)
      {
         shape.kind = shape_kind::singleton;
      }
      else if constexpr (reflect<T>::is_struct)
      {
         shape.kind = shape_kind::product;
         check(has_deconstructor<T>, derivation_errc::no_deconstructor, shape.name);
         check(has_constructor<T>, derivation_errc::no_constructor, shape.name);
         shape.fields = build_plan<T>();
      }
      return shape;
   }
}  // namespace jderive
