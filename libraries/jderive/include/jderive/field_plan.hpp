#pragma once

#include <jderive/annotation.hpp>
#include <jderive/check.hpp>
#include <jderive/reflect.hpp>
#include <jderive/type_name.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jderive
{
   /// One constructor parameter of a product type
   struct field_plan
   {
      std::string original_name;
      std::string serialized_name;
      std::string declared_type;  // the element type for a variadic field
      bool        has_default = false;
      bool        is_variadic = false;
   };

   template <std::size_t I, auto M0, auto... M>
   constexpr auto nth_member()
   {
      if constexpr (I == 0)
         return M0;
      else
         return nth_member<I - 1, M...>();
   }

   template <std::size_t I, auto... M>
   constexpr auto nth_member_of(MemberList<M...>*)
   {
      return nth_member<I, M...>();
   }

   /// Member pointer of the I'th reflected field of T
   template <typename T, std::size_t I>
   constexpr auto member_at = nth_member_of<I>((typename reflect<T>::data_members*)nullptr);

   template <typename T>
   constexpr std::size_t field_count = reflect<T>::data_members::size;

   /// Type the I'th field is read and written as: the member type, or its element
   /// type for a variadic field
   template <typename T, std::size_t I, bool Variadic = reflect<T>::fields()[I].variadic>
   struct field_value
   {
      using type = member_type<member_at<T, I>>;
   };

   template <typename T, std::size_t I>
   struct field_value<T, I, true>
   {
      static_assert(is_std_vector_v<member_type<member_at<T, I>>>,
                    "variadic(...) fields must be std::vector");
      using type = typename is_std_vector<member_type<member_at<T, I>>>::value_type;
   };

   template <typename T, std::size_t I>
   using field_value_t = typename field_value<T, I>::type;

   /// Checks that serialized names are unique and that at most one field, the
   /// last, is variadic
   void validate_plan(const std::vector<field_plan>& plan, std::string_view type_name);

   template <typename T, std::size_t I>
   field_plan plan_entry()
   {
      constexpr field_info info = reflect<T>::fields()[I];
      return field_plan{
          .original_name   = info.name,
          .serialized_name = resolve_name(info.key, info.name,
                                          type_name<T>() + "::" + std::string(info.name)),
          .declared_type   = type_name<field_value_t<T, I>>(),
          .has_default     = info.defaulted,
          .is_variadic     = info.variadic,
      };
   }

   template <typename T, std::size_t... I>
   std::vector<field_plan> build_plan(std::index_sequence<I...>)
   {
      std::vector<field_plan> plan{plan_entry<T, I>()...};
      validate_plan(plan, type_name<T>());
      return plan;
   }

   /// The ordered field plan of a product type. Throws derivation_error
   /// (malformed_annotation, duplicate_key, misplaced_variadic).
   template <typename T>
   std::vector<field_plan> build_plan()
   {
      return build_plan<T>(std::make_index_sequence<field_count<T>>{});
   }
}  // namespace jderive
