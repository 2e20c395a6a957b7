#pragma once
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/control/iif.hpp>
#include <boost/preprocessor/facilities/check_empty.hpp>
#include <boost/preprocessor/logical/bitand.hpp>
#include <boost/preprocessor/logical/compl.hpp>
#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/repetition/enum.hpp>
#include <boost/preprocessor/repetition/enum_params.hpp>
#include <boost/preprocessor/seq/filter.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/tuple/eat.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/tuple/push_front.hpp>
#include <boost/preprocessor/variadic/size.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>

#include <jderive/annotation.hpp>

namespace jderive
{
   /// One reflected field as written in JDERIVE_REFLECT
   struct field_info
   {
      const char* name;
      annotation  key;
      bool        defaulted;
      bool        variadic;
   };

   template <typename... F>
   constexpr std::array<field_info, sizeof...(F)> make_fields(F... f)
   {
      return {f...};
   }

   template <typename QueryClass>
   struct reflect_undefined
   {
      static constexpr bool is_defined   = false;
      static constexpr bool is_struct    = false;
      static constexpr bool is_sum       = false;
      static constexpr bool is_singleton = false;
   };

   struct ReflectDummyParam;

   template <typename QueryClass>
   reflect_undefined<QueryClass> jderive_get_reflect_impl(const QueryClass*, ReflectDummyParam*);

   template <typename QueryClass>
   using reflect =
       decltype(jderive_get_reflect_impl((QueryClass*)nullptr, (ReflectDummyParam*)nullptr));

   template <typename T>
   concept Reflected = reflect<T>::is_defined;

   template <typename>
   struct is_std_vector : std::false_type
   {
   };

   template <typename T, typename A>
   struct is_std_vector<std::vector<T, A>> : std::true_type
   {
      using value_type = T;
   };

   template <typename T>
   constexpr bool is_std_vector_v = is_std_vector<T>::value;

   template <typename>
   struct is_std_optional : std::false_type
   {
   };

   template <typename T>
   struct is_std_optional<std::optional<T>> : std::true_type
   {
      using value_type = T;
   };

   template <typename T>
   constexpr bool is_std_optional_v = is_std_optional<T>::value;

   template <typename>
   struct is_std_unique_ptr : std::false_type
   {
   };

   template <typename T>
   struct is_std_unique_ptr<std::unique_ptr<T>> : std::true_type
   {
      using value_type = T;
   };

   template <typename T>
   constexpr bool is_std_unique_ptr_v = is_std_unique_ptr<T>::value;

   template <typename>
   struct is_std_shared_ptr : std::false_type
   {
   };

   template <typename T>
   struct is_std_shared_ptr<std::shared_ptr<T>> : std::true_type
   {
      using value_type = T;
   };

   template <typename T>
   constexpr bool is_std_shared_ptr_v = is_std_shared_ptr<T>::value;

   template <typename>
   struct is_std_array : std::false_type
   {
   };

   template <typename T, auto N>
   struct is_std_array<std::array<T, N>> : std::true_type
   {
      using value_type                        = T;
      constexpr static const std::size_t size = N;
   };

   template <typename T>
   constexpr bool is_std_array_v = is_std_array<T>::value;

   template <typename>
   struct is_std_variant : std::false_type
   {
   };

   template <typename... T>
   struct is_std_variant<std::variant<T...>> : std::true_type
   {
   };

   template <typename T>
   constexpr bool is_std_variant_v = is_std_variant<T>::value;

   template <typename>
   struct is_std_tuple : std::false_type
   {
   };

   template <typename... T>
   struct is_std_tuple<std::tuple<T...>> : std::true_type
   {
   };

   template <typename T>
   constexpr bool is_std_tuple_v = is_std_tuple<T>::value;

   template <typename>
   struct is_std_pair : std::false_type
   {
   };

   template <typename K, typename V>
   struct is_std_pair<std::pair<K, V>> : std::true_type
   {
   };

   template <typename T>
   constexpr bool is_std_pair_v = is_std_pair<T>::value;

   template <typename>
   struct is_std_map : std::false_type
   {
   };

   template <typename K, typename V>
   struct is_std_map<std::map<K, V>> : std::true_type
   {
      using key_type    = K;
      using mapped_type = V;
   };

   template <typename T>
   constexpr bool is_std_map_v = is_std_map<T>::value;

   template <typename... Ts>
   struct TypeList
   {
      static constexpr int size = sizeof...(Ts);
   };

   template <auto... M>
   struct MemberList
   {
      static constexpr int size = sizeof...(M);
   };

   template <typename T>
   struct MemberPtrType;

   template <typename T>
   struct MemberPtrType<const T> : MemberPtrType<T>
   {
   };

   template <typename V, typename T>
   struct MemberPtrType<V(T::*)>
   {
      static constexpr bool isFunction      = false;
      static constexpr bool isConstFunction = false;
      static constexpr int  numArgs         = 0;
      using ClassType                       = T;
      using ValueType                       = V;
   };

   template <typename R, typename T, typename... Args>
   struct MemberPtrType<R (T::*)(Args...)>
   {
      static constexpr bool isFunction      = true;
      static constexpr bool isConstFunction = false;
      static constexpr int  numArgs         = sizeof...(Args);
      using ClassType                       = T;
      using ValueType                       = R;
   };

   template <typename R, typename T, typename... Args>
   struct MemberPtrType<R (T::*)(Args...) const>
   {
      static constexpr bool isFunction      = true;
      static constexpr bool isConstFunction = true;
      static constexpr int  numArgs         = sizeof...(Args);
      using ClassType                       = T;
      using ValueType                       = R;
   };

   template <typename R, typename T, typename... Args>
   struct MemberPtrType<R (T::*)(Args...) noexcept> : MemberPtrType<R (T::*)(Args...)>
   {
   };

   template <typename R, typename T, typename... Args>
   struct MemberPtrType<R (T::*)(Args...) const noexcept> : MemberPtrType<R (T::*)(Args...) const>
   {
   };

   /// The type a reflected member contributes: the data member's type or the getter's result
   template <auto M>
   using member_type = std::remove_cvref_t<typename MemberPtrType<decltype(M)>::ValueType>;

   /// A member can deconstruct a value if it is a data member or a const getter
   /// taking no arguments
   template <auto M>
   constexpr bool is_deconstructor_member = !MemberPtrType<decltype(M)>::isFunction ||
                                            (MemberPtrType<decltype(M)>::isConstFunction &&
                                             MemberPtrType<decltype(M)>::numArgs == 0);

   template <auto M, typename T>
   decltype(auto) get_member(const T& value)
   {
      if constexpr (MemberPtrType<decltype(M)>::isFunction)
         return (value.*M)();
      else
         return (value.*M);
   }
}  // namespace jderive

#define JDERIVE_EMPTY(...)
#define JDERIVE_FIRST(a, ...) a
#define JDERIVE_APPLY_FIRST(a) JDERIVE_FIRST(a)
#define JDERIVE_SKIP_SECOND(a, b, ...) (a, __VA_ARGS__)

#define JDERIVE_SEQ_TRANSFORM(op, data, seq) \
   BOOST_PP_IIF(BOOST_PP_CHECK_EMPTY(seq), JDERIVE_EMPTY, BOOST_PP_SEQ_TRANSFORM)(op, data, seq)

#define JDERIVE_SEQ_FOR_EACH_I(op, data, seq) \
   BOOST_PP_IIF(BOOST_PP_CHECK_EMPTY(seq), JDERIVE_EMPTY, BOOST_PP_SEQ_FOR_EACH_I)(op, data, seq)

#define JDERIVE_MATCH(base, x) JDERIVE_MATCH_CHECK(BOOST_PP_CAT(base, x))
#define JDERIVE_MATCH_CHECK(...) JDERIVE_MATCH_CHECK_N(__VA_ARGS__, 0, )
#define JDERIVE_MATCH_CHECK_N(x, n, r, ...) \
   BOOST_PP_BITAND(n, BOOST_PP_COMPL(BOOST_PP_CHECK_EMPTY(r)))

// Handling of template(typename, int) etc.
#define JDERIVE_REFLECT_NAME(STRUCT) BOOST_PP_TUPLE_ELEM(3, 2, JDERIVE_TEMPLATE_I(STRUCT))

#define JDERIVE_REFLECT_TYPE(STRUCT) JDERIVE_REFLECT_TYPE_I(JDERIVE_TEMPLATE_I(STRUCT))
#define JDERIVE_REFLECT_TYPE_I(STRUCT) JDERIVE_REFLECT_TYPE_II STRUCT
#define JDERIVE_REFLECT_TYPE_II(c, params, name) \
   BOOST_PP_IIF(c, JDERIVE_REFLECT_TYPE_TEMPLATE, JDERIVE_REFLECT_TYPE_NONTEMPLATE)(params, name)
#define JDERIVE_REFLECT_TYPE_TEMPLATE(params, name) \
   name<BOOST_PP_ENUM_PARAMS(BOOST_PP_VARIADIC_SIZE params, T)>
#define JDERIVE_REFLECT_TYPE_NONTEMPLATE(params, name) name

#define JDERIVE_REFLECT_TEMPLATE_DECL(STRUCT) \
   JDERIVE_REFLECT_TEMPLATE_DECL_I(JDERIVE_TEMPLATE_I(STRUCT))
#define JDERIVE_REFLECT_TEMPLATE_DECL_I(STRUCT) JDERIVE_REFLECT_TEMPLATE_DECL_II STRUCT
#define JDERIVE_REFLECT_TEMPLATE_DECL_II(c, params, name) \
   BOOST_PP_IIF(c, JDERIVE_REFLECT_TEMPLATE_DECL_TEMPLATE, BOOST_PP_TUPLE_EAT(42))(params)
#define JDERIVE_REFLECT_TEMPLATE_DECL_TEMPLATE(params) \
   template <BOOST_PP_ENUM(BOOST_PP_VARIADIC_SIZE params, JDERIVE_REFLECT_TPL_PARAM, params)>
#define JDERIVE_REFLECT_TPL_PARAM(z, i, data) BOOST_PP_TUPLE_ELEM(i, data) T##i

#define JDERIVE_TEMPLATE_I(STRUCT) JDERIVE_TEMPLATE_II(JDERIVE_MATCH_TEMPLATE##STRUCT, 0, STRUCT)
#define JDERIVE_TEMPLATE_II(...) JDERIVE_TEMPLATE_III(__VA_ARGS__)
#define JDERIVE_TEMPLATE_III(params, n, ...) \
   BOOST_PP_IIF(n, JDERIVE_TEMPLATE_TEMPLATE, JDERIVE_TEMPLATE_NONTEMPLATE)(params, __VA_ARGS__)
#define JDERIVE_MATCH_TEMPLATEtemplate(...) (__VA_ARGS__), 1, ~

#define JDERIVE_TEMPLATE_NONTEMPLATE(blah, ...) (0, (), __VA_ARGS__)
#define JDERIVE_TEMPLATE_TEMPLATE(params, n, z, args) (1, params, JDERIVE_REMOVE_TEMPLATE##args)

#define JDERIVE_REMOVE_TEMPLATEtemplate(...)

// Get seq of items. Each result is:
//    base(type)
//    field(ident, key, defaulted, variadic)
#define JDERIVE_REFLECT_ITEMS(...) \
   JDERIVE_SEQ_TRANSFORM(JDERIVE_MATCH_ITEMS, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))
#define JDERIVE_MATCH_ITEMS(r, STRUCT, item)                                              \
   BOOST_PP_IIF(BOOST_PP_CHECK_EMPTY(item), ,                                             \
                BOOST_PP_IIF(JDERIVE_MATCH(JDERIVE_MATCH_ITEMS, item), JDERIVE_MATCHED_ITEM, \
                             JDERIVE_UNMATCHED_ITEM)(STRUCT, item))
#define JDERIVE_MATCHED_ITEM(STRUCT, item)                                           \
   JDERIVE_FIRST           JDERIVE_APPLY_FIRST(BOOST_PP_CAT(JDERIVE_MATCH_ITEMS, item)) \
       JDERIVE_SKIP_SECOND BOOST_PP_TUPLE_PUSH_FRONT(                                  \
           JDERIVE_APPLY_FIRST(BOOST_PP_CAT(JDERIVE_MATCH_ITEMS, item)), STRUCT)
#define JDERIVE_UNMATCHED_ITEM(STRUCT, member) field(member, , 0, 0)

#define JDERIVE_KEEP_BASE(_, type, ...) base(type)
#define JDERIVE_KEEP_KEY(_, ident, key) field(ident, key, 0, 0)
#define JDERIVE_KEEP_DEFAULTED(_, ident, ...) field(ident, __VA_ARGS__, 1, 0)
#define JDERIVE_KEEP_VARIADIC(_, ident, ...) field(ident, __VA_ARGS__, 0, 1)

#define JDERIVE_MATCH_ITEMSbase(...) (JDERIVE_KEEP_BASE, __VA_ARGS__), 1
#define JDERIVE_MATCH_ITEMSkey(...) (JDERIVE_KEEP_KEY, __VA_ARGS__), 1
#define JDERIVE_MATCH_ITEMSdefaulted(...) (JDERIVE_KEEP_DEFAULTED, __VA_ARGS__), 1
#define JDERIVE_MATCH_ITEMSvariadic(...) (JDERIVE_KEEP_VARIADIC, __VA_ARGS__), 1

// field(ident, key, defaulted, variadic)
#define JDERIVE_FILTER_FIELDS(seq) BOOST_PP_SEQ_FILTER(JDERIVE_FILTER_FIELDS_IMPL, _, seq)
#define JDERIVE_FILTER_FIELDS_IMPL(s, _, elem) JDERIVE_MATCH(JDERIVE_FILTER_FIELDS_IMPL, elem)
#define JDERIVE_FILTER_FIELDS_IMPLfield(...) , 1

#define JDERIVE_REFLECT_FIELDS(...) JDERIVE_FILTER_FIELDS(JDERIVE_REFLECT_ITEMS(__VA_ARGS__))

// base(type)
#define JDERIVE_FILTER_BASES(seq) BOOST_PP_SEQ_FILTER(JDERIVE_FILTER_BASES_IMPL, _, seq)
#define JDERIVE_FILTER_BASES_IMPL(s, _, elem) JDERIVE_MATCH(JDERIVE_FILTER_BASES_IMPL, elem)
#define JDERIVE_FILTER_BASES_IMPLbase(...) , 1

#define JDERIVE_REFLECT_BASES(...) JDERIVE_FILTER_BASES(JDERIVE_REFLECT_ITEMS(__VA_ARGS__))

#define JDERIVE_GET_IDENT(x) BOOST_PP_CAT(JDERIVE_GET_IDENT, x)
#define JDERIVE_GET_IDENTfield(ident, key, defaulted, variadic) ident

#define JDERIVE_GET_FIELD_INFO(x) BOOST_PP_CAT(JDERIVE_GET_FIELD_INFO, x)
#define JDERIVE_GET_FIELD_INFOfield(ident, key, defaulted, variadic)                          \
   ::jderive::field_info                                                                       \
   {                                                                                           \
      BOOST_PP_STRINGIZE(ident), ::jderive::make_annotation(key), defaulted != 0, variadic != 0 \
   }

#define JDERIVE_GET_BASE(x) BOOST_PP_CAT(JDERIVE_GET_BASE, x)
#define JDERIVE_GET_BASEbase(type) type

#define JDERIVE_MEMBER_POINTER(r, TYPE, i, elem) \
   BOOST_PP_COMMA_IF(i) & TYPE::JDERIVE_GET_IDENT(elem)
#define JDERIVE_FIELD_INFO(r, STRUCT, i, elem) BOOST_PP_COMMA_IF(i) JDERIVE_GET_FIELD_INFO(elem)
#define JDERIVE_BASE_TYPE(r, STRUCT, i, elem) BOOST_PP_COMMA_IF(i) JDERIVE_GET_BASE(elem)
#define JDERIVE_ALTERNATIVE_TYPE(r, STRUCT, i, elem) BOOST_PP_COMMA_IF(i) JDERIVE_GET_IDENT(elem)

#define JDERIVE_REFLECT_IMPL(STRUCT) BOOST_PP_CAT(jderive_reflect_impl_, JDERIVE_REFLECT_NAME(STRUCT))

#define JDERIVE_REFLECT_GETTER(STRUCT)                                        \
   JDERIVE_REFLECT_TEMPLATE_DECL(STRUCT)                                      \
   JDERIVE_REFLECT_IMPL(STRUCT)<JDERIVE_REFLECT_TYPE(STRUCT)>                 \
   jderive_get_reflect_impl(JDERIVE_REFLECT_TYPE(STRUCT)*, ::jderive::ReflectDummyParam*);

/**
 * JDERIVE_REFLECT(<struct>, <field or base>...)
 * Declares a product type. Each parameter may be one of the following:
 *    * ident                          field serialized under its own name
 *    * key(ident, "k")                field serialized under "k"
 *    * defaulted(ident[, "k"])        field that may be absent; absent reads give the
 *                                     value a default-constructed <struct> holds, and
 *                                     that value is omitted on write
 *    * variadic(ident[, "k"])         trailing repeated field, a std::vector
 *    * base(type)                     sum type this struct is an alternative of
 * Fields are passed to the constructor in the order listed.
 *
 * A class template is reflected once for all its arguments:
 *    JDERIVE_REFLECT(template(typename, typename) Pair, first, second)
 */
#define JDERIVE_REFLECT(STRUCT, ...)                                                           \
   template <typename ReflectedType>                                                          \
   struct JDERIVE_REFLECT_IMPL(STRUCT)                                                        \
   {                                                                                          \
      static constexpr bool        is_defined   = true;                                       \
      static constexpr bool        is_struct    = true;                                       \
      static constexpr bool        is_sum       = false;                                      \
      static constexpr bool        is_singleton = false;                                      \
      static constexpr const char* name = BOOST_PP_STRINGIZE(JDERIVE_REFLECT_NAME(STRUCT));  \
      using data_members                = ::jderive::MemberList<JDERIVE_SEQ_FOR_EACH_I(       \
          JDERIVE_MEMBER_POINTER, ReflectedType, JDERIVE_REFLECT_FIELDS(__VA_ARGS__))>;        \
      using bases = ::jderive::TypeList<JDERIVE_SEQ_FOR_EACH_I(                                \
          JDERIVE_BASE_TYPE, _, JDERIVE_REFLECT_BASES(__VA_ARGS__))>;                          \
      static constexpr auto fields()                                                          \
      {                                                                                       \
         return ::jderive::make_fields(JDERIVE_SEQ_FOR_EACH_I(                                 \
             JDERIVE_FIELD_INFO, _, JDERIVE_REFLECT_FIELDS(__VA_ARGS__)));                     \
      }                                                                                       \
   };                                                                                         \
   JDERIVE_REFLECT_GETTER(STRUCT)

/**
 * JDERIVE_REFLECT_SUM(<abstract base>, <alternative or base>...)
 * Declares a closed sum type: the listed alternatives are all the types a value
 * may have. Each alternative must derive from the base and name it with base(...)
 * in its own reflection. A sum may itself be an alternative of another sum.
 */
#define JDERIVE_REFLECT_SUM(STRUCT, ...)                                                    \
   template <typename ReflectedType>                                                       \
   struct JDERIVE_REFLECT_IMPL(STRUCT)                                                     \
   {                                                                                       \
      static constexpr bool        is_defined   = true;                                    \
      static constexpr bool        is_struct    = false;                                   \
      static constexpr bool        is_sum       = true;                                    \
      static constexpr bool        is_singleton = false;                                   \
      static constexpr const char* name = BOOST_PP_STRINGIZE(JDERIVE_REFLECT_NAME(STRUCT)); \
      using alternatives                = ::jderive::TypeList<JDERIVE_SEQ_FOR_EACH_I(       \
          JDERIVE_ALTERNATIVE_TYPE, _, JDERIVE_REFLECT_FIELDS(__VA_ARGS__))>;               \
      using bases = ::jderive::TypeList<JDERIVE_SEQ_FOR_EACH_I(                             \
          JDERIVE_BASE_TYPE, _, JDERIVE_REFLECT_BASES(__VA_ARGS__))>;                       \
   };                                                                                      \
   JDERIVE_REFLECT_GETTER(STRUCT)

/**
 * JDERIVE_REFLECT_SINGLETON(<struct>, base(type)...)
 * Declares a type with no fields and a single value, the default-constructed one.
 */
#define JDERIVE_REFLECT_SINGLETON(STRUCT, ...)                                              \
   template <typename ReflectedType>                                                       \
   struct JDERIVE_REFLECT_IMPL(STRUCT)                                                     \
   {                                                                                       \
      static constexpr bool        is_defined   = true;                                    \
      static constexpr bool        is_struct    = false;                                   \
      static constexpr bool        is_sum       = false;                                   \
      static constexpr bool        is_singleton = true;                                    \
      static constexpr const char* name = BOOST_PP_STRINGIZE(JDERIVE_REFLECT_NAME(STRUCT)); \
      using bases                       = ::jderive::TypeList<JDERIVE_SEQ_FOR_EACH_I(       \
          JDERIVE_BASE_TYPE, _, JDERIVE_REFLECT_BASES(__VA_ARGS__))>;                       \
   };                                                                                      \
   JDERIVE_REFLECT_GETTER(STRUCT)
