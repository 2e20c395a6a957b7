#pragma once

#include <jderive/builtin.hpp>
#include <jderive/check.hpp>
#include <jderive/field_plan.hpp>
#include <jderive/session.hpp>
#include <jderive/shape.hpp>
#include <jderive/tagging.hpp>

#include <boost/core/demangle.hpp>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <typeinfo>
#include <utility>
#include <vector>

namespace jderive
{
   /// Runs `f`. Anything it throws other than a conversion_error is reported as
   /// invalid_value naming `type`, with the original exception as the cause.
   template <typename F>
   auto expect_decoded(std::string_view type, F&& f)
   {
      try
      {
         return f();
      }
      catch (const conversion_error&)
      {
         throw;
      }
      catch (const std::exception&)
      {
         abort_error(conversion_errc::invalid_value, std::string(type), std::current_exception());
      }
   }

   // Product types

   /// Everything a product's reader and writer need besides the field cells
   template <typename T>
   struct product_state
   {
      std::string                name;
      std::optional<std::string> tag;
      std::vector<std::string>   keys;
      std::shared_ptr<const T>   prototype;  // holds the defaults; null without defaulted fields
      bool                       omit_defaults        = true;
      bool                       allow_unknown_fields = true;
   };

   template <typename T, std::size_t I>
   using field_type_t = member_type<member_at<T, I>>;

   template <typename T, std::size_t I, typename Cell>
   field_type_t<T, I> read_field(const product_state<T>& state, const Cell& cell, const tree& object)
   {
      constexpr field_info info = reflect<T>::fields()[I];
      const auto&          key  = state.keys[I];
      if (auto* found = object.find(key))
      {
         try
         {
            if constexpr (info.variadic)
            {
               field_type_t<T, I> result;
               for (const auto& item : found->as_array())
                  result.push_back(cell.read(item));
               return result;
            }
            else
            {
               return field_type_t<T, I>(cell.read(*found));
            }
         }
         catch (const std::exception&)
         {
            abort_error(conversion_errc::field_type, key, std::current_exception());
         }
      }
      if constexpr (info.defaulted)
         return get_member<member_at<T, I>>(*state.prototype);
      else
         abort_error(conversion_errc::missing_field, key);
   }

   template <typename T>
   constexpr bool compare_directly =
       std::is_arithmetic_v<T> || std::is_enum_v<T> || std::is_same_v<T, std::string>;

   /// Scalars and strings compare with ==, everything else by its encoding
   template <typename V, typename Cell>
   bool equals_default(const Cell& cell, const V& value, const V& def, const tree& encoded)
   {
      if constexpr (compare_directly<V>)
         return value == def;
      else
         return encoded == cell.write(def);
   }

   template <typename T, std::size_t I, typename Cell>
   void write_field(const product_state<T>& state, const Cell& cell, const T& value, tree& out)
   {
      constexpr auto       member = member_at<T, I>;
      constexpr field_info info   = reflect<T>::fields()[I];
      const auto&          field  = get_member<member>(value);
      if constexpr (info.variadic)
      {
         auto items = tree::make_array();
         for (const auto& item : field)
            items.push_back(cell.write(item));
         out.emplace(state.keys[I], std::move(items));
      }
      else
      {
         auto encoded = cell.write(field);
         if constexpr (info.defaulted)
         {
            if (state.omit_defaults &&
                equals_default<field_type_t<T, I>>(cell, field,
                                                   get_member<member>(*state.prototype), encoded))
               return;
         }
         out.emplace(state.keys[I], std::move(encoded));
      }
   }

   /// Applies T's constructor to the field values in order; braces when they work
   template <typename T, typename Values, std::size_t... I>
   T construct(Values&& values, std::index_sequence<I...>)
   {
      if constexpr (brace_constructible<T, std::tuple_element_t<I, Values>...>)
         return T{std::get<I>(std::move(values))...};
      else
         return T(std::get<I>(std::move(values))...);
   }

   template <typename T, std::size_t... I>
   converter_pair<T> synthesize_product(derivation_session& session, std::index_sequence<I...>)
   {
      auto shape = classify<T>();
      auto state = std::make_shared<product_state<T>>();
      state->name                 = shape.name;
      state->tag                  = shape.tag;
      state->omit_defaults        = session.options().omit_defaults;
      state->allow_unknown_fields = session.options().allow_unknown_fields;
      for (const auto& field : shape.fields)
         state->keys.push_back(field.serialized_name);
      if constexpr (std::is_default_constructible_v<T>)
      {
         if (any_defaulted<T>())
            state->prototype = std::make_shared<T>();
      }

      auto cells = std::tuple{&session.bind<field_value_t<T, I>>()...};

      std::shared_ptr<const product_state<T>> shared = std::move(state);
      return {
          [shared, cells](const tree& value)
          {
             const auto& s    = *shared;
             const tree& body = s.tag ? untag(value, *s.tag) : value;
             check(body.is_object(), conversion_errc::expected_object, s.name);
             if (!s.allow_unknown_fields)
             {
                for (const auto& member : body.as_object())
                   check(std::find(s.keys.begin(), s.keys.end(), member.key) != s.keys.end(),
                         conversion_errc::unexpected_field, member.key);
             }
             std::tuple<field_type_t<T, I>...> values{
                 read_field<T, I>(s, *std::get<I>(cells), body)...};
             return expect_decoded(s.name, [&]
                                   { return construct<T>(std::move(values),
                                                         std::index_sequence<I...>{}); });
          },
          [shared, cells](const T& value)
          {
             const auto& s      = *shared;
             auto        result = tree::make_object();
             (write_field<T, I>(s, *std::get<I>(cells), value, result), ...);
             if (s.tag)
                return tag_value(*s.tag, std::move(result));
             return result;
          },
      };
   }

   // Sum types

   /// One alternative of sum type S
   template <typename S>
   struct variant_entry
   {
      std::string                                    name;
      std::vector<std::string>                       tags;  // every tag this alternative reads
      std::function<std::unique_ptr<S>(const tree&)> read;
      std::function<bool(const S&)>                  matches;
      std::function<tree(const S&)>                  write;
   };

   template <typename... A>
   std::vector<std::string> accepted_tags(TypeList<A...>*);

   /// Tags a value of A may carry: its own, or for a nested sum those of all
   /// of its alternatives
   template <typename A>
   std::vector<std::string> accepted_tags()
   {
      if constexpr (reflect<A>::is_sum)
         return accepted_tags((typename reflect<A>::alternatives*)nullptr);
      else
         return {tag_of<A>()};
   }

   template <typename... A>
   std::vector<std::string> accepted_tags(TypeList<A...>*)
   {
      std::vector<std::string> result;
      auto append = [&](std::vector<std::string> tags)
      { result.insert(result.end(), tags.begin(), tags.end()); };
      (append(accepted_tags<A>()), ...);
      return result;
   }

   template <typename S, typename A>
   constexpr bool declares_base()
   {
      if constexpr (reflect<A>::is_defined)
         return lists_base<S>((typename reflect<A>::bases*)nullptr);
      else
         return false;
   }

   template <typename S, typename A>
   variant_entry<S> make_variant_entry(derivation_session& session)
   {
      static_assert(std::is_base_of_v<S, A>, "alternatives of a sum type must derive from it");
      static_assert(declares_base<S, A>(),
                    "alternatives of a sum type must name it with base(...) in their reflection");

      auto*            cell = &session.bind<A>();
      variant_entry<S> entry;
      entry.name = type_name<A>();
      entry.tags = accepted_tags<A>();
      if constexpr (reflect<A>::is_sum)
      {
         entry.read    = [cell](const tree& value) -> std::unique_ptr<S>
         { return cell->read(value); };
         entry.matches = [](const S& value) { return dynamic_cast<const A*>(&value) != nullptr; };
      }
      else
      {
         entry.read    = [cell](const tree& value) -> std::unique_ptr<S>
         { return std::make_unique<A>(cell->read(value)); };
         entry.matches = [](const S& value) { return typeid(value) == typeid(A); };
      }
      entry.write = [cell](const S& value) { return cell->write(static_cast<const A&>(value)); };
      return entry;
   }

   template <typename S, typename... A>
   std::vector<variant_entry<S>> enumerate_variants(derivation_session& session, TypeList<A...>*)
   {
      std::vector<variant_entry<S>> entries;
      (entries.push_back(make_variant_entry<S, A>(session)), ...);
      return entries;
   }

   /// The alternatives of sum type S in declaration order, each with its converter
   /// bound through the session. Throws derivation_error(duplicate_key) when two
   /// alternatives read the same tag.
   template <typename S>
   std::vector<variant_entry<S>> enumerate_variants(derivation_session& session)
   {
      auto entries =
          enumerate_variants<S>(session, (typename reflect<S>::alternatives*)nullptr);
      std::set<std::string_view> seen;
      for (const auto& entry : entries)
         for (const auto& tag : entry.tags)
            check(seen.insert(tag).second, derivation_errc::duplicate_key, type_name<S>(), tag);
      return entries;
   }

   template <typename S>
   converter_pair<S> synthesize_sum(derivation_session& session)
   {
      static_assert(is_sum_base<S>, "jderive: sum types need a virtual destructor");
      classify<S>();
      std::shared_ptr<const std::vector<variant_entry<S>>> entries =
          std::make_shared<std::vector<variant_entry<S>>>(enumerate_variants<S>(session));
      return {
          [entries](const tree& value) -> std::unique_ptr<S>
          {
             const auto& tag = peek_tag(value);
             for (const auto& entry : *entries)
                if (std::find(entry.tags.begin(), entry.tags.end(), tag) != entry.tags.end())
                   return entry.read(value);
             abort_error(conversion_errc::unknown_variant, tag);
          },
          [entries](const S& value) -> tree
          {
             for (const auto& entry : *entries)
                if (entry.matches(value))
                   return entry.write(value);
             abort_error(conversion_errc::unknown_variant,
                         portable_type_name(boost::core::demangle(typeid(value).name())));
          },
      };
   }

   template <typename T>
   converter_pair<T> synthesize_singleton(derivation_session&)
   {
      auto tag = classify<T>().tag;
      return {
          [tag](const tree& value)
          {
             if (tag)
                untag(value, *tag);
             return T{};
          },
          [tag](const T&)
          {
             if (tag)
                return tag_value(*tag, tree::make_object());
             return tree::make_object();
          },
      };
   }

   /// Builds the reader and writer of T. Converters of the types T refers to are
   /// obtained from the session, never built here directly.
   template <typename T>
   converter_pair<T> synthesize(derivation_session& session)
   {
      if constexpr (reflect<T>::is_sum)
      {
         return synthesize_sum<T>(session);
      }
      else if constexpr (reflect<T>::is_singleton)
      {
         return synthesize_singleton<T>(session);
      }
      else if constexpr (reflect<T>::is_struct)
      {
         if constexpr (has_constructor<T> && has_deconstructor<T>)
         {
            return synthesize_product<T>(session, std::make_index_sequence<field_count<T>>{});
         }
         else
         {
            classify<T>();
            abort_error(derivation_errc::no_constructor, type_name<T>());
         }
      }
      else if constexpr (is_open_hierarchy<T>)
      {
         classify<T>();
         abort_error(derivation_errc::not_sealed, type_name<T>());
      }
      else
      {
         classify<T>();
         return builtin_converter<T>(session);
      }
   }
}  // namespace jderive
