#pragma once

#include <jderive/check.hpp>
#include <jderive/session.hpp>
#include <jderive/tagging.hpp>
#include <jderive/tree.hpp>
#include <jderive/type_name.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jderive
{
   /// Parses decimal integer text, rejecting anything out of T's range
   template <typename T>
   T parse_int(std::string_view text)
   {
      auto pos    = text.data();
      auto end    = pos + text.size();
      bool found  = false;
      T    result = 0;
      T    limit;
      T    sign;
      if (std::is_signed_v<T> && pos != end && *pos == '-')
      {
         ++pos;
         sign  = -1;
         limit = std::numeric_limits<T>::min();
      }
      else
      {
         sign  = 1;
         limit = std::numeric_limits<T>::max();
      }
      while (pos != end && *pos >= '0' && *pos <= '9')
      {
         T digit = (*pos++ - '0');
         // abs(result) can overflow.  Use -abs(result) instead.
         if (std::is_signed_v<T> && (-sign * limit + digit) / 10 > -sign * result)
            abort_error(conversion_errc::number_out_of_range, std::string(text));
         if (!std::is_signed_v<T> && (limit - digit) / 10 < result)
            abort_error(conversion_errc::number_out_of_range, std::string(text));
         result = result * 10 + sign * digit;
         found  = true;
      }
      if (pos != end || !found)
         abort_error(conversion_errc::expected_int, std::string(text));
      return result;
   }

   /// Accepts "NaN", "Infinity" and "-Infinity" as well as decimal text.
   /// Subnormal values are in range; values that round to zero or overflow are not.
   template <typename T>
   T parse_float(const std::string& text)
   {
      auto begin     = text.data();
      auto end       = begin + text.size();
      T    result    = 0;
      auto [pos, ec] = std::from_chars(begin, end, result);
      check(ec != std::errc::result_out_of_range, conversion_errc::number_out_of_range, text);
      check(ec == std::errc{} && pos == end && begin != end, conversion_errc::expected_number,
            text);
      bool named    = text.find_first_of("iInN") != std::string::npos;
      auto mantissa = std::string_view(text).substr(0, text.find_first_of("eE"));
      check(named || !std::isinf(result), conversion_errc::number_out_of_range, text);
      check(result != 0 || mantissa.find_first_of("123456789") == std::string_view::npos,
            conversion_errc::number_out_of_range, text);
      return result;
   }

   /// Numbers may also arrive as strings, the way 64-bit values usually travel
   inline const std::string& numeric_text(const tree& value)
   {
      if (value.is_string())
         return value.as_string();
      return value.number_text();
   }

   template <typename T>
   tree write_float(T value)
   {
      if (std::isnan(value))
         return tree{"NaN"};
      if (std::isinf(value))
         return tree{value < 0 ? "-Infinity" : "Infinity"};
      char buf[64];
      auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
      check(ec == std::errc{}, conversion_errc::invalid_value, type_name<T>());
      return tree::number(std::string(buf, end));
   }

   template <typename T, typename U>
   T read_owned(const knot_cell<U>& cell, const tree& value)
   {
      if constexpr (!std::is_same_v<read_result_t<U>, U>)
         return T(cell.read(value));
      else if constexpr (is_std_shared_ptr_v<T>)
         return std::make_shared<U>(cell.read(value));
      else
         return std::make_unique<U>(cell.read(value));
   }

   template <typename... T, std::size_t... I>
   converter_pair<std::tuple<T...>> tuple_converter(derivation_session& session,
                                                    std::index_sequence<I...>)
   {
      auto cells = std::tuple{&session.bind<T>()...};
      return {
          [cells](const tree& value)
          {
             const auto& items = value.as_array();
             check(items.size() == sizeof...(T), conversion_errc::array_size_mismatch,
                   type_name<std::tuple<T...>>());
             return std::tuple<T...>{std::get<I>(cells)->read(items[I])...};
          },
          [cells](const std::tuple<T...>& value)
          {
             return tree{tree::array{std::get<I>(cells)->write(std::get<I>(value))...}};
          },
      };
   }

   template <typename V, std::size_t I>
   bool read_alternative(const knot_cell<std::variant_alternative_t<I, V>>& cell,
                         const std::string&                                 tag,
                         const tree&                                        payload,
                         std::optional<V>&                                  result)
   {
      if (tag != type_name<std::variant_alternative_t<I, V>>())
         return false;
      result.emplace(std::in_place_index<I>, cell.read(payload));
      return true;
   }

   template <typename... T, std::size_t... I>
   converter_pair<std::variant<T...>> variant_converter(derivation_session& session,
                                                        std::index_sequence<I...>)
   {
      using V    = std::variant<T...>;
      auto cells = std::tuple{&session.bind<T>()...};
      return {
          [cells](const tree& value)
          {
             const auto&      tag     = peek_tag(value);
             const auto&      payload = value.as_object().front().value;
             std::optional<V> result;
             (void)(read_alternative<V, I>(*std::get<I>(cells), tag, payload, result) || ...);
             if (!result)
                abort_error(conversion_errc::unknown_variant, tag);
             return std::move(*result);
          },
          [cells](const V& value)
          {
             tree result;
             ((value.index() == I
                   ? (void)(result = tag_value(type_name<T>(),
                                               std::get<I>(cells)->write(std::get<I>(value))))
                   : (void)0),
              ...);
             return result;
          },
      };
   }

   /// Readers and writers of arithmetic, enum and standard library types.
   /// Element converters are bound through the session, so containers of
   /// reflected types work and share cells with everything else.
   template <typename T>
   converter_pair<T> builtin_converter(derivation_session& session)
   {
      if constexpr (std::is_same_v<T, tree>)
      {
         return {
             [](const tree& value) { return value; },
             [](const tree& value) { return value; },
         };
      }
      else if constexpr (std::is_same_v<T, bool>)
      {
         return {
             [](const tree& value) { return value.as_bool(); },
             [](const bool& value) { return tree{value}; },
         };
      }
      else if constexpr (std::is_integral_v<T>)
      {
         return {
             [](const tree& value) { return parse_int<T>(numeric_text(value)); },
             [](const T& value) { return tree::number(std::to_string(value)); },
         };
      }
      else if constexpr (std::is_floating_point_v<T>)
      {
         return {
             [](const tree& value) { return parse_float<T>(numeric_text(value)); },
             [](const T& value) { return write_float(value); },
         };
      }
      else if constexpr (std::is_enum_v<T>)
      {
         using U    = std::underlying_type_t<T>;
         auto* cell = &session.bind<U>();
         return {
             [cell](const tree& value) { return static_cast<T>(cell->read(value)); },
             [cell](const T& value) { return cell->write(static_cast<U>(value)); },
         };
      }
      else if constexpr (std::is_same_v<T, std::string>)
      {
         return {
             [](const tree& value) { return value.as_string(); },
             [](const std::string& value) { return tree{value}; },
         };
      }
      else if constexpr (is_std_vector_v<T>)
      {
         using E = typename is_std_vector<T>::value_type;
         static_assert(!reflect<E>::is_sum, "use std::vector<std::unique_ptr<sum type>>");
         auto* cell = &session.bind<E>();
         return {
             [cell](const tree& value)
             {
                T result;
                for (const auto& item : value.as_array())
                   result.push_back(cell->read(item));
                return result;
             },
             [cell](const T& value)
             {
                auto result = tree::make_array();
                for (const auto& item : value)
                   result.push_back(cell->write(item));
                return result;
             },
         };
      }
      else if constexpr (is_std_array_v<T>)
      {
         using E    = typename is_std_array<T>::value_type;
         auto* cell = &session.bind<E>();
         return {
             [cell](const tree& value)
             {
                const auto& items = value.as_array();
                check(items.size() == is_std_array<T>::size, conversion_errc::array_size_mismatch,
                      type_name<T>());
                T result{};
                for (std::size_t i = 0; i < items.size(); ++i)
                   result[i] = cell->read(items[i]);
                return result;
             },
             [cell](const T& value)
             {
                auto result = tree::make_array();
                for (const auto& item : value)
                   result.push_back(cell->write(item));
                return result;
             },
         };
      }
      else if constexpr (is_std_optional_v<T>)
      {
         using E    = typename is_std_optional<T>::value_type;
         auto* cell = &session.bind<E>();
         return {
             [cell](const tree& value) -> T
             {
                if (value.is_null())
                   return std::nullopt;
                return cell->read(value);
             },
             [cell](const T& value)
             {
                if (!value)
                   return tree{};
                return cell->write(*value);
             },
         };
      }
      else if constexpr (is_std_unique_ptr_v<T> || is_std_shared_ptr_v<T>)
      {
         using E    = typename T::element_type;
         auto* cell = &session.bind<E>();
         return {
             [cell](const tree& value) -> T
             {
                if (value.is_null())
                   return nullptr;
                return read_owned<T>(*cell, value);
             },
             [cell](const T& value)
             {
                if (!value)
                   return tree{};
                return cell->write(*value);
             },
         };
      }
      else if constexpr (is_std_pair_v<T>)
      {
         auto* first  = &session.bind<typename T::first_type>();
         auto* second = &session.bind<typename T::second_type>();
         return {
             [first, second](const tree& value)
             {
                check(value.is_object(), conversion_errc::expected_object, type_name<T>());
                auto* f = value.find("first");
                auto* s = value.find("second");
                check(f != nullptr, conversion_errc::missing_field, "first");
                check(s != nullptr, conversion_errc::missing_field, "second");
                return T{first->read(*f), second->read(*s)};
             },
             [first, second](const T& value)
             {
                auto result = tree::make_object();
                result.emplace("first", first->write(value.first));
                result.emplace("second", second->write(value.second));
                return result;
             },
         };
      }
      else if constexpr (is_std_map_v<T>)
      {
         using K    = typename is_std_map<T>::key_type;
         using V = typename is_std_map<T>::mapped_type;
         if constexpr (std::is_same_v<K, std::string>)
         {
            // {"key": value, ...}
            auto* cell = &session.bind<V>();
            return {
                [cell](const tree& value)
                {
                   check(value.is_object(), conversion_errc::expected_object, type_name<T>());
                   T result;
                   for (const auto& member : value.as_object())
                      result.insert_or_assign(member.key, cell->read(member.value));
                   return result;
                },
                [cell](const T& value)
                {
                   auto result = tree::make_object();
                   for (const auto& [k, v] : value)
                      result.emplace(k, cell->write(v));
                   return result;
                },
            };
         }
         else
         {
            // [{"first": key, "second": value}, ...]
            auto* entries = &session.bind<std::pair<K, V>>();
            return {
                [entries](const tree& value)
                {
                   T result;
                   for (const auto& item : value.as_array())
                   {
                      auto entry = entries->read(item);
                      result.insert_or_assign(std::move(entry.first), std::move(entry.second));
                   }
                   return result;
                },
                [entries](const T& value)
                {
                   auto result = tree::make_array();
                   for (const auto& [k, v] : value)
                      result.push_back(entries->write(std::pair<K, V>{k, v}));
                   return result;
                },
            };
         }
      }
      else if constexpr (is_std_tuple_v<T>)
      {
         return []<typename... E>(derivation_session& s, std::tuple<E...>*)
         {
            return tuple_converter<E...>(s, std::index_sequence_for<E...>{});
         }(session, static_cast<T*>(nullptr));
      }
      else if constexpr (is_std_variant_v<T>)
      {
         return []<typename... E>(derivation_session& s, std::variant<E...>*)
         {
            return variant_converter<E...>(s, std::index_sequence_for<E...>{});
         }(session, static_cast<T*>(nullptr));
      }
      else
      {
         static_assert(!std::is_same_v<T, T>, "jderive: no converter for this type");
      }
   }
}  // namespace jderive
