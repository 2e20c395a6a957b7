#include <jderive/check.hpp>
#include <jderive/tree.hpp>

namespace jderive
{
   std::string_view kind_to_str(tree_kind k)
   {
      switch (k)
      {
            // clang-format off
         case tree_kind::null:    return "null";
         case tree_kind::boolean: return "boolean";
         case tree_kind::number:  return "number";
         case tree_kind::string:  return "string";
         case tree_kind::array:   return "array";
         case tree_kind::object:  return "object";
            // clang-format on

         default:
            return "unknown";
      }
   }

   tree::tree() {}
   tree::tree(std::nullptr_t) {}
   tree::tree(bool value) : value(value) {}
   tree::tree(std::string value) : value(std::move(value)) {}
   tree::tree(std::string_view value) : value(std::string(value)) {}
   tree::tree(const char* value) : value(std::string(value)) {}
   tree::tree(tree_number value) : value(std::move(value)) {}
   tree::tree(array value) : value(std::move(value)) {}
   tree::tree(object value) : value(std::move(value)) {}

   tree::tree(const tree&)                = default;
   tree::tree(tree&&) noexcept            = default;
   tree& tree::operator=(const tree&)     = default;
   tree& tree::operator=(tree&&) noexcept = default;
   tree::~tree()                          = default;

   tree tree::number(std::string text)
   {
      return tree{tree_number{std::move(text)}};
   }

   tree_kind tree::kind() const
   {
      return static_cast<tree_kind>(value.index());
   }

   bool tree::as_bool() const
   {
      auto* b = std::get_if<bool>(&value);
      check(b != nullptr, conversion_errc::expected_bool);
      return *b;
   }

   const std::string& tree::number_text() const
   {
      auto* n = std::get_if<tree_number>(&value);
      check(n != nullptr, conversion_errc::expected_number);
      return n->text;
   }

   const std::string& tree::as_string() const
   {
      auto* s = std::get_if<std::string>(&value);
      check(s != nullptr, conversion_errc::expected_string);
      return *s;
   }

   tree::array& tree::as_array()
   {
      auto* a = std::get_if<array>(&value);
      check(a != nullptr, conversion_errc::expected_array);
      return *a;
   }

   const tree::array& tree::as_array() const
   {
      auto* a = std::get_if<array>(&value);
      check(a != nullptr, conversion_errc::expected_array);
      return *a;
   }

   tree::object& tree::as_object()
   {
      auto* o = std::get_if<object>(&value);
      check(o != nullptr, conversion_errc::expected_object);
      return *o;
   }

   const tree::object& tree::as_object() const
   {
      auto* o = std::get_if<object>(&value);
      check(o != nullptr, conversion_errc::expected_object);
      return *o;
   }

   const tree* tree::find(std::string_view key) const
   {
      for (const auto& member : as_object())
      {
         if (member.key == key)
            return &member.value;
      }
      return nullptr;
   }

   tree* tree::find(std::string_view key)
   {
      for (auto& member : as_object())
      {
         if (member.key == key)
            return &member.value;
      }
      return nullptr;
   }

   tree& tree::emplace(std::string key, tree v)
   {
      auto& members = as_object();
      members.push_back(tree_member{std::move(key), std::move(v)});
      return members.back().value;
   }

   tree& tree::push_back(tree v)
   {
      auto& elements = as_array();
      elements.push_back(std::move(v));
      return elements.back();
   }

   bool operator==(const tree& a, const tree& b)
   {
      return a.value == b.value;
   }
}  // namespace jderive
