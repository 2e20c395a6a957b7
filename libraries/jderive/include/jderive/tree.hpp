#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jderive
{
   enum class tree_kind : std::uint8_t
   {
      null,
      boolean,
      number,
      string,
      array,
      object,
   };

   std::string_view kind_to_str(tree_kind k);

   /// A number is kept as its decimal text so that 64-bit integers survive
   /// unchanged. Conversion to a C++ arithmetic type happens in the reader.
   struct tree_number
   {
      std::string text;
      friend bool operator==(const tree_number&, const tree_number&) = default;
   };

   struct tree_member;

   /// Generic tree value: the model every derived converter reads and writes.
   /// Object members keep their insertion order.
   class tree
   {
     public:
      using array  = std::vector<tree>;
      using object = std::vector<tree_member>;

      tree();
      tree(std::nullptr_t);
      tree(bool value);
      tree(std::string value);
      tree(std::string_view value);
      tree(const char* value);
      explicit tree(tree_number value);
      explicit tree(array value);
      explicit tree(object value);

      tree(const tree&);
      tree(tree&&) noexcept;
      tree& operator=(const tree&);
      tree& operator=(tree&&) noexcept;
      ~tree();

      static tree number(std::string text);
      static tree make_array() { return tree{array{}}; }
      static tree make_object() { return tree{object{}}; }

      tree_kind kind() const;

      bool is_null() const { return kind() == tree_kind::null; }
      bool is_bool() const { return kind() == tree_kind::boolean; }
      bool is_number() const { return kind() == tree_kind::number; }
      bool is_string() const { return kind() == tree_kind::string; }
      bool is_array() const { return kind() == tree_kind::array; }
      bool is_object() const { return kind() == tree_kind::object; }

      // The accessors below throw conversion_error when the kind does not match
      bool               as_bool() const;
      const std::string& number_text() const;
      const std::string& as_string() const;
      array&             as_array();
      const array&       as_array() const;
      object&            as_object();
      const object&      as_object() const;

      /// First member with the given key, or nullptr. Requires an object.
      const tree* find(std::string_view key) const;
      tree*       find(std::string_view key);

      /// Appends a member. Requires an object.
      tree& emplace(std::string key, tree value);

      /// Appends an element. Requires an array.
      tree& push_back(tree value);

      friend bool operator==(const tree& a, const tree& b);

     private:
      std::variant<std::monostate, bool, tree_number, std::string, array, object> value;
   };

   struct tree_member
   {
      std::string key;
      tree        value;

      friend bool operator==(const tree_member&, const tree_member&) = default;
   };
}  // namespace jderive
