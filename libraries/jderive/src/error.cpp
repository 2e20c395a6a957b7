#include <jderive/error.hpp>

namespace jderive
{
   std::string_view error_to_str(derivation_errc e)
   {
      switch (e)
      {
            // clang-format off
         case derivation_errc::not_sealed:           return "Sum type is not sealed";
         case derivation_errc::no_variants:          return "Sum type has no alternatives";
         case derivation_errc::no_constructor:       return "No constructor accepting the reflected fields";
         case derivation_errc::no_deconstructor:     return "No deconstructor for the reflected fields";
         case derivation_errc::malformed_annotation: return "Key annotation is not a string literal";
         case derivation_errc::duplicate_key:        return "Duplicate serialized key";
         case derivation_errc::misplaced_variadic:   return "Variadic field must be the last field";
         case derivation_errc::anonymous_tag:        return "Sum alternative in an anonymous namespace has no stable tag";
            // clang-format on

         default:
            return "unknown";
      }
   }

   std::string_view remediation_hint(derivation_errc e)
   {
      switch (e)
      {
            // clang-format off
         case derivation_errc::not_sealed:           return "declare the alternatives with JDERIVE_REFLECT_SUM";
         case derivation_errc::no_variants:          return "list at least one alternative in JDERIVE_REFLECT_SUM; alternatives must be visible where the sum is reflected";
         case derivation_errc::no_constructor:       return "add a constructor taking the reflected fields in order (and a default constructor when fields are defaulted)";
         case derivation_errc::no_deconstructor:     return "reflect data members or const getters taking no arguments";
         case derivation_errc::malformed_annotation: return "pass a string literal to key(...) or JDERIVE_KEY";
         case derivation_errc::duplicate_key:        return "give every field, and every alternative of a sum, a distinct key";
         case derivation_errc::misplaced_variadic:   return "mark at most one field variadic(...) and reflect it last";
         case derivation_errc::anonymous_tag:        return "give the alternative a JDERIVE_KEY or move it to a named namespace";
            // clang-format on

         default:
            return "";
      }
   }

   std::string_view error_to_str(conversion_errc e)
   {
      switch (e)
      {
            // clang-format off
         case conversion_errc::expected_object:     return "Expected object";
         case conversion_errc::missing_field:       return "Missing field";
         case conversion_errc::field_type:          return "Invalid value for field";
         case conversion_errc::unknown_variant:     return "Unknown variant";
         case conversion_errc::expected_tagged:     return R"(Expected tagged object: {"tag": value})";
         case conversion_errc::expected_null:       return "Expected null";
         case conversion_errc::expected_bool:       return "Expected true or false";
         case conversion_errc::expected_number:     return "Expected number";
         case conversion_errc::expected_int:        return "Expected integer";
         case conversion_errc::number_out_of_range: return "number is out of range";
         case conversion_errc::expected_string:     return "Expected string";
         case conversion_errc::expected_array:      return "Expected array";
         case conversion_errc::array_size_mismatch: return "Array has the wrong number of elements";
         case conversion_errc::unexpected_field:    return "Unexpected field";
         case conversion_errc::invalid_value:       return "Invalid value";
         case conversion_errc::unbound_knot:        return "Converter used before its derivation finished";
            // clang-format on

         default:
            return "unknown";
      }
   }

   std::string_view error_to_str(json_errc e)
   {
      switch (e)
      {
            // clang-format off
         case json_errc::no_error:                           return "No error";
         case json_errc::document_empty:                     return "The document is empty";
         case json_errc::document_root_not_singular:         return "The document root must not follow by other values";
         case json_errc::value_invalid:                      return "Invalid value";
         case json_errc::object_miss_name:                   return "Missing a name for object member";
         case json_errc::object_miss_colon:                  return "Missing a colon after a name of object member";
         case json_errc::object_miss_comma_or_curly_bracket: return "Missing a comma or '}' after an object member";
         case json_errc::array_miss_comma_or_square_bracket: return "Missing a comma or ']' after an array element";
         case json_errc::string_unicode_escape_invalid_hex:  return "Incorrect hex digit after \\u escape in string";
         case json_errc::string_unicode_surrogate_invalid:   return "The surrogate pair in string is invalid";
         case json_errc::string_escape_invalid:              return "Invalid escape character in string";
         case json_errc::string_miss_quotation_mark:         return "Missing a closing quotation mark in string";
         case json_errc::string_invalid_encoding:            return "Invalid encoding in string";
         case json_errc::number_too_big:                     return "Number too big to be stored in double";
         case json_errc::number_miss_fraction:               return "Miss fraction part in number";
         case json_errc::number_miss_exponent:               return "Miss exponent in number";
         case json_errc::terminated:                         return "Parsing was terminated";
         case json_errc::unspecific_syntax_error:            return "Unspecific syntax error";
         case json_errc::writer_error:                       return "Error writing json";
            // clang-format on

         default:
            return "unknown";
      }
   }

   namespace
   {
      std::string derivation_message(derivation_errc    code,
                                     const std::string& type_name,
                                     const std::string& detail)
      {
         std::string result(error_to_str(code));
         result += ": ";
         result += type_name;
         if (!detail.empty())
         {
            result += " (";
            result += detail;
            result += ")";
         }
         result += "; ";
         result += remediation_hint(code);
         return result;
      }

      std::string conversion_message(conversion_errc           code,
                                     const std::string&        name,
                                     const std::exception_ptr& cause)
      {
         std::string result(error_to_str(code));
         if (!name.empty())
         {
            result += ": ";
            result += name;
         }
         if (cause)
         {
            try
            {
               std::rethrow_exception(cause);
            }
            catch (const std::exception& e)
            {
               result += ": ";
               result += e.what();
            }
         }
         return result;
      }
   }  // namespace

   derivation_error::derivation_error(derivation_errc code, std::string type_name, std::string detail)
       : std::runtime_error(derivation_message(code, type_name, detail)),
         code_(code),
         type_name_(std::move(type_name)),
         detail_(std::move(detail))
   {
   }

   conversion_error::conversion_error(conversion_errc    code,
                                      std::string        name,
                                      std::exception_ptr cause)
       : std::runtime_error(conversion_message(code, name, cause)),
         code_(code),
         name_(std::move(name)),
         cause_(std::move(cause))
   {
   }

   conversion_error conversion_error::root_cause() const
   {
      if (cause_)
      {
         try
         {
            std::rethrow_exception(cause_);
         }
         catch (const conversion_error& e)
         {
            return e.root_cause();
         }
         catch (const std::exception&)
         {
            // a foreign cause ends the chain
            return *this;
         }
      }
      return *this;
   }

   json_error::json_error(json_errc code, std::size_t offset)
       : std::runtime_error(std::string(error_to_str(code)) + " at offset " +
                            std::to_string(offset)),
         code_(code),
         offset_(offset)
   {
   }
}  // namespace jderive
