#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jderive
{
   /// Errors raised while building a converter, before any value flows through it.
   /// The offending type definition has to be fixed.
   enum class derivation_errc : std::uint8_t
   {
      not_sealed,
      no_variants,
      no_constructor,
      no_deconstructor,
      malformed_annotation,
      duplicate_key,
      misplaced_variadic,
      anonymous_tag,
   };  // derivation_errc

   /// Errors raised while running a derived converter against data
   enum class conversion_errc : std::uint8_t
   {
      expected_object,
      missing_field,
      field_type,
      unknown_variant,
      expected_tagged,
      expected_null,
      expected_bool,
      expected_number,
      expected_int,
      number_out_of_range,
      expected_string,
      expected_array,
      array_size_mismatch,
      unexpected_field,
      invalid_value,
      unbound_knot,
   };  // conversion_errc

   /// Errors from the text codec
   enum class json_errc : std::uint8_t
   {
      no_error,
      document_empty,
      document_root_not_singular,
      value_invalid,
      object_miss_name,
      object_miss_colon,
      object_miss_comma_or_curly_bracket,
      array_miss_comma_or_square_bracket,
      string_unicode_escape_invalid_hex,
      string_unicode_surrogate_invalid,
      string_escape_invalid,
      string_miss_quotation_mark,
      string_invalid_encoding,
      number_too_big,
      number_miss_fraction,
      number_miss_exponent,
      terminated,
      unspecific_syntax_error,
      writer_error,
   };  // json_errc

   std::string_view error_to_str(derivation_errc e);
   std::string_view error_to_str(conversion_errc e);
   std::string_view error_to_str(json_errc e);

   /// How to fix a type definition that failed to derive
   std::string_view remediation_hint(derivation_errc e);

   class derivation_error : public std::runtime_error
   {
     public:
      derivation_error(derivation_errc code, std::string type_name, std::string detail = {});

      derivation_errc    code() const noexcept { return code_; }
      const std::string& type_name() const noexcept { return type_name_; }
      const std::string& detail() const noexcept { return detail_; }
      std::string_view   hint() const { return remediation_hint(code_); }

     private:
      derivation_errc code_;
      std::string     type_name_;
      std::string     detail_;
   };

   class conversion_error : public std::runtime_error
   {
     public:
      /// `name` is the field name, variant tag or type name the error is about.
      /// `cause` is the nested failure, if any.
      explicit conversion_error(conversion_errc    code,
                                std::string        name  = {},
                                std::exception_ptr cause = nullptr);

      conversion_errc           code() const noexcept { return code_; }
      const std::string&        name() const noexcept { return name_; }
      const std::exception_ptr& cause() const noexcept { return cause_; }

      /// The innermost error in the chain of causes
      conversion_error root_cause() const;

     private:
      conversion_errc    code_;
      std::string        name_;
      std::exception_ptr cause_;
   };

   class json_error : public std::runtime_error
   {
     public:
      json_error(json_errc code, std::size_t offset);

      json_errc   code() const noexcept { return code_; }
      std::size_t offset() const noexcept { return offset_; }

     private:
      json_errc   code_;
      std::size_t offset_;
   };
}  // namespace jderive
