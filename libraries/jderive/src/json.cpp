#include <jderive/check.hpp>
#include <jderive/json.hpp>

#include <rapidjson/error/error.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/reader.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <vector>

namespace jderive
{
   namespace
   {
      json_errc convert_error(rapidjson::ParseErrorCode err)
      {
         switch (err)
         {
               // clang-format off
            case rapidjson::kParseErrorNone:                            return json_errc::no_error;
            case rapidjson::kParseErrorDocumentEmpty:                   return json_errc::document_empty;
            case rapidjson::kParseErrorDocumentRootNotSingular:         return json_errc::document_root_not_singular;
            case rapidjson::kParseErrorValueInvalid:                    return json_errc::value_invalid;
            case rapidjson::kParseErrorObjectMissName:                  return json_errc::object_miss_name;
            case rapidjson::kParseErrorObjectMissColon:                 return json_errc::object_miss_colon;
            case rapidjson::kParseErrorObjectMissCommaOrCurlyBracket:   return json_errc::object_miss_comma_or_curly_bracket;
            case rapidjson::kParseErrorArrayMissCommaOrSquareBracket:   return json_errc::array_miss_comma_or_square_bracket;
            case rapidjson::kParseErrorStringUnicodeEscapeInvalidHex:   return json_errc::string_unicode_escape_invalid_hex;
            case rapidjson::kParseErrorStringUnicodeSurrogateInvalid:   return json_errc::string_unicode_surrogate_invalid;
            case rapidjson::kParseErrorStringEscapeInvalid:             return json_errc::string_escape_invalid;
            case rapidjson::kParseErrorStringMissQuotationMark:         return json_errc::string_miss_quotation_mark;
            case rapidjson::kParseErrorStringInvalidEncoding:           return json_errc::string_invalid_encoding;
            case rapidjson::kParseErrorNumberTooBig:                    return json_errc::number_too_big;
            case rapidjson::kParseErrorNumberMissFraction:              return json_errc::number_miss_fraction;
            case rapidjson::kParseErrorNumberMissExponent:              return json_errc::number_miss_exponent;
            case rapidjson::kParseErrorTermination:                     return json_errc::terminated;
            case rapidjson::kParseErrorUnspecificSyntaxError:           return json_errc::unspecific_syntax_error;
               // clang-format on

            default:
               return json_errc::unspecific_syntax_error;
         }
      }

      // Builds a tree from reader events. Open containers live on `stack`;
      // `keys` holds the pending member names of the open objects.
      class tree_builder : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, tree_builder>
      {
        public:
         tree result;

         bool Null() { return add(tree{}); }
         bool Bool(bool v) { return add(tree{v}); }
         bool RawNumber(const char* v, rapidjson::SizeType length, bool)
         {
            return add(tree::number(std::string(v, length)));
         }
         bool String(const char* v, rapidjson::SizeType length, bool)
         {
            return add(tree{std::string(v, length)});
         }
         bool StartObject()
         {
            stack.push_back(tree::make_object());
            return true;
         }
         bool Key(const char* v, rapidjson::SizeType length, bool)
         {
            keys.emplace_back(v, length);
            return true;
         }
         bool EndObject(rapidjson::SizeType) { return finish(); }
         bool StartArray()
         {
            stack.push_back(tree::make_array());
            return true;
         }
         bool EndArray(rapidjson::SizeType) { return finish(); }

        private:
         std::vector<tree>        stack;
         std::vector<std::string> keys;

         bool add(tree value)
         {
            if (stack.empty())
            {
               result = std::move(value);
            }
            else if (stack.back().is_array())
            {
               stack.back().push_back(std::move(value));
            }
            else
            {
               stack.back().emplace(std::move(keys.back()), std::move(value));
               keys.pop_back();
            }
            return true;
         }

         bool finish()
         {
            tree done = std::move(stack.back());
            stack.pop_back();
            return add(std::move(done));
         }
      };

      void check_written(bool                           ok,
                         const rapidjson::StringBuffer& buffer,
                         json_errc                      code = json_errc::writer_error)
      {
         if (!ok)
            throw json_error(code, buffer.GetSize());
      }

      // Strings and keys are checked to be UTF-8 as they are written
      using compact_writer = rapidjson::Writer<rapidjson::StringBuffer,
                                               rapidjson::UTF8<>,
                                               rapidjson::UTF8<>,
                                               rapidjson::CrtAllocator,
                                               rapidjson::kWriteValidateEncodingFlag>;
      using pretty_writer  = rapidjson::PrettyWriter<rapidjson::StringBuffer,
                                                    rapidjson::UTF8<>,
                                                    rapidjson::UTF8<>,
                                                    rapidjson::CrtAllocator,
                                                    rapidjson::kWriteValidateEncodingFlag>;

      template <typename Writer>
      void write_tree(Writer& writer, const rapidjson::StringBuffer& buffer, const tree& value)
      {
         switch (value.kind())
         {
            case tree_kind::null:
               check_written(writer.Null(), buffer);
               break;
            case tree_kind::boolean:
               check_written(writer.Bool(value.as_bool()), buffer);
               break;
            case tree_kind::number:
            {
               const auto& text = value.number_text();
               check_written(
                   writer.RawValue(text.data(), text.size(), rapidjson::kNumberType), buffer);
               break;
            }
            case tree_kind::string:
            {
               const auto& s = value.as_string();
               check_written(
                   writer.String(s.data(), static_cast<rapidjson::SizeType>(s.size())), buffer,
                   json_errc::string_invalid_encoding);
               break;
            }
            case tree_kind::array:
               check_written(writer.StartArray(), buffer);
               for (const auto& element : value.as_array())
                  write_tree(writer, buffer, element);
               check_written(writer.EndArray(), buffer);
               break;
            case tree_kind::object:
               check_written(writer.StartObject(), buffer);
               for (const auto& member : value.as_object())
               {
                  check_written(
                      writer.Key(member.key.data(),
                                 static_cast<rapidjson::SizeType>(member.key.size())),
                      buffer, json_errc::string_invalid_encoding);
                  write_tree(writer, buffer, member.value);
               }
               check_written(writer.EndObject(), buffer);
               break;
         }
      }
   }  // namespace

   tree parse_json(std::string_view json)
   {
      // The insitu stream modifies its input
      std::string                   copy(json);
      rapidjson::InsituStringStream ss{copy.data()};
      rapidjson::Reader             reader;
      tree_builder                  builder;
      rapidjson::ParseResult        ok =
          reader.Parse<rapidjson::kParseInsituFlag | rapidjson::kParseValidateEncodingFlag |
                       rapidjson::kParseNumbersAsStringsFlag>(ss, builder);
      if (ok.IsError())
         throw json_error(convert_error(ok.Code()), ok.Offset());
      return std::move(builder.result);
   }

   std::string format_json(const tree& value, bool pretty)
   {
      rapidjson::StringBuffer buffer;
      if (pretty)
      {
         pretty_writer writer(buffer);
         writer.SetIndent(' ', 3);
         write_tree(writer, buffer, value);
      }
      else
      {
         compact_writer writer(buffer);
         write_tree(writer, buffer, value);
      }
      return std::string(buffer.GetString(), buffer.GetSize());
   }
}  // namespace jderive
