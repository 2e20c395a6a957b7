#include <jderive/type_name.hpp>

#include <cctype>

namespace jderive
{
   namespace
   {
      constexpr std::string_view elaborated_keywords[] = {"struct ", "class ", "enum ", "union "};

      bool ident_char(char c)
      {
         return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
      }

      std::size_t keyword_at(std::string_view name, std::size_t pos)
      {
         if (pos > 0 && ident_char(name[pos - 1]))
            return 0;
         for (auto kw : elaborated_keywords)
            if (name.substr(pos, kw.size()) == kw)
               return kw.size();
         return 0;
      }
   }  // namespace

   std::string portable_type_name(std::string_view demangled)
   {
      std::string result;
      result.reserve(demangled.size());
      std::size_t pos = 0;
      while (pos < demangled.size())
      {
         if (auto skip = keyword_at(demangled, pos))
         {
            pos += skip;
            continue;
         }
         char c = demangled[pos++];
         if (c == ' ')
         {
            bool after_sep = !result.empty() && (result.back() == ',' || result.back() == '<');
            bool before_sep =
                pos < demangled.size() && (demangled[pos] == '>' || demangled[pos] == ',');
            if (after_sep || before_sep)
               continue;
         }
         result += c;
      }
      return result;
   }

   std::string_view template_name(std::string_view name)
   {
      if (name.empty() || name.back() != '>')
         return name;
      int depth = 0;
      for (auto i = name.size(); i-- > 0;)
      {
         if (name[i] == '>')
            ++depth;
         else if (name[i] == '<' && --depth == 0)
            return name.substr(0, i);
      }
      return name;
   }

   bool is_anonymous_type_name(std::string_view name)
   {
      return name.find("anonymous namespace") != std::string_view::npos;
   }
}  // namespace jderive
