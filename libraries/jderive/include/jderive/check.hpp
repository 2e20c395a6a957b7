#pragma once

#include <jderive/error.hpp>

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace jderive
{
   [[noreturn]] inline void abort_error(conversion_errc    code,
                                        std::string        name  = {},
                                        std::exception_ptr cause = nullptr)
   {
      throw conversion_error(code, std::move(name), std::move(cause));
   }

   [[noreturn]] inline void abort_error(derivation_errc code,
                                        std::string     type_name,
                                        std::string     detail = {})
   {
      throw derivation_error(code, std::move(type_name), std::move(detail));
   }

   inline void check(bool cond, conversion_errc code, std::string_view name = {})
   {
      if (!cond)
         abort_error(code, std::string(name));
   }

   inline void check(bool            cond,
                     derivation_errc code,
                     std::string_view type_name,
                     std::string_view detail = {})
   {
      if (!cond)
         abort_error(code, std::string(type_name), std::string(detail));
   }
}  // namespace jderive
