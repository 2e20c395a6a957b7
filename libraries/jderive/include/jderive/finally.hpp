#pragma once

namespace jderive
{
   /// Runs `f` when the scope exits, unless dismissed first
   template <typename F>
   struct finally
   {
      F    f;
      bool armed = true;

      void dismiss() { armed = false; }
      ~finally()
      {
         if (armed)
            f();
      }
   };

   template <typename F>
   finally(F) -> finally<F>;
}  // namespace jderive
