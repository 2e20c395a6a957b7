#include <jderive/session.hpp>

namespace jderive
{
   derivation_session::derivation_session(session_options options)
       : opts(std::move(options)), arena(std::make_shared<knot_arena>())
   {
   }

   derivation_session& default_session()
   {
      thread_local derivation_session session;
      return session;
   }
}  // namespace jderive
