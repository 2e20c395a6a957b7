#pragma once

#include <jderive/finally.hpp>
#include <jderive/knot.hpp>
#include <jderive/log.hpp>
#include <jderive/options.hpp>

#include <functional>
#include <memory>

namespace jderive
{
   class derivation_session;

   template <typename T>
   converter_pair<T> synthesize(derivation_session& session);

   /// Derives converters and memoizes them. Each type is derived at most once per
   /// session; types that refer to each other, or to themselves, share cells.
   /// Not thread-safe.
   class derivation_session
   {
     public:
      explicit derivation_session(session_options options = {});

      const session_options& options() const { return opts; }

      /// Number of cells, populated or in flight
      std::size_t size() const { return arena->size(); }

      /// The converter of T. Throws derivation_error when T cannot be derived;
      /// cells created while trying are discarded.
      template <typename T>
      converter<T> derive()
      {
         try
         {
            auto& cell = bind<T>();
            return converter<T>{arena, &cell};
         }
         catch (const derivation_error& e)
         {
            JDERIVE_LOG(loggers::generic::get(), warning) << e.what();
            throw;
         }
      }

      /// Cell of T, derived on first request. While T is being derived the cell
      /// exists but is empty, which is what ends recursion through T.
      template <typename T>
      const knot_cell<T>& bind()
      {
         if (auto* cell = arena->find<T>())
         {
            if (!cell->populated())
            {
               JDERIVE_LOG(loggers::generic::get(), debug) << "Forward reference to "
                                                           << type_name<T>();
            }
            return *cell;
         }

         auto  mark     = arena->size();
         auto& cell     = arena->emplace<T>();
         auto  rollback = finally{[&] { arena->truncate(mark); }};
         JDERIVE_LOG(loggers::generic::get(), debug) << "Deriving " << type_name<T>();
         cell.populate(synthesize<T>(*this));
         rollback.dismiss();
         JDERIVE_LOG(loggers::generic::get(), debug) << "Derived " << type_name<T>();
         return cell;
      }

      /// Installs a hand-written converter for T. Replaces whatever the cell held;
      /// converters derived earlier that refer to T see the new one.
      template <typename T>
      void register_converter(std::function<read_result_t<T>(const tree&)> read,
                              std::function<tree(const T&)>                write)
      {
         auto* cell = arena->find<T>();
         if (!cell)
            cell = &arena->emplace<T>();
         cell->populate({std::move(read), std::move(write)});
         JDERIVE_LOG(loggers::generic::get(), debug) << "Registered converter for "
                                                     << type_name<T>();
      }

     private:
      session_options             opts;
      std::shared_ptr<knot_arena> arena;
   };

   /// This thread's session, created with default options
   derivation_session& default_session();
}  // namespace jderive
