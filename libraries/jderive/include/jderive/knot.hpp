#pragma once

#include <jderive/check.hpp>
#include <jderive/shape.hpp>
#include <jderive/tree.hpp>
#include <jderive/type_name.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

namespace jderive
{
   /// What a reader produces. Sums are abstract, so their readers return an owning
   /// pointer to the alternative that was read.
   template <typename T>
   using read_result_t =
       std::conditional_t<reflect<T>::is_sum || is_open_hierarchy<T>, std::unique_ptr<T>, T>;

   template <typename T>
   struct converter_pair
   {
      std::function<read_result_t<T>(const tree&)> read;
      std::function<tree(const T&)>                write;
   };

   struct knot_cell_base
   {
      virtual ~knot_cell_base() = default;
   };

   /// Holds the converter of one type. Created empty when derivation of the type
   /// starts and populated once when it finishes; converters of other types that
   /// refer to T hold this cell, not a copy of its contents.
   template <typename T>
   class knot_cell : public knot_cell_base
   {
     public:
      bool populated() const { return pair.has_value(); }
      void populate(converter_pair<T> p) { pair = std::move(p); }

      const converter_pair<T>& get() const
      {
         if (!pair)
            abort_error(conversion_errc::unbound_knot, type_name<T>());
         return *pair;
      }

      read_result_t<T> read(const tree& value) const { return get().read(value); }
      tree             write(const T& value) const { return get().write(value); }

     private:
      std::optional<converter_pair<T>> pair;
   };

   template <typename T>
   char type_id;

   /// Owns the cells of one derivation session, one per type
   class knot_arena
   {
     public:
      template <typename T>
      knot_cell<T>* find()
      {
         auto pos = ids.find(&type_id<T>);
         if (pos == ids.end())
            return nullptr;
         return static_cast<knot_cell<T>*>(cells[pos->second].get());
      }

      template <typename T>
      knot_cell<T>& emplace()
      {
         auto  cell   = std::make_unique<knot_cell<T>>();
         auto& result = *cell;
         ids.insert({&type_id<T>, cells.size()});
         keys.push_back(&type_id<T>);
         cells.push_back(std::move(cell));
         return result;
      }

      std::size_t size() const { return cells.size(); }

      /// Removes the cells created after the arena had `mark` cells
      void truncate(std::size_t mark)
      {
         while (cells.size() > mark)
         {
            ids.erase(keys.back());
            keys.pop_back();
            cells.pop_back();
         }
      }

     private:
      std::map<const void*, std::size_t>           ids;
      std::vector<const void*>                     keys;
      std::vector<std::unique_ptr<knot_cell_base>> cells;
   };

   /// Handle to a derived converter. Keeps the session's cells alive, so it stays
   /// valid after the session that produced it is destroyed.
   template <typename T>
   class converter
   {
     public:
      converter(std::shared_ptr<const knot_arena> arena, const knot_cell<T>* cell)
          : arena(std::move(arena)), cell(cell)
      {
      }

      read_result_t<T> read(const tree& value) const { return cell->read(value); }
      tree             write(const T& value) const { return cell->write(value); }
      bool             bound() const { return cell->populated(); }

     private:
      std::shared_ptr<const knot_arena> arena;
      const knot_cell<T>*               cell;
   };
}  // namespace jderive
