/**
 * @file OptionCache.hpp
 * @brief Process-wide record of registered options and their captured values
 * @author Spank++ Team
 * @version 1.0.0
 *
 * @details The host reports option values in two ways depending on the context:
 * through the capture callback registered with each option, or through a
 * direct getopt query (prolog/epilog only). This cache is what lets both
 * paths look the same to plugin code.
 */

#pragma once

#include <functional> // std::less
#include <map>        // std::map

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace spankpp::core {
  /**
   * @class OptionCache
   * @brief Slot table plus last captured value per option.
   *
   * Invariants:
   * - Slots are append-only: the Nth committed option has slot N for the life
   *   of the process.
   * - A value entry exists only once the option was seen. A present entry with
   *   no value is a flag that was set.
   * - Repeated captures for the same option keep only the last value.
   */
  class OptionCache {
   public:
    using Value = utils::types::Option<utils::types::String>;

    /**
     * @brief Slot the next committed option will receive.
     * @return The slot, or Overflow if the table no longer fits in a native int.
     */
    [[nodiscard]] fn nextSlot() const -> utils::types::Result<utils::types::i32>;

    /**
     * @brief Appends @p name to the slot table after the host accepted it.
     * @return The slot assigned to @p name.
     */
    fn commit(utils::types::String name) -> utils::types::i32;

    /**
     * @brief Reverse-maps a slot handed back by the host.
     * @return The option name, or None for a slot that was never assigned.
     */
    [[nodiscard]] fn nameAt(utils::types::i32 slot) const -> utils::types::Option<utils::types::StringView>;

    /**
     * @brief Records a value delivered by the host's capture callback.
     * @param slot The correlation token given at registration.
     * @param value The option argument, or None for a flag.
     * @return A Custom error when @p slot is unknown; the cache is left unchanged.
     */
    fn capture(utils::types::i32 slot, Value value) -> utils::types::Result<>;

    /**
     * @brief Stores or overwrites the value recorded for @p name.
     */
    fn store(const utils::types::String& name, Value value) -> utils::types::Unit;

    /**
     * @brief Looks up the entry recorded for @p name.
     * @return Pointer to the entry, or nullptr when the option was never seen.
     */
    [[nodiscard]] fn find(utils::types::StringView name) const -> const Value*;

    [[nodiscard]] fn options() const -> const utils::types::Vec<utils::types::String>& {
      return m_options;
    }

   private:
    utils::types::Vec<utils::types::String>                    m_options;
    std::map<utils::types::String, Value, std::less<>>         m_values; // transparent lookup by StringView
  };
} // namespace spankpp::core
