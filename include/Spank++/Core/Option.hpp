/**
 * @file Option.hpp
 * @brief Declarative description of a plugin command-line option
 * @author Spank++ Team
 * @version 1.0.0
 */

#pragma once

#include <utility> // std::move

#include "../Utils/Types.hpp"

namespace spankpp::core {
  /**
   * @class SpankOption
   * @brief An option the plugin adds to srun/salloc/sbatch.
   *
   * An option without an argument name is a flag: only its presence is
   * recorded. Build it fluently and hand it to SpankHandle::registerOption().
   *
   * @code
   * SpankOption("renice").takesValue("prio").usage("Re-nice job tasks to priority [prio]")
   * @endcode
   */
  class SpankOption {
   public:
    explicit SpankOption(utils::types::String name)
      : m_name(std::move(name)) {}

    /**
     * @brief Marks the option as taking a value shown as @p argName in --help.
     */
    fn takesValue(utils::types::String argName) && -> SpankOption&& {
      m_argInfo = std::move(argName);
      return std::move(*this);
    }

    fn usage(utils::types::String text) && -> SpankOption&& {
      m_usage = std::move(text);
      return std::move(*this);
    }

    [[nodiscard]] fn name() const -> const utils::types::String& {
      return m_name;
    }

    [[nodiscard]] fn argInfo() const -> const utils::types::Option<utils::types::String>& {
      return m_argInfo;
    }

    [[nodiscard]] fn usageText() const -> const utils::types::Option<utils::types::String>& {
      return m_usage;
    }

    [[nodiscard]] fn hasArg() const -> bool {
      return m_argInfo.has_value();
    }

   private:
    utils::types::String                       m_name;
    utils::types::Option<utils::types::String> m_argInfo;
    utils::types::Option<utils::types::String> m_usage;
  };
} // namespace spankpp::core
