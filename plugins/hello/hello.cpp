/**
 * @file hello.cpp
 * @brief Greets a user-chosen name before tasks start
 * @author Spank++ Team
 * @version 1.0.0
 *
 * @details Adds `--greet=name` to srun. The value is read once options are
 * processed and printed on the user's terminal from the remote side.
 */

#include <Spank++/Spank++.hpp>

namespace {
  using namespace spankpp::utils::types;
  using spankpp::core::Context, spankpp::core::SpankHandle, spankpp::core::SpankOption;

  class Hello : public spankpp::core::IPlugin {
   public:
    fn init(SpankHandle& spank) -> Result<> override {
      const Context context = TRY(spank.context());

      if (context != Context::Local && context != Context::Remote)
        return {};

      if (Result<> registered = spank.registerOption(SpankOption("greet").takesValue("name").usage("Greet [name] before running tasks")); !registered)
        ERR_FROM(registered.error().wrap("Failed to register greet option"));

      return {};
    }

    fn initPostOpt(SpankHandle& spank) -> Result<> override {
      Result<Option<String>> greet = spank.getOptionValue("greet");

      if (!greet)
        ERR_FROM(greet.error().wrap("Failed to read --greet option"));

      m_greet = std::move(*greet);

      if (m_greet)
        info_log("User opted to greet {}", *m_greet);

      return {};
    }

    fn userInit(SpankHandle& /*spank*/) -> Result<> override {
      if (m_greet)
        user_log("Hello {}!", *m_greet);

      return {};
    }

   private:
    Option<String> m_greet;
  };
} // namespace

SPANKPP_PLUGIN("hello", SPANKPP_SLURM_VERSION, Hello)
