// Loads a plugin the way the host does: through the symbols SPANKPP_PLUGIN
// exports, with the fake host standing in for slurmd and srun.

#include <cstdlib> // unsetenv
#include <cstring> // std::strcmp

#include <Spank++/Spank++.hpp>

#include "FakeHost.hpp"
#include "gtest/gtest.h"

using namespace testing;
using spankpp::core::SpankHandle;
using spankpp::core::SpankOption;
using spankpp::core::STATUS_SUCCESS;
using spankpp::fake::FakeHost;
using spankpp::utils::types::i32;
using spankpp::utils::types::Option;
using spankpp::utils::types::Result;
using spankpp::utils::types::String;
using spankpp::utils::types::usize;

namespace {
  class ExportPlugin : public spankpp::core::IPlugin {
   public:
    static inline usize          Constructed = 0;
    static inline Option<String> SeenColor;

    ExportPlugin() {
      ++Constructed;
    }

    fn init(SpankHandle& spank) -> Result<> override {
      return spank.registerOption(SpankOption("color").takesValue("name").usage("Paint tasks [name]"));
    }

    fn initPostOpt(SpankHandle& spank) -> Result<> override {
      SeenColor = TRY(spank.getOptionValue("color"));
      return {};
    }
  };
} // namespace

SPANKPP_PLUGIN("export-test", SPANKPP_VERSION(23, 2, 1), ExportPlugin)

static_assert(SPANKPP_VERSION(23, 2, 1) == 0x170201);

class PluginExportTest : public Test {
 protected:
  FakeHost& m_host = FakeHost::instance();

  void SetUp() override {
    m_host.reset();
    unsetenv("SPANKPP_LOG_LEVEL");
  }
};

TEST_F(PluginExportTest, DescriptorsAreExported) {
  EXPECT_EQ(std::strcmp(plugin_name, "export-test"), 0);
  EXPECT_EQ(std::strcmp(plugin_type, "spank"), 0);
  EXPECT_EQ(plugin_version, 0x170201U);
  EXPECT_EQ(plugin_version, static_cast<unsigned int>(SPANKPP_VERSION(23, 2, 1)));
}

TEST_F(PluginExportTest, VersionPacksOneBytePerComponent) {
  EXPECT_EQ(SPANKPP_VERSION(23, 2, 1), 0x170201);
  EXPECT_EQ(SPANKPP_VERSION(0, 0, 0), 0);
  EXPECT_EQ(SPANKPP_VERSION(255, 255, 255), 0xffffff);
}

// The runtime behind the entry points lives for the whole process, so the
// full option round trip stays in one test.
TEST_F(PluginExportTest, OptionReachesPluginThroughExportedSymbols) {
  ASSERT_EQ(slurm_spank_init(m_host.handle(), 0, nullptr), STATUS_SUCCESS);
  EXPECT_EQ(ExportPlugin::Constructed, 1U);

  ASSERT_EQ(m_host.options.size(), 1U);
  EXPECT_EQ(m_host.options.front().name, "color");
  EXPECT_EQ(m_host.options.front().callback, &spankpp_option_callback);

  ASSERT_EQ(m_host.deliverOption("color", String("teal")), STATUS_SUCCESS);
  ASSERT_EQ(slurm_spank_init_post_opt(m_host.handle(), 0, nullptr), STATUS_SUCCESS);

  EXPECT_EQ(ExportPlugin::SeenColor, "teal");
  EXPECT_EQ(ExportPlugin::Constructed, 1U);

  EXPECT_EQ(slurm_spank_exit(m_host.handle(), 0, nullptr), STATUS_SUCCESS);
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
