#include <Spank++/Core/OptionCache.hpp>

#include <limits> // std::numeric_limits

#include <Spank++/Utils/Logging.hpp>

namespace spankpp::core {
  using namespace utils::types;

  fn OptionCache::nextSlot() const -> Result<i32> {
    if (m_options.size() > static_cast<usize>(std::numeric_limits<i32>::max()))
      ERR(utils::error::kind::Overflow { .what = "option slot", .value = m_options.size() });

    return static_cast<i32>(m_options.size());
  }

  fn OptionCache::commit(String name) -> i32 {
    const auto slot = static_cast<i32>(m_options.size());

    debug2_log("Option '{}' assigned slot {}", name, slot);
    m_options.push_back(std::move(name));

    return slot;
  }

  fn OptionCache::nameAt(const i32 slot) const -> Option<StringView> {
    if (slot < 0 || static_cast<usize>(slot) >= m_options.size())
      return None;

    return StringView(m_options[static_cast<usize>(slot)]);
  }

  fn OptionCache::capture(const i32 slot, Value value) -> Result<> {
    const Option<StringView> name = nameAt(slot);

    if (!name)
      ERR_FMT("Received an option callback for unknown slot {} ({} options registered)", slot, m_options.size());

    store(String(*name), std::move(value));
    return {};
  }

  fn OptionCache::store(const String& name, Value value) -> Unit {
    // Last value wins
    m_values.insert_or_assign(name, std::move(value));
    return {};
  }

  fn OptionCache::find(const StringView name) const -> const Value* {
    if (const auto iter = m_values.find(name); iter != m_values.end())
      return &iter->second;

    return nullptr;
  }
} // namespace spankpp::core
