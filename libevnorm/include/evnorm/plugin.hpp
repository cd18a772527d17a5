//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/fwd.hpp"

#include "evnorm/error.hpp"
#include "evnorm/event.hpp"

#include <caf/error.hpp>
#include <caf/settings.hpp>

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace evnorm {

// -- plugin stage -------------------------------------------------------------

/// The stages of the decode chain, in execution order.
enum class plugin_stage : uint8_t {
  /// Vendor-specific plugins that recognize a message by its content.
  first_pass,
  /// Plugins that refine the results of the first pass.
  second_pass,
  /// Generic plugins for structured formats such as CEF or key-value.
  unprocessed_structured,
  /// Plugins for messages that nothing else understood.
  unprocessed_messages,
};

/// All stages in execution order.
inline constexpr auto plugin_stages = std::array{
  plugin_stage::first_pass,
  plugin_stage::second_pass,
  plugin_stage::unprocessed_structured,
  plugin_stage::unprocessed_messages,
};

/// @relates plugin_stage
auto to_string(plugin_stage x) -> std::string_view;

// -- plugin -------------------------------------------------------------------

/// The plugin base class.
class plugin {
public:
  /// Destroys any runtime state that the plugin created.
  virtual ~plugin() noexcept = default;

  /// Satisfy the rule of five.
  plugin() noexcept = default;
  plugin(const plugin&) noexcept = default;
  auto operator=(const plugin&) noexcept -> plugin& = default;
  plugin(plugin&&) noexcept = default;
  auto operator=(plugin&&) noexcept -> plugin& = default;

  /// Initializes a plugin with its respective entries from the configuration,
  /// i.e., `plugins.<NAME>`.
  /// @param plugin_config The relevant subsection of the configuration.
  /// @param global_config The entire configuration for potential access to
  /// global options.
  [[nodiscard]] virtual auto initialize(const caf::settings& plugin_config,
                                        const caf::settings& global_config)
    -> caf::error {
    (void)plugin_config;
    (void)global_config;
    return {};
  }

  /// Returns the unique name of the plugin.
  [[nodiscard]] virtual auto name() const -> std::string = 0;
};

// -- message plugin -----------------------------------------------------------

/// A plugin that enriches decoded events.
class message_plugin : public virtual plugin {
public:
  /// The stage in which the plugin runs.
  [[nodiscard]] virtual auto stage() const -> plugin_stage = 0;

  /// The kind of events the plugin handles. The plugin also sees events of
  /// all kinds that refine this one.
  [[nodiscard]] virtual auto applies_to() const -> record_kind {
    return record_kind::syslog;
  }

  /// Attempts to recognize an event and to enrich it.
  ///
  /// Returning `true` signals that the plugin matched and that its changes to
  /// the event are final. A plugin that returns `false` must leave the event
  /// untouched. A plugin that throws counts as not having matched, and the
  /// decoder discards the changes it made before throwing.
  ///
  /// @param x The event to enrich.
  /// @param cache The parsing cache of the current decode call.
  [[nodiscard]] virtual auto try_decode(event& x, parsing_cache& cache) const
    -> bool
    = 0;
};

// -- plugin registry ----------------------------------------------------------

/// Owns all plugins and maps an event kind and a stage to the message plugins
/// that should run.
///
/// The registry has a two-phase lifecycle. While open, plugins can be added
/// and configured. Freezing the registry builds the dispatch table, after
/// which the registry is read-only and may be shared across threads.
class plugin_registry {
public:
  plugin_registry() = default;
  plugin_registry(const plugin_registry&) = delete;
  auto operator=(const plugin_registry&) -> plugin_registry& = delete;
  ~plugin_registry() noexcept = default;

  /// Appends a plugin.
  /// @returns `ec::logic_error` if the registry is frozen or if a plugin with
  /// the same name exists.
  auto add(plugin_ptr x) -> caf::error;

  /// Removes the plugins listed in `evnorm.disable-plugins` and initializes
  /// the remaining ones with their `plugins.<NAME>` section.
  /// @param cfg The entire configuration.
  auto initialize(const caf::settings& cfg) -> caf::error;

  /// Builds the dispatch table and makes the registry read-only. Calling this
  /// function more than once has no effect.
  void freeze();

  /// Checks whether the registry is read-only.
  auto frozen() const noexcept -> bool;

  /// Returns all plugins in registration order.
  auto get() const noexcept -> std::span<const plugin_ptr>;

  /// Retrieves the plugin with the given name, or `nullptr` if it doesn't
  /// exist.
  auto find(std::string_view name) const noexcept -> const plugin*;

  /// Returns the message plugins that run for events of kind `kind` in stage
  /// `stage`, in registration order.
  /// @pre `frozen()`
  auto message_plugins(record_kind kind, plugin_stage stage) const
    -> std::span<const message_plugin* const>;

private:
  using stage_table = std::array<std::vector<const message_plugin*>,
                                 plugin_stages.size()>;

  mutable std::mutex mutex_;
  std::once_flag freeze_flag_;
  std::atomic<bool> frozen_ = false;
  std::vector<plugin_ptr> plugins_;
  std::array<stage_table, record_kind_count> dispatch_;
};

// -- plugin singleton ---------------------------------------------------------

namespace plugins {

/// Retrieves the process-wide registry that builtin plugins register with.
auto registry() noexcept -> plugin_registry&;

/// Retrieves all plugins of the process-wide registry.
auto get() noexcept -> std::span<const plugin_ptr>;

/// Retrieves the plugin of type `Plugin` with the given name from the
/// process-wide registry, or nullptr if it doesn't exist.
template <class Plugin = plugin>
auto find(std::string_view name) noexcept -> const Plugin* {
  return dynamic_cast<const Plugin*>(registry().find(name));
}

} // namespace plugins

} // namespace evnorm

// -- helper macros ------------------------------------------------------------

/// Registers a builtin plugin with the process-wide registry during static
/// initialization.
#define EVNORM_REGISTER_PLUGIN(name)                                           \
  template <class>                                                             \
  struct auto_register_plugin;                                                 \
  template <>                                                                  \
  struct auto_register_plugin<name> {                                          \
    auto_register_plugin() {                                                   \
      static_cast<void>(flag);                                                 \
    }                                                                          \
    static auto init() -> bool {                                               \
      ::evnorm::check(                                                         \
        ::evnorm::plugins::registry().add(std::make_unique<name>()));          \
      return true;                                                             \
    }                                                                          \
    inline static auto flag = init();                                          \
  };
