//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/plugin.hpp"

#include "evnorm/detail/assert.hpp"
#include "evnorm/logger.hpp"

#include <algorithm>

namespace evnorm {

auto to_string(plugin_stage x) -> std::string_view {
  switch (x) {
    case plugin_stage::first_pass:
      return "first_pass";
    case plugin_stage::second_pass:
      return "second_pass";
    case plugin_stage::unprocessed_structured:
      return "unprocessed_structured";
    case plugin_stage::unprocessed_messages:
      return "unprocessed_messages";
  }
  EVNORM_UNREACHABLE();
}

auto plugin_registry::add(plugin_ptr x) -> caf::error {
  EVNORM_ASSERT(x);
  auto lock = std::lock_guard{mutex_};
  if (frozen()) {
    return caf::make_error(ec::logic_error,
                           fmt::format("cannot add plugin `{}` after the "
                                       "plugin registry was frozen",
                                       x->name()));
  }
  const auto name = x->name();
  const auto duplicate = std::any_of(
    plugins_.begin(), plugins_.end(), [&](const plugin_ptr& existing) {
      return existing->name() == name;
    });
  if (duplicate) {
    return caf::make_error(ec::logic_error,
                           fmt::format("a plugin named `{}` already exists",
                                       name));
  }
  EVNORM_DEBUG("registering plugin `{}`", name);
  plugins_.push_back(std::move(x));
  return {};
}

auto plugin_registry::initialize(const caf::settings& cfg) -> caf::error {
  auto lock = std::lock_guard{mutex_};
  if (frozen()) {
    return caf::make_error(ec::logic_error,
                           "cannot initialize a frozen plugin registry");
  }
  const auto disabled = caf::get_or(cfg, "evnorm.disable-plugins",
                                    std::vector<std::string>{});
  const auto is_disabled = [&](const plugin_ptr& x) {
    const auto name = x->name();
    if (std::find(disabled.begin(), disabled.end(), name) == disabled.end()) {
      return false;
    }
    EVNORM_VERBOSE("disabling plugin `{}`", name);
    return true;
  };
  plugins_.erase(std::remove_if(plugins_.begin(), plugins_.end(), is_disabled),
                 plugins_.end());
  const auto empty_config = caf::settings{};
  for (const auto& x : plugins_) {
    const auto key = fmt::format("plugins.{}", x->name());
    const auto* plugin_config = caf::get_if<caf::settings>(&cfg, key);
    if (auto err
        = x->initialize(plugin_config ? *plugin_config : empty_config, cfg)) {
      return add_context(err, "failed to initialize plugin `{}`", x->name());
    }
  }
  return {};
}

void plugin_registry::freeze() {
  std::call_once(freeze_flag_, [this] {
    auto lock = std::lock_guard{mutex_};
    for (const auto& x : plugins_) {
      const auto* mp = dynamic_cast<const message_plugin*>(x.get());
      if (not mp) {
        continue;
      }
      for (auto kind = size_t{0}; kind < record_kind_count; ++kind) {
        if (satisfies(static_cast<record_kind>(kind), mp->applies_to())) {
          dispatch_[kind][static_cast<size_t>(mp->stage())].push_back(mp);
        }
      }
    }
    EVNORM_VERBOSE("froze plugin registry with {} plugins", plugins_.size());
    frozen_ = true;
  });
}

auto plugin_registry::frozen() const noexcept -> bool {
  return frozen_;
}

auto plugin_registry::get() const noexcept -> std::span<const plugin_ptr> {
  return plugins_;
}

auto plugin_registry::find(std::string_view name) const noexcept
  -> const plugin* {
  const auto it = std::find_if(plugins_.begin(), plugins_.end(),
                               [&](const plugin_ptr& x) {
                                 return x->name() == name;
                               });
  return it == plugins_.end() ? nullptr : it->get();
}

auto plugin_registry::message_plugins(record_kind kind,
                                      plugin_stage stage) const
  -> std::span<const message_plugin* const> {
  EVNORM_ASSERT(frozen());
  return dispatch_[static_cast<size_t>(kind)][static_cast<size_t>(stage)];
}

namespace plugins {

auto registry() noexcept -> plugin_registry& {
  static auto result = plugin_registry{};
  return result;
}

auto get() noexcept -> std::span<const plugin_ptr> {
  return registry().get();
}

} // namespace plugins

} // namespace evnorm
