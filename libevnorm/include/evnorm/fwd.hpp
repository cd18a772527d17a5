//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "evnorm/config.hpp"

#include <caf/fwd.hpp>
#include <caf/timespan.hpp>
#include <caf/timestamp.hpp>
#include <caf/type_id.hpp>

#include <cstdint>
#include <memory>

namespace evnorm {

// -- classes ------------------------------------------------------------------

class data;
class decoder;
class diagnostic_builder;
class message_plugin;
class parsing_cache;
class plugin;
class plugin_registry;

// -- structs ------------------------------------------------------------------

struct decoder_options;
struct diagnostic;
struct event;
struct field_collision;
struct priority;
struct structure_classification;
struct structured_data_element;
struct syslog_options;

// -- enum classes -------------------------------------------------------------

enum class ec : uint8_t;
enum class plugin_stage : uint8_t;
enum class record_kind : uint8_t;
enum class severity;
enum class syntax : uint8_t;

// -- aliases ------------------------------------------------------------------

/// A duration in time with nanosecond resolution.
using duration = caf::timespan;

/// An absolute point in time with nanosecond resolution. It is capable to
/// represent +/- 292 years around the UNIX epoch.
using time = caf::timestamp;

/// An owning pointer to a plugin.
using plugin_ptr = std::unique_ptr<plugin>;

namespace detail {

template <class Key, class T>
class stable_map;

} // namespace detail

} // namespace evnorm

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_evnorm_type_id
  = caf::first_custom_type_id;

CAF_BEGIN_TYPE_ID_BLOCK(evnorm_types, first_evnorm_type_id)

  CAF_ADD_TYPE_ID(evnorm_types, (evnorm::ec))

CAF_END_TYPE_ID_BLOCK(evnorm_types)
