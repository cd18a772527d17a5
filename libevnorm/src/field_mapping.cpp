//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The evnorm Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "evnorm/field_mapping.hpp"

#include "evnorm/error.hpp"
#include "evnorm/event.hpp"
#include "evnorm/logger.hpp"

#include <vector>

namespace evnorm {

auto apply_field_mapping(event& x, std::span<const std::string> names,
                         std::span<const data> values, std::string_view vendor,
                         std::string_view product, std::string_view msgclass)
  -> caf::error {
  if (names.size() != values.size()) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("got {} field names but {} values",
                                       names.size(), values.size()));
  }
  auto classification = structure_classification{
    .vendor = std::string{vendor},
    .product = std::string{product},
    .msgclass = std::string{msgclass},
    .fields = std::vector<std::string>{names.begin(), names.end()},
  };
  if (not x.classification) {
    x.classification = classification;
  } else if (not x.classification->same_class(classification)) {
    EVNORM_DEBUG("keeping classification {} over {}", *x.classification,
                 classification);
    x.rejected_classifications.push_back(classification);
  }
  auto writer = classification;
  writer.fields.clear();
  for (auto i = size_t{0}; i < names.size(); ++i) {
    auto [it, inserted] = x.event_data.insert({names[i], values[i]});
    if (not inserted) {
      EVNORM_DEBUG("{} attempted to overwrite field `{}`", writer, names[i]);
      x.collisions.push_back(field_collision{
        .key = names[i],
        .rejected = values[i],
        .writer = writer,
      });
    }
  }
  return {};
}

auto apply_field_mapping(event& x, const record& fields,
                         std::string_view vendor, std::string_view product,
                         std::string_view msgclass) -> caf::error {
  auto names = std::vector<std::string>{};
  auto values = std::vector<data>{};
  names.reserve(fields.size());
  values.reserve(fields.size());
  for (const auto& [key, value] : fields) {
    names.push_back(key);
    values.push_back(value);
  }
  return apply_field_mapping(x, names, values, vendor, product, msgclass);
}

} // namespace evnorm
