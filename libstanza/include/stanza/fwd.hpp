//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "stanza/config.hpp" // IWYU pragma: export

#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstdint>

#define STANZA_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(stanza_types, type)

// -- stanza -------------------------------------------------------------------

namespace stanza {

class data;
class entry_operator;
class field;
class transformer;

struct entry;

enum class ec : uint8_t;
enum class root_kind : uint8_t;
enum class severity : uint8_t;

namespace detail {

template <class Key, class T>
class stable_map;

} // namespace detail

} // namespace stanza

// -- type IDs -----------------------------------------------------------------

constexpr inline caf::type_id_t first_stanza_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(stanza_types, first_stanza_type_id)

  STANZA_ADD_TYPE_ID((stanza::ec))

CAF_END_TYPE_ID_BLOCK(stanza_types)

#undef STANZA_ADD_TYPE_ID
