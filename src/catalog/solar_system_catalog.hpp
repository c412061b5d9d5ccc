#pragma once

/// @file solar_system_catalog.hpp
/// @brief Built-in record tree of the Solar System.

#include "catalog/body_record.hpp"

namespace orrery::catalog
{
    /// @brief Sun, the eight planets, ten dwarf planets and their major moons.
    ///
    /// Planets and dwarf planets are direct children of the Sun, in the order
    /// they are drawn. Values are mean orbital elements; facts are short
    /// display strings.
    ///
    /// Returns the root record (the Sun). Built once, immutable afterwards.
    [[nodiscard]] const BodyRecord& solar_system();

} // namespace orrery::catalog
