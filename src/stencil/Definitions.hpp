/* Stencil a small text templating engine
   Copyright © 2023 ef3d0c3e

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU Affero General Public License as
   published by the Free Software Foundation, either version 3 of the
   License, or any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>. */

#ifndef STENCIL_DEFINITIONS_HPP
#define STENCIL_DEFINITIONS_HPP

#include "Value.hpp"

namespace Stencil
{
/**
 * @brief Parses the value of a definition
 *
 * `true`, `false` and `null` give the matching value, numbers give integers or
 * floats, `[a,b,c]` gives a sequence of strings and anything else is a string.
 *
 * @param text Value to parse
 * @returns Parsed value
 */
[[nodiscard]] Value parseDefinitionValue(std::string_view text);

/**
 * @brief Adds a `path=value` definition to an object
 *
 * Intermediate objects are created as needed, a previous value at path is replaced.
 *
 * @param root Object to add to
 * @param definition Definition
 * @throws Error if the definition is malformed or a prefix of path is not an object
 */
void define(Object& root, std::string_view definition);
} // Stencil

#endif // STENCIL_DEFINITIONS_HPP
