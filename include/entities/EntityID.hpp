/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_ID_HPP
#define ENTITY_ID_HPP

#include <cstdint>

namespace HordeMind {

// Identifier issued by the world collaborator; the core never owns entities
using EntityID = uint64_t;

constexpr EntityID INVALID_ENTITY_ID = 0;

} // namespace HordeMind

#endif // ENTITY_ID_HPP
