#pragma once

#include <stddef.h>

#include "ResourceTable.h"

// Board pin map. Entries set to kPinNotAssigned are slots the board leaves unused.
extern const PinDef kPinDefinitions[];
extern const size_t kPinDefinitionCount;
