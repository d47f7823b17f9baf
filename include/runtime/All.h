/***
 * Name: objkit::rt umbrella header
 * Purpose: Aggregate runtime API headers.
 */
#pragma once

#include "runtime/TypeTag.h"
#include "runtime/GCStats.h"
#include "runtime/GC.h"
#include "runtime/Runtime.h"
#include "runtime/Validator.h"
#include "runtime/ObjectUtil.h"
