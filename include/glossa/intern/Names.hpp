//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/glossa/intern/Names.hpp
//
// Purpose:
//   Public entry point for string interning.  Engine code includes this header
//   and works with glossa::intern::NameTable.
//
// Usage:
//   auto &names = glossa::intern::processGlobalNameTable();
//   auto mesh = names.intern("player.mesh");
//   if (!mesh)
//       return mesh.error();
//   auto tracked = names.trackReference(mesh.value(), GLOSSA_OWNER_HERE);
//
//   Embedders that need isolation (tests, tools, hot reload) construct their
//   own StringRegistry and tracker and bind a BasicNameTable to them.  Handles
//   from one registry never resolve in another.
//
// Tracking:
//   GLOSSA_ENABLE_STRING_TRACKING=1 makes NameTable record references per
//   owner context; with 0 the tracking calls compile to nothing.  The calls
//   are the same in both builds.
//
// Thread Safety:
//   Every operation may be called from any thread.  resolve() takes no lock.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "intern/Name.hpp"
#include "intern/NameTable.hpp"
#include "intern/ReferenceTracker.hpp"
#include "intern/StringRegistry.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/handle.hpp"

namespace glossa::intern
{
using support::Error;
using support::ErrorKind;
using support::Expected;
} // namespace glossa::intern
