//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Instantiates the name table for both tracker variants and provides the
// process-global facade.  The global facade binds the process-global registry
// to the process-global tracker; all three objects are created on first use
// and intentionally leaked so handles stay resolvable during static
// destruction of other translation units.
//
//===----------------------------------------------------------------------===//

#include "intern/NameTable.hpp"

namespace glossa::intern
{

template class BasicNameTable<NullReferenceTracker>;
template class BasicNameTable<RecordingReferenceTracker>;

NameTable &processGlobalNameTable()
{
    static NameTable *table =
        new NameTable(processGlobalStringRegistry(), processGlobalReferenceTracker());
    return *table;
}

} // namespace glossa::intern
