#ifndef __KERNVAL_SHAPE_CHECK_HPP__
#define __KERNVAL_SHAPE_CHECK_HPP__

// Structural rules of built-in operations. The code of a built-in is generated
// mechanically from its contract, so its shape must be unambiguous:
//
//  1. exactly one written field (write/readwrite/inc) when it has fields
//  2. no operator arguments
//  3. reductions are scalars, and do not mix with readwrite + write fields
//  4. all fields on the same function space, unless it converts across spaces
//  5. it writes a field or reduces a scalar
//  6. all fields share the data type, unless it converts across types
//  7. it iterates over degrees of freedom
//
// All violations are collected. They are ordered by rule, then by argument.

#include "contract.hpp"
#include "diagnostics.hpp"

namespace Kernval {

Diagnostics ValidateBuiltIn(const KernelContract&);

} // end namespace Kernval

#endif // __KERNVAL_SHAPE_CHECK_HPP__
