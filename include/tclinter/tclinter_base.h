/*
 * The core imports for tclinter. Use this to ensure the correct import order can be maintained.
 */

#ifndef TCLINTER_BASE_H
#define TCLINTER_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <tclinter/tclinter_export.h>
#include <tclinter/tclinter_forward_declarations.h>
#include <tclinter/util/errors.h>

#endif //TCLINTER_BASE_H
