/*
 * The core imports for reflow. Use this to ensure the correct import order can be maintained.
 */

#ifndef REFLOW_BASE_H
#define REFLOW_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <reflow/reflow_export.h>
#include <reflow/reflow_forward_declarations.h>

#endif //REFLOW_BASE_H
