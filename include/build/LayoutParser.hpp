#pragma once
#include "model/Layout.hpp"

#include <string_view>

namespace gadgetimg::build {

// Parse and validate a gadget layout document (gadget.yaml). Structures are
// returned in declaration order. Throws ParseError, or its subclass
// FilesystemAssumptionViolation for offsets off a MiB boundary.
[[nodiscard]] model::LayoutSpec parse_layout(std::string_view text);

// Validation applied by parse_layout, exposed for layouts built in code.
void validate_volume(const model::Volume& volume);

} // namespace gadgetimg::build
