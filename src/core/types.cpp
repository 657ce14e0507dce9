#include "ybus/core/types.h"

#include "ybus/core/errors.h"

namespace ybus {

ResolveMode resolve_mode_from_string(std::string const& name) {
    if (name == "replace") return ResolveMode::REPLACE;
    if (name == "add") return ResolveMode::ADD;
    throw InvalidMode(name);
}

}  // namespace ybus
