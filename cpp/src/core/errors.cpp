#include "pvperf/core/errors.hpp"
#include <utility>

namespace pvperf {

MalformedInputError::MalformedInputError(std::string source_id, SourceRole role, std::string reason)
    : std::runtime_error(
          "Malformed " + role_to_string(role) + " input '" + source_id + "': " + reason)
    , source_id_(std::move(source_id))
    , role_(role)
    , reason_(std::move(reason))
{}

} // namespace pvperf
