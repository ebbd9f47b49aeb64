#pragma once

#include "pvperf/core/types.hpp"
#include <stdexcept>
#include <string>

namespace pvperf {

/// Structural failure of one input file (wrong sheet, missing header rows,
/// too few columns). Fatal for that file only.
class MalformedInputError : public std::runtime_error {
public:
    MalformedInputError(std::string source_id, SourceRole role, std::string reason);

    const std::string& source_id() const { return source_id_; }
    SourceRole role() const { return role_; }
    const std::string& reason() const { return reason_; }

private:
    std::string source_id_;
    SourceRole role_;
    std::string reason_;
};

} // namespace pvperf
