#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace issueflow::core {

/*
  Converts a failed db::Result into the matching util exception.

    NotFound       -> util::NotFound
    AlreadyExists  -> util::AlreadyExists
    Conflict       -> util::Conflict
    Busy/Timeout/
    Unavailable    -> util::StoreUnavailable
    Constraint     -> util::ValidationError
    anything else  -> std::runtime_error
*/
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace issueflow::core
