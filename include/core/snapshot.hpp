#pragma once

#include <string>

#include "ide/state.hpp"
#include "model/review.hpp"

namespace revue::core {

// Language tag from the file extension; "plaintext" when unknown.
std::string language_for_path(const std::string& path);

const char* severity_for_comment(model::CommentType type);

// Full snapshot of the session as tool handlers see it.
ide::ReviewStateSnapshot build_snapshot(const model::ReviewSession& session);

}  // namespace revue::core
