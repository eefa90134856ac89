#pragma once

#include "core/conflict_resolver.hpp"
#include <set>
#include <string>

namespace tidemark::sync {

/**
 * MergeFunction for JSON object payloads whose fields have a single owner.
 *
 * Fields named in `local_owned` keep the local value (or stay absent if the
 * local payload lacks them); every other field takes the remote value. Keys
 * come out sorted, so equal inputs give byte-identical output. Fails if either
 * payload is not a JSON object.
 */
[[nodiscard]] MergeFunction json_field_merge(std::set<std::string> local_owned);

} // namespace tidemark::sync
