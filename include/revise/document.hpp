#pragma once

#include <nlohmann/json.hpp>

namespace revise {

// A template is an opaque tree of scalars, sequences and mappings. Migrations
// may restructure it freely; the versioning code only passes it along.
// Insertion order is kept so backups read back the way they were written.
using Document = nlohmann::ordered_json;

} // namespace revise
