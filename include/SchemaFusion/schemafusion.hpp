#pragma once

// Core engine. Loaders (yaml.hpp, yyjson.hpp) and record_binding.hpp are
// included separately, they need their third-party libraries.

#include "value.hpp"
#include "errors.hpp"
#include "path.hpp"
#include "type_descriptor.hpp"
#include "schema.hpp"
#include "schema_validator.hpp"
#include "construct_result.hpp"
#include "resolver.hpp"
#include "schema_builder.hpp"
#include "construct.hpp"
#include "error_formatting.hpp"
