#pragma once

// Data model, mappings for standard and user types, and the formats that need
// no external library. The yyjson binding is included separately as
// <ShapeFusion/yyjson.hpp>.

#include "shape.hpp"
#include "errors.hpp"
#include "results.hpp"
#include "context.hpp"
#include "lifetime.hpp"
#include "visitor.hpp"
#include "serializer_concept.hpp"
#include "deserializer_concept.hpp"

#include "mapping.hpp"
#include "std_types.hpp"
#include "annotated.hpp"
#include "options.hpp"
#include "struct_mapping.hpp"
#include "enum_mapping.hpp"
#include "describe.hpp"

#include "tokens.hpp"
#include "compact.hpp"
#include "cbor.hpp"
