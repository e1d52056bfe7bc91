#pragma once

#include "annotated.hpp"
#include "body_parser.hpp"
#include "content_type.hpp"
#include "decode_options.hpp"
#include "decode_result.hpp"
#include "descriptor.hpp"
#include "error_formatting.hpp"
#include "errors.hpp"
#include "field_kind.hpp"
#include "form_decoder.hpp"
#include "form_value.hpp"
#include "json.hpp"
#include "options.hpp"
#include "scalars.hpp"
#include "scanner.hpp"
#include "struct_introspection.hpp"
#include "tag_resolver.hpp"
#include "time.hpp"
#include "urlencoded.hpp"
#include "xml.hpp"
