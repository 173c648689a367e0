#pragma once

#include "cbors/types.hpp"
#include "cbors/error.hpp"
#include "cbors/options.hpp"
#include "cbors/io.hpp"
#include "cbors/utf8.hpp"
#include "cbors/encode.hpp"
#include "cbors/decode.hpp"
#include "cbors/value.hpp"
#include "cbors/shape.hpp"
#include "cbors/content.hpp"
#include "cbors/ser.hpp"
#include "cbors/de.hpp"
#include "cbors/codec.hpp"
#include "cbors/derive.hpp"
#include "cbors/api.hpp"
#include "cbors/bitsery.hpp"
