#pragma once

#include <s2_proto/convert.hpp>
#include <s2_proto/errors.hpp>
#include <s2_proto/json.hpp>
#include <s2_proto/scalars.hpp>
#include <s2_proto/timestamp.hpp>
