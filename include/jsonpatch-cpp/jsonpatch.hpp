/// @file jsonpatch.hpp
/// @brief Umbrella header for the jsonpatch-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Pointer, Operation, Patch, the JSON and YAML codecs,
/// batch application, and Error.

#pragma once

#include <jsonpatch-cpp/batch.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/op.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>
#include <jsonpatch-cpp/yaml.hpp>
