/***
 * Name: pymarshal::codec (public API)
 * Purpose: One-call entry points for decoding and encoding marshal data.
 * Inputs: Bytes or an Object tree, the Python release, optional per-call options
 * Outputs: DecodeResult or encoded bytes
 * Theory of Operation: Resolve the VersionTable (UnsupportedVersionError before
 *   any byte is touched), then run a fresh Decoder/Encoder. No state survives
 *   a call, so independent calls may run concurrently.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pymarshal/codec/options.h"
#include "pymarshal/object/object.h"
#include "pymarshal/object/reference_table.h"
#include "pymarshal/version/py_version.h"

namespace pymarshal::codec {

DecodeResult Decode(const std::uint8_t* data, std::size_t size, version::PyVersion version,
                    const DecodeOptions& options = DecodeOptions{});
DecodeResult Decode(const std::vector<std::uint8_t>& bytes, version::PyVersion version,
                    const DecodeOptions& options = DecodeOptions{});

std::vector<std::uint8_t> Encode(const object::Object& root, const object::ReferenceTable& refs,
                                 version::PyVersion version, const EncodeOptions& options = EncodeOptions{});

}  // namespace pymarshal::codec
