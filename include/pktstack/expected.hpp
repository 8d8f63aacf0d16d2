#pragma once

// Result vocabulary for pktstack.
//
// Decoders and builders report failure as a value, never by throwing:
// see CodecResult in detail/codec_result.hpp. The tl::expected names are
// pulled into pktstack so callers and decoders can write `unexpected(...)`
// without naming the backing library.

#include <tl/expected.hpp>

namespace pktstack {

using tl::expected;
using tl::make_unexpected;
using tl::unexpected;

} // namespace pktstack
