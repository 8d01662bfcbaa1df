#ifndef __OTEL_DERIVE_TELEMETRY_TELEMETRY_H__
#define __OTEL_DERIVE_TELEMETRY_TELEMETRY_H__

// Umbrella header for the telemetry attribute data model. Headers generated by `otel_derive_gen`
// include this one.

#include "telemetry/convert.h"    // IWYU pragma: export
#include "telemetry/key.h"        // IWYU pragma: export
#include "telemetry/key_value.h"  // IWYU pragma: export
#include "telemetry/value.h"      // IWYU pragma: export

#endif  // __OTEL_DERIVE_TELEMETRY_TELEMETRY_H__
