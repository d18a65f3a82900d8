#pragma once

/*
===============================================================================
hashfeed - Public API Entry Point
===============================================================================

hashfeed exposes a broker-backed hashtag feed client (hashfeed::Client) built
on top of the header-only hashfeed core (hashfeed::core).

Applications and tools include this header. Embedders that bring their own
transport include the core headers directly and instantiate
core::Session<Transport>.
===============================================================================
*/

#include <hashfeed/version.hpp>
#include <hashfeed/error.hpp>
#include <hashfeed/client.hpp>
#include <hashfeed/log/logger.hpp>
