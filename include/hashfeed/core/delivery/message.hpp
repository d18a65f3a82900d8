#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "hashfeed/core/topic.hpp"


namespace hashfeed::core::delivery {

// -----------------------------------------------------------------------------
// InboundMessage
// -----------------------------------------------------------------------------
//
// One message received from the broker, as handed to the consumer.
//
//   topic     - topic the broker delivered it on
//   payload   - raw bytes, typically "<username>: <message>" UTF-8 text
//   received  - wall-clock receipt time, taken on the I/O thread
//   sequence  - stamped by the DeliveryQueue on admission; strictly
//               increasing in delivery order, starting at 1. Zero means
//               "not admitted yet".
//
// Built once by the transport and never modified after admission.
// -----------------------------------------------------------------------------
struct InboundMessage {
    Topic topic;
    std::string payload;
    std::chrono::system_clock::time_point received{};
    std::uint64_t sequence{0};
};

} // namespace hashfeed::core::delivery
