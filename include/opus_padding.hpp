//
//  opus_padding.hpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#pragma once
#include <cstddef>
#include <optional>

#include "ogg_page.hpp"

// Bytes a packet occupies on its page: one lacing value per segment plus the data.
size_t packet_page_footprint(const Packet &packet);

// Grow an Opus packet so that its page footprint increases by exactly
// `pad_length` bytes (RFC 6716 section 3.2.5). Code 0/1/2 packets are rewritten
// as code 3; code 3 packets that already carry padding are refused, as are
// sizes the length bytes and lacing values cannot land on exactly.
std::optional<Packet> pad_packet(const Packet &packet, size_t pad_length);
