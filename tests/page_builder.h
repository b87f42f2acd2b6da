// Copyright 2025 Kevin Ahrendt
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// In-memory Ogg page builder for tests. CRC fields are left at zero.

#ifndef OGG_OPUS_TESTS_PAGE_BUILDER_H
#define OGG_OPUS_TESTS_PAGE_BUILDER_H

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace ogg_opus_test {

inline void put_le(std::vector<uint8_t>& out, uint64_t value, size_t bytes) {
    for (size_t i = 0; i < bytes; i++) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

// Lacing values for a payload that ends a packet on this page
inline std::vector<uint8_t> lacing_for(size_t payload_len) {
    std::vector<uint8_t> lacing(payload_len / 255, 255);
    lacing.push_back(static_cast<uint8_t>(payload_len % 255));
    return lacing;
}

inline std::vector<uint8_t> build_page(uint32_t sequence, uint8_t header_type, uint64_t granule,
                                       const std::vector<uint8_t>& payload,
                                       uint32_t serial = 0x1234abcd) {
    std::vector<uint8_t> lacing = lacing_for(payload.size());

    std::vector<uint8_t> page = {'O', 'g', 'g', 'S', 0x00, header_type};
    put_le(page, granule, 8);
    put_le(page, serial, 4);
    put_le(page, sequence, 4);
    put_le(page, 0, 4);
    page.push_back(static_cast<uint8_t>(lacing.size()));
    page.insert(page.end(), lacing.begin(), lacing.end());
    page.insert(page.end(), payload.begin(), payload.end());
    return page;
}

inline std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// "OpusHead" + 11 bytes: version 1, stereo, pre-skip 312, input rate, gain 0, family 0
inline std::vector<uint8_t> opus_head(uint32_t input_sample_rate = 44100) {
    std::vector<uint8_t> head = bytes_of("OpusHead");
    head.push_back(1);
    head.push_back(2);
    put_le(head, 312, 2);
    put_le(head, input_sample_rate, 4);
    put_le(head, 0, 2);
    head.push_back(0);
    return head;
}

inline std::vector<uint8_t> opus_tags(const std::string& vendor) {
    std::vector<uint8_t> tags = bytes_of("OpusTags");
    put_le(tags, vendor.size(), 4);
    tags.insert(tags.end(), vendor.begin(), vendor.end());
    put_le(tags, 0, 4);
    return tags;
}

inline void append(std::vector<uint8_t>& stream, const std::vector<uint8_t>& page) {
    stream.insert(stream.end(), page.begin(), page.end());
}

}  // namespace ogg_opus_test

#endif  // OGG_OPUS_TESTS_PAGE_BUILDER_H
