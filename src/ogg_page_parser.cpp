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

/* oggOpus - Ogg page parser
 * Implements RFC 3533 page framing over a complete in-memory buffer.
 * See ogg_page_parser.h for the API contract.
 */

#include <ogg_opus/ogg_page_parser.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace ogg_opus {

// Ogg page header field offsets (RFC 3533)
constexpr size_t OGG_VERSION_OFFSET = 4;
constexpr size_t OGG_HEADER_TYPE_OFFSET = 5;
constexpr size_t OGG_GRANULE_OFFSET = 6;         // Offset to granule_position field
constexpr size_t OGG_SERIAL_OFFSET = 14;         // Offset to stream_serial field
constexpr size_t OGG_SEQUENCE_OFFSET = 18;       // Offset to page_sequence field
constexpr size_t OGG_CHECKSUM_OFFSET = 22;       // Offset to checksum field
constexpr size_t OGG_SEGMENT_COUNT_OFFSET = 26;  // Offset to segment_count field

// Little-endian helpers
static inline uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

static inline uint64_t read_le64(const uint8_t* p) {
    return static_cast<uint64_t>(p[0]) | (static_cast<uint64_t>(p[1]) << 8) |
           (static_cast<uint64_t>(p[2]) << 16) | (static_cast<uint64_t>(p[3]) << 24) |
           (static_cast<uint64_t>(p[4]) << 32) | (static_cast<uint64_t>(p[5]) << 40) |
           (static_cast<uint64_t>(p[6]) << 48) | (static_cast<uint64_t>(p[7]) << 56);
}

// Sum segment table lacing values to get total page body size
static size_t calculate_body_size(const uint8_t* segment_table, uint8_t segment_count) {
    size_t total = 0;
    for (uint8_t i = 0; i < segment_count; i++) {
        total += segment_table[i];
    }
    return total;
}

const char* ogg_opus_result_to_string(OggOpusResult result) {
    switch (result) {
        case OGG_OK:
            return "OGG_OK";
        case OGG_INVALID_CAPTURE:
            return "OGG_INVALID_CAPTURE";
        case OGG_TRUNCATED_PAGE:
            return "OGG_TRUNCATED_PAGE";
        case OGG_NOT_OPUS:
            return "OGG_NOT_OPUS";
        case OGG_MALFORMED_HEADER:
            return "OGG_MALFORMED_HEADER";
        case OGG_STREAM_SERIAL_MISMATCH:
            return "OGG_STREAM_SERIAL_MISMATCH";
    }
    return "OGG_UNKNOWN_RESULT";
}

bool OggPage::payload_starts_with(const char* marker, size_t marker_len) const {
    if (payload_.size() < marker_len) {
        return false;
    }
    return std::memcmp(payload_.data(), marker, marker_len) == 0;
}

// ==============================================================================
// PUBLIC API: Page Parsing
// ==============================================================================

OggOpusResult parse_page(const uint8_t* data, size_t data_len, size_t offset, OggPage& page) {
    if (offset > data_len || data_len - offset < OGG_PAGE_HEADER_SIZE) {
        return OGG_TRUNCATED_PAGE;
    }

    const uint8_t* p = data + offset;
    size_t available = data_len - offset;

    // Check capture pattern "OggS"
    if (p[0] != 'O' || p[1] != 'g' || p[2] != 'g' || p[3] != 'S') {
        return OGG_INVALID_CAPTURE;
    }

    // Segment table must be fully present before it can be summed
    uint8_t segment_count = p[OGG_SEGMENT_COUNT_OFFSET];
    size_t header_size = OGG_PAGE_HEADER_SIZE + segment_count;
    if (available < header_size) {
        return OGG_TRUNCATED_PAGE;
    }

    const uint8_t* segment_table = p + OGG_PAGE_HEADER_SIZE;
    size_t page_size = header_size + calculate_body_size(segment_table, segment_count);
    if (available < page_size) {
        return OGG_TRUNCATED_PAGE;
    }

    // Parse header fields
    OggPageHeader header{};
    std::memcpy(header.capture_pattern, p, 4);
    header.version = p[OGG_VERSION_OFFSET];
    header.header_type = p[OGG_HEADER_TYPE_OFFSET];
    header.granule_position = read_le64(p + OGG_GRANULE_OFFSET);
    header.stream_serial = read_le32(p + OGG_SERIAL_OFFSET);
    header.page_sequence = read_le32(p + OGG_SEQUENCE_OFFSET);
    header.checksum = read_le32(p + OGG_CHECKSUM_OFFSET);
    header.segment_count = segment_count;

    page.header_ = header;
    page.segment_table_.assign(segment_table, segment_table + segment_count);
    page.payload_.assign(p + header_size, p + page_size);
    page.raw_bytes_.assign(p, p + page_size);

    return OGG_OK;
}

OggScanState split_pages(const uint8_t* data, size_t data_len, std::vector<OggPage>& pages) {
    OggScanState state{OGG_OK, 0, 0};
    pages.clear();

    size_t offset = 0;
    while (offset < data_len) {
        OggPage page;
        OggOpusResult result = parse_page(data, data_len, offset, page);
        if (result != OGG_OK) {
            // Graceful stop: keep what was collected so far
            state.result = result;
            break;
        }
        offset += page.total_size();
        pages.push_back(std::move(page));
    }

    state.bytes_consumed = offset;
    state.page_count = pages.size();

    sort_pages(pages);
    return state;
}

void sort_pages(std::vector<OggPage>& pages) {
    std::stable_sort(pages.begin(), pages.end(), [](const OggPage& a, const OggPage& b) {
        return a.page_sequence() < b.page_sequence();
    });
}

}  // namespace ogg_opus
