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
 * Splits an in-memory Ogg buffer into RFC 3533 pages
 *
 * CRC checksums are stored but never verified
 */

#ifndef OGG_OPUS_OGG_PAGE_PARSER_H
#define OGG_OPUS_OGG_PAGE_PARSER_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ogg_opus {

// Ogg container constants (RFC 3533)
constexpr size_t OGG_PAGE_HEADER_SIZE = 27;  // Fixed header before segment table
constexpr uint8_t OGG_MAX_LACING_VALUE = 255;  // Lacing value indicating packet continues

/**
 * @brief Ogg page header structure (per RFC 3533)
 */
struct OggPageHeader {
    uint8_t capture_pattern[4];  // "OggS"
    uint8_t version;             // Stream structure version (0x00, not enforced)
    uint8_t header_type;         // Bitfield (continuation, bos, eos)
    uint64_t granule_position;   // Codec-specific position info
    uint32_t stream_serial;      // Logical bitstream serial number
    uint32_t page_sequence;      // Page sequence number
    uint32_t checksum;           // CRC checksum (never verified)
    uint8_t segment_count;       // Number of segments in page
};

/**
 * @brief Header type flags
 *
 * Bits 3-7 are reserved and ignored.
 */
enum OggHeaderType : uint8_t {
    OGG_CONTINUED_PACKET = 0x01,     // Packet continued from previous page
    OGG_BEGINNING_OF_STREAM = 0x02,  // First page of logical bitstream
    OGG_END_OF_STREAM = 0x04         // Last page of logical bitstream
};

/**
 * @brief Result codes shared by the page parser and the Opus extractor
 */
enum OggOpusResult : int8_t {
    OGG_OK = 0,  // Success

    // Format errors
    OGG_INVALID_CAPTURE = -1,   // Missing "OggS" capture pattern (not Ogg)
    OGG_TRUNCATED_PAGE = -2,    // Page extends past the end of the buffer
    OGG_NOT_OPUS = -3,          // No page carries an "OpusHead" packet
    OGG_MALFORMED_HEADER = -4,  // Opus header too short for the requested field

    // Stream structure errors
    OGG_STREAM_SERIAL_MISMATCH = -5  // More than one logical bitstream in the buffer
};

/**
 * @brief Printable name of a result code
 */
const char* ogg_opus_result_to_string(OggOpusResult result);

/**
 * @brief One Ogg page, copied out of the input buffer
 *
 * A page owns its segment table, its payload and its complete raw bytes
 * (header + segment table + payload), so it stays valid after the input
 * buffer is released. It is filled once by parse_page() and not modified
 * afterwards.
 */
class OggPage {
public:
    OggPage() = default;

    const OggPageHeader& header() const { return header_; }

    uint8_t version() const { return header_.version; }
    uint8_t header_type() const { return header_.header_type; }
    uint64_t granule_position() const { return header_.granule_position; }
    uint32_t serial_number() const { return header_.stream_serial; }
    uint32_t page_sequence() const { return header_.page_sequence; }
    uint32_t checksum() const { return header_.checksum; }
    uint8_t segment_count() const { return header_.segment_count; }

    bool is_continued() const { return (header_.header_type & OGG_CONTINUED_PACKET) != 0; }
    bool is_bos() const { return (header_.header_type & OGG_BEGINNING_OF_STREAM) != 0; }
    bool is_eos() const { return (header_.header_type & OGG_END_OF_STREAM) != 0; }

    const std::vector<uint8_t>& segment_table() const { return segment_table_; }
    const std::vector<uint8_t>& payload() const { return payload_; }
    const std::vector<uint8_t>& raw_bytes() const { return raw_bytes_; }

    // 27 + segment_count + sum(segment_table)
    size_t total_size() const { return raw_bytes_.size(); }

    /**
     * @brief Check whether the payload begins with the given marker
     * @param marker Marker bytes (not null terminated)
     * @param marker_len Marker length in bytes
     */
    bool payload_starts_with(const char* marker, size_t marker_len) const;

private:
    friend OggOpusResult parse_page(const uint8_t* data, size_t data_len, size_t offset,
                                    OggPage& page);

    OggPageHeader header_{};
    std::vector<uint8_t> segment_table_;
    std::vector<uint8_t> payload_;
    std::vector<uint8_t> raw_bytes_;
};

/**
 * @brief Outcome of split_pages()
 *
 * result is OGG_OK when the scan reached the end of the buffer exactly
 * (an empty buffer included). Otherwise it holds the parse_page() error at
 * offset bytes_consumed that stopped the scan. page_count == 0 together
 * with an error means no page could be parsed at offset 0.
 */
struct OggScanState {
    OggOpusResult result;   // Why the scan stopped
    size_t bytes_consumed;  // Bytes covered by the collected pages
    size_t page_count;      // Pages collected before the scan stopped
};

/**
 * @brief Parse a single Ogg page starting at offset
 *
 * Never reads past offset + total page size. A page whose segment table or
 * payload runs past data_len is rejected instead of being cut short.
 *
 * @param data Input buffer
 * @param data_len Input buffer length
 * @param offset Start of the page within data
 * @param page Output page, only written on OGG_OK
 * @return OGG_OK, OGG_INVALID_CAPTURE or OGG_TRUNCATED_PAGE
 */
OggOpusResult parse_page(const uint8_t* data, size_t data_len, size_t offset, OggPage& page);

/**
 * @brief Split a complete Ogg buffer into pages
 *
 * Pages are parsed back to back from offset 0. The first page that fails to
 * parse ends the scan; pages collected up to that point are kept. The
 * collected pages are then stable-sorted by page sequence number.
 *
 * @param data Input buffer (may be nullptr when data_len is 0)
 * @param data_len Input buffer length
 * @param pages Output collection, replaced by the pages found
 * @return Scan outcome, see OggScanState
 *
 * Usage:
 * @code
 * std::vector<OggPage> pages;
 * OggScanState scan = split_pages(buffer, buffer_len, pages);
 * if (scan.result != OGG_OK) {
 *     // Trailing bytes at scan.bytes_consumed were not a complete page
 * }
 * @endcode
 */
OggScanState split_pages(const uint8_t* data, size_t data_len, std::vector<OggPage>& pages);

/**
 * @brief Stable sort by page sequence number, ascending
 *
 * Pages sharing a sequence number keep their relative order.
 */
void sort_pages(std::vector<OggPage>& pages);

}  // namespace ogg_opus

#endif  // OGG_OPUS_OGG_PAGE_PARSER_H
