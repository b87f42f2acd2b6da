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

/* oggOpus - Opus header extractor
 * Locates the RFC 7845 identification and comment headers in an Ogg stream
 *
 * Audio packets are never decoded
 */

#ifndef OGG_OPUS_OPUS_STREAM_EXTRACTOR_H
#define OGG_OPUS_OPUS_STREAM_EXTRACTOR_H

#include <ogg_opus/ogg_page_parser.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ogg_opus {

// Opus constants (RFC 7845)
constexpr char OPUS_HEAD_MAGIC[] = "OpusHead";
constexpr char OPUS_TAGS_MAGIC[] = "OpusTags";
constexpr size_t OPUS_MAGIC_SIZE = 8;
constexpr uint32_t OPUS_DECODE_SAMPLE_RATE = 48000;  // Fixed Opus decoding rate
constexpr uint32_t OPUS_COMMENT_HEADER_SEQUENCE = 1;  // Page the comment header starts on

/**
 * @brief Handling of durations computed from decreasing granule positions
 */
enum DurationPolicy : uint8_t {
    DURATION_CLAMP_TO_ZERO = 0,   // Negative durations are reported as 0.0
    DURATION_ALLOW_NEGATIVE = 1,  // Negative durations are returned unchanged
};

/**
 * @brief Configuration for OpusStreamExtractor
 */
struct OpusExtractorConfig {
    uint32_t sample_rate = OPUS_DECODE_SAMPLE_RATE;  // Rate used by page_duration()
    DurationPolicy duration_policy = DURATION_CLAMP_TO_ZERO;
    bool require_single_serial = true;  // Reject buffers with more than one serial number
};

/**
 * @brief State machine that reassembles the comment header packet
 *
 * Pages are fed in sequence order. In SEARCHING the collector waits for the
 * page with sequence number 1, which is where RFC 7845 places the comment
 * header after the single identification header page. In COLLECTING every
 * page is appended; the first page after the starting one whose
 * continuation flag is clear ends the packet and moves to COMPLETE.
 *
 * If the pages run out while still COLLECTING the packet is incomplete and
 * take_pages() yields nothing.
 */
class CommentHeaderCollector {
public:
    enum State : uint8_t {
        STATE_SEARCHING,   // Waiting for the first comment header page
        STATE_COLLECTING,  // Accumulating continuation pages
        STATE_COMPLETE     // Packet terminated on the last appended page
    };

    /**
     * @brief Feed the next page in sequence order
     * @return true once the packet is complete and no more pages are needed
     */
    bool feed(const OggPage& page);

    State state() const { return state_; }
    bool is_complete() const { return state_ == STATE_COMPLETE; }

    /**
     * @brief Move the collected pages out
     * @return false (and out left empty) unless the packet is complete
     */
    bool take_pages(std::vector<const OggPage*>& out);

    void reset();

private:
    State state_{STATE_SEARCHING};
    std::vector<const OggPage*> pages_;
};

/**
 * @brief Check the Ogg capture pattern at the start of a buffer
 */
bool is_ogg_stream(const uint8_t* data, size_t data_len);

/**
 * @brief Check whether any page carries an "OpusHead" packet
 */
bool is_opus_stream(const std::vector<OggPage>& pages);

/**
 * @brief Check that every page shares the serial number of the first page
 */
bool is_single_stream(const std::vector<OggPage>& pages);

/**
 * @brief First page, in collection order, whose payload starts with "OpusHead"
 * @return Pointer into pages, or nullptr when not found
 */
const OggPage* find_id_header(const std::vector<OggPage>& pages);

/**
 * @brief Collect the pages making up the comment header packet
 * @param pages Page collection sorted by sequence number
 * @param out Output, pointers into pages; cleared first
 * @return false when no complete packet starting on page 1 exists
 */
bool find_comment_header(const std::vector<OggPage>& pages, std::vector<const OggPage*>& out);

/**
 * @brief Duration between two granule positions, in seconds
 *
 * @param current Granule position of the current page
 * @param previous Granule position of the previous page, nullptr for the first page
 * @param sample_rate Samples per second
 * @param policy What to do when current < previous
 * @return 0.0 for the first page, (current - previous) / sample_rate otherwise
 */
double page_duration(uint64_t current, const uint64_t* previous,
                     uint32_t sample_rate = OPUS_DECODE_SAMPLE_RATE,
                     DurationPolicy policy = DURATION_CLAMP_TO_ZERO);

/**
 * @brief Read the input sample rate field of an identification header
 *
 * @param id_header Page whose payload is an "OpusHead" packet
 * @param sample_rate Output, little-endian u32 at payload offset 12
 * @return OGG_OK, or OGG_MALFORMED_HEADER if the payload is shorter than 16 bytes
 */
OggOpusResult read_input_sample_rate(const OggPage& id_header, uint32_t& sample_rate);

/**
 * @brief Opus header extractor over one complete Ogg buffer
 *
 * Validation order in extract():
 * - OGG_INVALID_CAPTURE: the buffer does not start with "OggS"
 * - OGG_STREAM_SERIAL_MISMATCH: more than one serial number (when configured)
 * - OGG_NOT_OPUS: no page carries "OpusHead"
 *
 * A truncated trailing page is not an error: the scan keeps the pages in
 * front of it and scan_state() reports why it stopped. A missing
 * identification or comment header is reported through id_header() and
 * has_comment_header(), not through the result code.
 *
 * Thread Safety:
 * - Each instance must be used from a single thread only
 * - Instances share no state, so separate buffers can be processed in parallel
 *
 * Usage:
 * @code
 * OpusStreamExtractor extractor;
 * if (extractor.extract(buffer, buffer_len) == OGG_OK && extractor.id_header()) {
 *     uint32_t rate = 0;
 *     extractor.input_sample_rate(rate);
 * }
 * @endcode
 */
class OpusStreamExtractor {
public:
    OpusStreamExtractor(const OpusExtractorConfig& config = OpusExtractorConfig{});

    // Header pointers refer into pages_
    OpusStreamExtractor(const OpusStreamExtractor&) = delete;
    OpusStreamExtractor& operator=(const OpusStreamExtractor&) = delete;

    /**
     * @brief Parse a complete Ogg buffer and locate the Opus headers
     *
     * Discards the results of any previous call.
     *
     * @param data Input buffer
     * @param data_len Input buffer length
     * @return OGG_OK or the first structural error
     */
    OggOpusResult extract(const uint8_t* data, size_t data_len);

    /**
     * @brief Drop all pages and headers
     */
    void reset();

    // Pages sorted by sequence number; still valid after OGG_NOT_OPUS
    const std::vector<OggPage>& pages() const { return pages_; }
    const OggScanState& scan_state() const { return scan_state_; }

    // nullptr when no identification header was found
    const OggPage* id_header() const { return id_header_; }

    bool has_comment_header() const { return !comment_header_.empty(); }
    const std::vector<const OggPage*>& comment_header() const { return comment_header_; }

    /**
     * @brief Reassemble the comment header packet from its pages
     *
     * The collected pages can extend past the end of the packet, so the
     * bytes are taken segment by segment up to the first lacing value
     * below 255.
     *
     * @return false when there is no comment header or the packet never ends
     */
    bool comment_packet(std::vector<uint8_t>& packet) const;

    /**
     * @brief Input sample rate from the identification header
     * @return OGG_NOT_OPUS without an identification header, else see read_input_sample_rate()
     */
    OggOpusResult input_sample_rate(uint32_t& sample_rate) const;

    /**
     * @brief Duration covered by page index, measured from page index - 1
     *
     * Uses the configured sample rate and duration policy. Index 0 (and any
     * index past the end) yields 0.0.
     */
    double page_duration(size_t index) const;

#ifdef OGG_OPUS_DEBUG
    /**
     * @brief Get scan statistics
     * @param pages_scanned Output: pages collected by the last extract()
     * @param bytes_skipped Output: trailing bytes not covered by a page
     */
    void get_stats(size_t& pages_scanned, size_t& bytes_skipped) const {
        pages_scanned = scan_state_.page_count;
        bytes_skipped = input_length_ - scan_state_.bytes_consumed;
    }
#endif  // OGG_OPUS_DEBUG

private:
    OpusExtractorConfig config_;

    std::vector<OggPage> pages_;
    std::vector<const OggPage*> comment_header_;
    const OggPage* id_header_{nullptr};

    OggScanState scan_state_{OGG_OK, 0, 0};
    size_t input_length_{0};
};

}  // namespace ogg_opus

#endif  // OGG_OPUS_OPUS_STREAM_EXTRACTOR_H
