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
 * Implements RFC 7845 section 5 header location on top of the page parser.
 * See opus_stream_extractor.h for the API contract.
 */

#include <ogg_opus/opus_stream_extractor.h>

namespace ogg_opus {

// Identification header field offsets (RFC 7845 section 5.1)
constexpr size_t OPUS_HEAD_SAMPLE_RATE_OFFSET = 12;
constexpr size_t OPUS_HEAD_SAMPLE_RATE_END = 16;

static inline uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

// ==============================================================================
// CommentHeaderCollector
// ==============================================================================

bool CommentHeaderCollector::feed(const OggPage& page) {
    switch (state_) {
        case STATE_SEARCHING:
            // Positional start, the page content is not inspected
            if (page.page_sequence() == OPUS_COMMENT_HEADER_SEQUENCE) {
                pages_.push_back(&page);
                state_ = STATE_COLLECTING;
            }
            return false;

        case STATE_COLLECTING:
            pages_.push_back(&page);
            if (!page.is_continued()) {
                state_ = STATE_COMPLETE;
                return true;
            }
            return false;

        case STATE_COMPLETE:
            return true;
    }
    return false;
}

bool CommentHeaderCollector::take_pages(std::vector<const OggPage*>& out) {
    out.clear();
    if (state_ != STATE_COMPLETE) {
        return false;
    }
    out.swap(pages_);
    pages_.clear();
    return true;
}

void CommentHeaderCollector::reset() {
    state_ = STATE_SEARCHING;
    pages_.clear();
}

// ==============================================================================
// PUBLIC API: Stream Classification
// ==============================================================================

bool is_ogg_stream(const uint8_t* data, size_t data_len) {
    if (data_len < 4) {
        return false;
    }
    return data[0] == 'O' && data[1] == 'g' && data[2] == 'g' && data[3] == 'S';
}

bool is_opus_stream(const std::vector<OggPage>& pages) {
    return find_id_header(pages) != nullptr;
}

bool is_single_stream(const std::vector<OggPage>& pages) {
    for (const OggPage& page : pages) {
        if (page.serial_number() != pages.front().serial_number()) {
            return false;
        }
    }
    return true;
}

// ==============================================================================
// PUBLIC API: Header Location
// ==============================================================================

const OggPage* find_id_header(const std::vector<OggPage>& pages) {
    for (const OggPage& page : pages) {
        if (page.payload_starts_with(OPUS_HEAD_MAGIC, OPUS_MAGIC_SIZE)) {
            return &page;
        }
    }
    return nullptr;
}

bool find_comment_header(const std::vector<OggPage>& pages, std::vector<const OggPage*>& out) {
    CommentHeaderCollector collector;
    for (const OggPage& page : pages) {
        if (collector.feed(page)) {
            break;
        }
    }
    return collector.take_pages(out);
}

double page_duration(uint64_t current, const uint64_t* previous, uint32_t sample_rate,
                     DurationPolicy policy) {
    if (previous == nullptr || sample_rate == 0) {
        return 0.0;
    }

    // Signed difference so a decreasing granule position is visible as negative
    double samples = static_cast<double>(static_cast<int64_t>(current - *previous));
    double duration = samples / static_cast<double>(sample_rate);

    if (duration < 0.0 && policy == DURATION_CLAMP_TO_ZERO) {
        return 0.0;
    }
    return duration;
}

OggOpusResult read_input_sample_rate(const OggPage& id_header, uint32_t& sample_rate) {
    const std::vector<uint8_t>& payload = id_header.payload();
    if (payload.size() < OPUS_HEAD_SAMPLE_RATE_END) {
        return OGG_MALFORMED_HEADER;
    }
    sample_rate = read_le32(payload.data() + OPUS_HEAD_SAMPLE_RATE_OFFSET);
    return OGG_OK;
}

// ==============================================================================
// OpusStreamExtractor
// ==============================================================================

OpusStreamExtractor::OpusStreamExtractor(const OpusExtractorConfig& config) : config_(config) {
    // Fall back to the Opus decoding rate rather than divide by zero later
    if (config_.sample_rate == 0) {
        config_.sample_rate = OPUS_DECODE_SAMPLE_RATE;
    }
}

void OpusStreamExtractor::reset() {
    pages_.clear();
    comment_header_.clear();
    id_header_ = nullptr;
    scan_state_ = OggScanState{OGG_OK, 0, 0};
    input_length_ = 0;
}

OggOpusResult OpusStreamExtractor::extract(const uint8_t* data, size_t data_len) {
    reset();
    input_length_ = data_len;

    // Fast top-level gate before any page parsing
    if (!is_ogg_stream(data, data_len)) {
        return OGG_INVALID_CAPTURE;
    }

    // A truncated or corrupt tail only shortens the page list
    scan_state_ = split_pages(data, data_len, pages_);

    // Sorting by sequence number is only meaningful for one logical bitstream
    if (config_.require_single_serial && !is_single_stream(pages_)) {
        return OGG_STREAM_SERIAL_MISMATCH;
    }

    if (!is_opus_stream(pages_)) {
        return OGG_NOT_OPUS;
    }

    id_header_ = find_id_header(pages_);
    find_comment_header(pages_, comment_header_);

    return OGG_OK;
}

bool OpusStreamExtractor::comment_packet(std::vector<uint8_t>& packet) const {
    packet.clear();

    // The packet ends on the first lacing value below 255
    for (const OggPage* page : comment_header_) {
        const std::vector<uint8_t>& lacing = page->segment_table();
        const uint8_t* body = page->payload().data();
        for (uint8_t value : lacing) {
            packet.insert(packet.end(), body, body + value);
            body += value;
            if (value < OGG_MAX_LACING_VALUE) {
                return true;
            }
        }
    }

    packet.clear();
    return false;
}

OggOpusResult OpusStreamExtractor::input_sample_rate(uint32_t& sample_rate) const {
    if (id_header_ == nullptr) {
        return OGG_NOT_OPUS;
    }
    return read_input_sample_rate(*id_header_, sample_rate);
}

double OpusStreamExtractor::page_duration(size_t index) const {
    if (index == 0 || index >= pages_.size()) {
        return 0.0;
    }
    uint64_t previous = pages_[index - 1].granule_position();
    return ogg_opus::page_duration(pages_[index].granule_position(), &previous,
                                   config_.sample_rate, config_.duration_policy);
}

}  // namespace ogg_opus
