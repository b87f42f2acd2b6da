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

/* ogg_opus_info - print the Opus headers of an Ogg file
 *
 * Usage: ogg_opus_info <file.opus>
 */

#include <ogg_opus/opus_stream_extractor.h>

#include <cinttypes>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <vector>

using namespace ogg_opus;

static bool read_file(const char* path, std::vector<uint8_t>& data) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

static void print_page(const OggPage& page) {
    std::printf("  page %" PRIu32 ": serial=0x%08" PRIx32 " type=0x%02x granule=%" PRIu64
                " segments=%u payload=%zu bytes raw=%zu bytes\n",
                page.page_sequence(), page.serial_number(), page.header_type(),
                page.granule_position(), static_cast<unsigned>(page.segment_count()),
                page.payload().size(), page.total_size());
}

int main(int argc, char** argv) {
    if (argc != 2) {
        std::fprintf(stderr, "usage: %s <file.opus>\n", argv[0]);
        return 2;
    }

    std::vector<uint8_t> data;
    if (!read_file(argv[1], data)) {
        std::fprintf(stderr, "%s: cannot read file\n", argv[1]);
        return 1;
    }

    OpusStreamExtractor extractor;
    OggOpusResult result = extractor.extract(data.data(), data.size());
    if (result != OGG_OK) {
        std::fprintf(stderr, "%s: %s\n", argv[1], ogg_opus_result_to_string(result));
        return 1;
    }

    const OggScanState& scan = extractor.scan_state();
    if (scan.result != OGG_OK) {
        std::fprintf(stderr, "%s: scan stopped at byte %zu (%s), %zu pages kept\n", argv[1],
                     scan.bytes_consumed, ogg_opus_result_to_string(scan.result),
                     scan.page_count);
    }

    std::printf("ID header:\n");
    if (extractor.id_header() != nullptr) {
        print_page(*extractor.id_header());
        uint32_t sample_rate = 0;
        if (extractor.input_sample_rate(sample_rate) == OGG_OK) {
            std::printf("  input sample rate: %" PRIu32 " Hz\n", sample_rate);
        } else {
            std::printf("  input sample rate: header too short\n");
        }
    } else {
        std::printf("  not found\n");
    }

    std::printf("Comment header:\n");
    if (extractor.has_comment_header()) {
        for (const OggPage* page : extractor.comment_header()) {
            print_page(*page);
        }
    } else {
        std::printf("  not found\n");
    }

    return 0;
}
