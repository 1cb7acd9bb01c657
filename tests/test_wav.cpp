#include <catch2/catch_test_macros.hpp>

#include "audio/wav.hpp"
#include "test_support.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

namespace {

// Read a little-endian uint16 from raw bytes.
uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

// Read a little-endian uint32 from raw bytes.
uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

void put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// Hand-built WAV with an arbitrary format and a LIST chunk ahead of the data.
std::vector<uint8_t> build_wav(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits,
                               const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out;
    put_tag(out, "RIFF");
    put32(out, 0); // patched below
    put_tag(out, "WAVE");
    put_tag(out, "fmt ");
    put32(out, 16);
    put16(out, format);
    put16(out, channels);
    put32(out, rate);
    put32(out, rate * channels * bits / 8);
    put16(out, static_cast<uint16_t>(channels * bits / 8));
    put16(out, bits);
    put_tag(out, "LIST");
    put32(out, 5);
    out.insert(out.end(), {'I', 'N', 'F', 'O', 'x', 0}); // odd size plus pad byte
    put_tag(out, "data");
    put32(out, static_cast<uint32_t>(data.size()));
    out.insert(out.end(), data.begin(), data.end());
    uint32_t riff = static_cast<uint32_t>(out.size() - 8);
    std::memcpy(out.data() + 4, &riff, 4);
    return out;
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
    }

    SECTION("HeaderSize") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(wav.size() == 44 + samples.size() * 2);
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);

        // fmt chunk size
        REQUIRE(read_u32(wav.data() + 16) == 16);
        // PCM format
        REQUIRE(read_u16(wav.data() + 20) == 1);
        // channels
        REQUIRE(read_u16(wav.data() + 22) == 1);
        // sample rate
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        // byte rate = sample_rate * channels * bits/8
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 1 * 16 / 8);
        // block align
        REQUIRE(read_u16(wav.data() + 32) == 2);
        // bits per sample
        REQUIRE(read_u16(wav.data() + 34) == 16);
        // data chunk size
        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
        REQUIRE(read_u32(wav.data() + 40) == data_size);
        // RIFF chunk size = file_size - 8 = 36 + data_size
        REQUIRE(read_u32(wav.data() + 4) == 36 + data_size);
    }

    SECTION("DataIntegrity") {
        auto wav = wav::encode(samples, sample_rate);
        auto* data_ptr = reinterpret_cast<const int16_t*>(wav.data() + 44);
        for (size_t i = 0; i < samples.size(); ++i) {
            REQUIRE(data_ptr[i] == samples[i]);
        }
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == 44);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("wav::parse_header", "[wav]") {

    SECTION("CanonicalFile") {
        std::vector<int16_t> samples(16000, 7);
        auto bytes = wav::encode(samples, 16000);
        auto h = wav::parse_header(bytes);
        REQUIRE(h);
        REQUIRE(h->format == wav::kFormatPcm);
        REQUIRE(h->channels == 1);
        REQUIRE(h->sample_rate == 16000);
        REQUIRE(h->bits_per_sample == 16);
        REQUIRE(h->data_offset == 44);
        REQUIRE(h->frame_count() == 16000);
        REQUIRE(h->duration_seconds() == 1.0);
        REQUIRE(h->is_canonical(16000));
        REQUIRE_FALSE(h->is_canonical(8000));
    }

    SECTION("SkipsUnknownChunks") {
        std::vector<uint8_t> data = {1, 2, 3, 4, 5, 6, 7, 8};
        auto bytes = build_wav(wav::kFormatPcm, 2, 8000, 16, data);
        auto h = wav::parse_header(bytes);
        REQUIRE(h);
        REQUIRE(h->channels == 2);
        REQUIRE(h->data_size == 8);
        REQUIRE(h->frame_count() == 2);
        REQUIRE(h->data_offset == bytes.size() - 8);
        REQUIRE_FALSE(h->is_canonical(8000));
    }

    SECTION("TruncatedDataIsClamped") {
        std::vector<int16_t> samples(100, 1);
        auto bytes = wav::encode(samples, 16000);
        bytes.resize(44 + 50);
        auto h = wav::parse_header(bytes);
        REQUIRE(h);
        REQUIRE(h->data_size == 50);
        REQUIRE(h->frame_count() == 25);
    }

    SECTION("RejectsGarbage") {
        std::vector<uint8_t> junk(64, 0x41);
        REQUIRE_FALSE(wav::parse_header(junk));
        std::vector<uint8_t> tiny = {'R', 'I', 'F', 'F'};
        REQUIRE_FALSE(wav::parse_header(tiny));
    }

    SECTION("RejectsMissingData") {
        auto bytes = wav::encode(std::vector<int16_t>{}, 16000);
        bytes.resize(36); // fmt chunk only
        auto h = wav::parse_header(bytes);
        REQUIRE_FALSE(h);
    }
}

TEST_CASE("wav file readers", "[wav]") {
    testing::TmpDir dir;
    auto path = dir.path / "in.wav";

    SECTION("ReadFramesWindow") {
        std::vector<int16_t> samples(1000);
        for (size_t i = 0; i < samples.size(); ++i) samples[i] = static_cast<int16_t>(i);
        testing::write_file(path, wav::encode(samples, 1000));

        auto h = wav::read_header(path);
        REQUIRE(h);
        auto frames = wav::read_frames(path, *h, 200, 10);
        REQUIRE(frames);
        REQUIRE(frames->size() == 10);
        REQUIRE(frames->front() == 200);
        REQUIRE(frames->back() == 209);

        // Past the end is clamped
        auto tail = wav::read_frames(path, *h, 995, 100);
        REQUIRE(tail);
        REQUIRE(tail->size() == 5);
    }

    SECTION("ReadMonoDownmixesStereo") {
        std::vector<uint8_t> data;
        // Two stereo frames: (16384, 0) and (-16384, -16384)
        put16(data, 16384);
        put16(data, 0);
        put16(data, static_cast<uint16_t>(-16384));
        put16(data, static_cast<uint16_t>(-16384));
        testing::write_file(path, build_wav(wav::kFormatPcm, 2, 8000, 16, data));

        auto mono = wav::read_mono(path);
        REQUIRE(mono);
        REQUIRE(mono->size() == 2);
        REQUIRE((*mono)[0] > 0.24f);
        REQUIRE((*mono)[0] < 0.26f);
        REQUIRE((*mono)[1] < -0.49f);
    }

    SECTION("ReadMonoEightBit") {
        std::vector<uint8_t> data = {128, 255, 0};
        testing::write_file(path, build_wav(wav::kFormatPcm, 1, 8000, 8, data));

        auto mono = wav::read_mono(path);
        REQUIRE(mono);
        REQUIRE(mono->size() == 3);
        REQUIRE((*mono)[0] == 0.0f);
        REQUIRE((*mono)[1] > 0.9f);
        REQUIRE((*mono)[2] <= -0.99f);
    }

    SECTION("MissingFile") {
        REQUIRE_FALSE(wav::read_header(dir.path / "nope.wav"));
        REQUIRE_FALSE(wav::read_mono(dir.path / "nope.wav"));
    }
}
