// Fixture builders shared by the test executables: real MP3, FLAC, PNG and
// JPEG data produced with the same libraries the taggers use, plus readers
// that inspect the written files independently of the tagger code.
#pragma once

#include <gtest/gtest.h>

#include <csetjmp>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <FLAC/metadata.h>
#include <FLAC/stream_encoder.h>
#include <jpeglib.h>
#include <png.h>
#include <taglib/id3v2tag.h>
#include <taglib/mpegfile.h>

#include "logger.hpp"

namespace test_fixtures {

namespace fs = std::filesystem;

// per-test scratch directory under the system temp path, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string &prefix = "test") {
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        dir_ = fs::temp_directory_path() / ("tagmerge-" + prefix) / (prefix + "_" + std::to_string(rng()));
        fs::create_directories(dir_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    [[nodiscard]] fs::path file(const std::string &name) const { return dir_ / name; }
    [[nodiscard]] const fs::path &path() const { return dir_; }

private:
    fs::path dir_;
};

inline std::vector<unsigned char> read_bytes(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline void write_bytes(const fs::path &p, const std::vector<unsigned char> &data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<unsigned char> to_bytes(const std::string &s) {
    return {s.begin(), s.end()};
}

// ---------------------------------------------------------------------------
// mp3
// ---------------------------------------------------------------------------

// MPEG-1 Layer III, 128 kbit/s, 44.1 kHz, no padding: 417-byte frames
inline void write_mp3_stub(const fs::path &p, const int frames = 8) {
    constexpr std::size_t kFrameSize = 417;
    std::vector<unsigned char> data;
    data.reserve(kFrameSize * frames);
    for (int i = 0; i < frames; ++i) {
        std::vector<unsigned char> frame(kFrameSize, 0);
        frame[0] = 0xFF;
        frame[1] = 0xFB;
        frame[2] = 0x90;
        frame[3] = 0x00;
        data.insert(data.end(), frame.begin(), frame.end());
    }
    write_bytes(p, data);
}

// writes an ID3v2 tag with TagLib directly, bypassing the tagger
template <typename Fn>
void write_mp3_with_tag(const fs::path &p, Fn &&edit) {
    write_mp3_stub(p);
    TagLib::MPEG::File file(p.string().c_str(), false);
    ASSERT_TRUE(file.isValid());
    edit(*file.ID3v2Tag(true));
    ASSERT_TRUE(file.save(TagLib::MPEG::File::ID3v2, TagLib::MPEG::File::StripNone,
                          TagLib::ID3v2::v4, TagLib::MPEG::File::DoNotDuplicate));
}

// ---------------------------------------------------------------------------
// flac
// ---------------------------------------------------------------------------

// drops every VORBIS_COMMENT block (the encoder always writes one)
inline void strip_comment_blocks(const fs::path &p) {
    FLAC__Metadata_Chain *chain = FLAC__metadata_chain_new();
    ASSERT_NE(chain, nullptr);
    ASSERT_TRUE(FLAC__metadata_chain_read(chain, p.string().c_str()));
    FLAC__Metadata_Iterator *it = FLAC__metadata_iterator_new();
    FLAC__metadata_iterator_init(it, chain);
    do {
        if (FLAC__metadata_iterator_get_block_type(it) == FLAC__METADATA_TYPE_VORBIS_COMMENT) {
            ASSERT_TRUE(FLAC__metadata_iterator_delete_block(it, false));
        }
    } while (FLAC__metadata_iterator_next(it));
    FLAC__metadata_iterator_delete(it);
    ASSERT_TRUE(FLAC__metadata_chain_write(chain, false, false));
    FLAC__metadata_chain_delete(chain);
}

struct FlacSpec {
    std::vector<std::pair<std::string, std::string>> comments;
    bool with_comment_block = false;
    unsigned padding = 0;
};

inline void write_flac(const fs::path &p, const FlacSpec &spec = {}) {
    FLAC__StreamEncoder *encoder = FLAC__stream_encoder_new();
    ASSERT_NE(encoder, nullptr);
    FLAC__stream_encoder_set_channels(encoder, 1);
    FLAC__stream_encoder_set_bits_per_sample(encoder, 16);
    FLAC__stream_encoder_set_sample_rate(encoder, 44100);
    FLAC__stream_encoder_set_compression_level(encoder, 5);

    std::vector<FLAC__StreamMetadata *> metadata;
    if (spec.with_comment_block || !spec.comments.empty()) {
        FLAC__StreamMetadata *vc = FLAC__metadata_object_new(FLAC__METADATA_TYPE_VORBIS_COMMENT);
        ASSERT_NE(vc, nullptr);
        for (const auto &[name, value] : spec.comments) {
            FLAC__StreamMetadata_VorbisComment_Entry entry;
            ASSERT_TRUE(FLAC__metadata_object_vorbiscomment_entry_from_name_value_pair(
                &entry, name.c_str(), value.c_str()));
            // copy=false: the block takes ownership of entry
            ASSERT_TRUE(FLAC__metadata_object_vorbiscomment_append_comment(vc, entry, false));
        }
        metadata.push_back(vc);
    }
    if (spec.padding > 0) {
        FLAC__StreamMetadata *pad = FLAC__metadata_object_new(FLAC__METADATA_TYPE_PADDING);
        ASSERT_NE(pad, nullptr);
        pad->length = spec.padding;
        metadata.push_back(pad);
    }
    if (!metadata.empty()) {
        ASSERT_TRUE(FLAC__stream_encoder_set_metadata(encoder, metadata.data(),
                                                      static_cast<unsigned>(metadata.size())));
    }

    ASSERT_EQ(FLAC__stream_encoder_init_file(encoder, p.string().c_str(), nullptr, nullptr),
              FLAC__STREAM_ENCODER_INIT_STATUS_OK);

    std::vector<FLAC__int32> silence(4096, 0);
    ASSERT_TRUE(FLAC__stream_encoder_process_interleaved(encoder, silence.data(),
                                                         static_cast<unsigned>(silence.size())));
    ASSERT_TRUE(FLAC__stream_encoder_finish(encoder));
    FLAC__stream_encoder_delete(encoder);

    for (auto *m : metadata) FLAC__metadata_object_delete(m);

    if (!spec.with_comment_block && spec.comments.empty()) {
        strip_comment_blocks(p);
    }
}

struct PictureBlock {
    int type = 0;
    std::string mime;
    std::string description;
    std::vector<unsigned char> data;
    unsigned width = 0;
    unsigned height = 0;
    unsigned depth = 0;
};

struct FlacBlocks {
    std::vector<int> types;
    std::vector<std::vector<std::string>> comment_blocks;
    std::vector<PictureBlock> pictures;

    // values of a field across one comment block
    [[nodiscard]] std::vector<std::string> values(const std::size_t block, const std::string &name) const {
        std::vector<std::string> out;
        const std::string prefix = name + "=";
        for (const auto &entry : comment_blocks.at(block)) {
            if (entry.compare(0, prefix.size(), prefix) == 0) {
                out.push_back(entry.substr(prefix.size()));
            }
        }
        return out;
    }
};

inline FlacBlocks read_flac_blocks(const fs::path &p) {
    FlacBlocks out;
    FLAC__Metadata_Chain *chain = FLAC__metadata_chain_new();
    if (!chain) throw std::bad_alloc();
    if (!FLAC__metadata_chain_read(chain, p.string().c_str())) {
        FLAC__metadata_chain_delete(chain);
        throw std::runtime_error("cannot read flac chain: " + p.string());
    }
    FLAC__Metadata_Iterator *it = FLAC__metadata_iterator_new();
    FLAC__metadata_iterator_init(it, chain);
    do {
        const FLAC__StreamMetadata *block = FLAC__metadata_iterator_get_block(it);
        out.types.push_back(static_cast<int>(block->type));
        if (block->type == FLAC__METADATA_TYPE_VORBIS_COMMENT) {
            std::vector<std::string> entries;
            const auto &vc = block->data.vorbis_comment;
            for (FLAC__uint32 i = 0; i < vc.num_comments; ++i) {
                entries.emplace_back(reinterpret_cast<const char *>(vc.comments[i].entry), vc.comments[i].length);
            }
            out.comment_blocks.push_back(std::move(entries));
        } else if (block->type == FLAC__METADATA_TYPE_PICTURE) {
            const auto &pic = block->data.picture;
            PictureBlock pb;
            pb.type = static_cast<int>(pic.type);
            pb.mime = pic.mime_type;
            pb.description = reinterpret_cast<const char *>(pic.description);
            pb.data.assign(pic.data, pic.data + pic.data_length);
            pb.width = pic.width;
            pb.height = pic.height;
            pb.depth = pic.depth;
            out.pictures.push_back(std::move(pb));
        }
    } while (FLAC__metadata_iterator_next(it));
    FLAC__metadata_iterator_delete(it);
    FLAC__metadata_chain_delete(chain);
    return out;
}

inline std::size_t count_type(const FlacBlocks &blocks, const FLAC__MetadataType type) {
    std::size_t n = 0;
    for (const int t : blocks.types) {
        if (t == static_cast<int>(type)) ++n;
    }
    return n;
}

// overwrites the first occurrence of `from` with `to` (same length) in a file
inline void patch_bytes(const fs::path &p, const std::string &from, const std::string &to) {
    ASSERT_EQ(from.size(), to.size());
    auto data = read_bytes(p);
    const std::string haystack(data.begin(), data.end());
    const auto pos = haystack.find(from);
    ASSERT_NE(pos, std::string::npos);
    std::memcpy(data.data() + pos, to.data(), to.size());
    write_bytes(p, data);
}

// ---------------------------------------------------------------------------
// images
// ---------------------------------------------------------------------------

inline void png_write_to_vector(png_structp png, png_bytep data, png_size_t length) {
    auto *out = static_cast<std::vector<unsigned char> *>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}

inline void png_flush_noop(png_structp) {}

// RGB, 8 bits per channel
inline std::vector<unsigned char> make_png(const unsigned width, const unsigned height) {
    std::vector<unsigned char> out;
    std::vector<png_byte> row(static_cast<std::size_t>(width) * 3, 0x80);
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png ? png_create_info_struct(png) : nullptr;
    if (!png || !info) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("png_create_write_struct failed");
    }
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("libpng write failed");
    }
    png_set_write_fn(png, &out, png_write_to_vector, png_flush_noop);
    png_set_IHDR(png, info, width, height, 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    for (unsigned y = 0; y < height; ++y) {
        png_write_row(png, row.data());
    }
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return out;
}

inline std::vector<unsigned char> make_jpeg(const unsigned width, const unsigned height) {
    jpeg_compress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);

    unsigned char *buffer = nullptr;
    unsigned long size = 0;
    jpeg_mem_dest(&cinfo, &buffer, &size);

    cinfo.image_width = width;
    cinfo.image_height = height;
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, 75, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    std::vector<JSAMPLE> row(static_cast<std::size_t>(width) * 3, 0x40);
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW rows[1] = {row.data()};
        jpeg_write_scanlines(&cinfo, rows, 1);
    }
    jpeg_finish_compress(&cinfo);

    std::vector<unsigned char> out(buffer, buffer + size);
    jpeg_destroy_compress(&cinfo);
    std::free(buffer);
    return out;
}

// ---------------------------------------------------------------------------
// logging
// ---------------------------------------------------------------------------

struct CapturedLog {
    tagmerge::LogLevel level;
    std::string message;
    std::string tag;
};

// sink that forwards into a vector owned by the test
class CaptureSink final : public tagmerge::ILogSink {
public:
    explicit CaptureSink(std::vector<CapturedLog> &out) : out_(out) {}
    void log(const tagmerge::LogLevel level, const std::string_view message, const std::string_view tag) override {
        out_.push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::vector<CapturedLog> &out_;
};

} // namespace test_fixtures
