//
// Created by Giuseppe Francione on 19/10/26.
//

#include "../../include/flac_tagger.hpp"
#include "../../include/logger.hpp"
#include "../../include/tag_error.hpp"
#include <FLAC/format.h>
#include <new>
#include <stdexcept>
#include <system_error>

namespace tagmerge {
namespace fs = std::filesystem;

static const char* tagger_tag() {
    return "flac_tagger";
}

namespace {

struct IteratorDeleter {
    void operator()(FLAC__Metadata_Iterator* it) const {
        if (it) FLAC__metadata_iterator_delete(it);
    }
};
using IteratorPtr = std::unique_ptr<FLAC__Metadata_Iterator, IteratorDeleter>;

[[noreturn]] void fail(const ErrorKind kind, const std::string& msg) {
    Logger::log(LogLevel::Error, "FLAC: " + msg, tagger_tag());
    throw TagError(kind, msg);
}

// iterator positioned on the first block of the chain
IteratorPtr make_iterator(FLAC__Metadata_Chain* chain) {
    IteratorPtr it(FLAC__metadata_iterator_new());
    if (!it) {
        throw std::bad_alloc();
    }
    FLAC__metadata_iterator_init(it.get(), chain);
    return it;
}

// structural problems in the stream are parse errors, everything else is I/O
ErrorKind kind_for_read_status(const FLAC__Metadata_ChainStatus status) {
    switch (status) {
        case FLAC__METADATA_CHAIN_STATUS_NOT_A_FLAC_FILE:
        case FLAC__METADATA_CHAIN_STATUS_BAD_METADATA:
        case FLAC__METADATA_CHAIN_STATUS_ILLEGAL_INPUT:
            return ErrorKind::TagParse;
        default:
            return ErrorKind::Io;
    }
}

std::string status_string(const FLAC__Metadata_ChainStatus status) {
    return FLAC__Metadata_ChainStatusString[status];
}

} // namespace

FlacTagger::FlacTagger(fs::path path, const TaggerOptions& options)
    : path_(std::move(path)), options_(options) {
    Logger::log(LogLevel::Info, "FLAC: Opening tag session for: " + path_.string(), tagger_tag());

    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) {
        fail(ErrorKind::Io, "no such file: " + path_.string());
    }

    chain_.reset(FLAC__metadata_chain_new());
    if (!chain_) {
        throw std::bad_alloc();
    }

    if (!FLAC__metadata_chain_read(chain_.get(), path_.string().c_str())) {
        const auto status = FLAC__metadata_chain_status(chain_.get());
        chain_.reset();
        fail(kind_for_read_status(status),
             "cannot read metadata of " + path_.string() + " (" + status_string(status) + ")");
    }

    // only the first comment block is modelled
    const auto it = make_iterator(chain_.get());
    unsigned block_count = 0;
    do {
        const FLAC__StreamMetadata* block = FLAC__metadata_iterator_get_block(it.get());
        ++block_count;
        if (block && block->type == FLAC__METADATA_TYPE_VORBIS_COMMENT && !had_comment_block_) {
            comments_ = VorbisComment::from_block(*block);
            had_comment_block_ = true;
        }
    } while (FLAC__metadata_iterator_next(it.get()));

    Logger::log(LogLevel::Debug,
                "FLAC: Read " + std::to_string(block_count) + " metadata blocks, " +
                (had_comment_block_ ? std::to_string(comments_.entries().size()) + " comment entries."
                                    : std::string("no VORBIS_COMMENT block.")),
                tagger_tag());
}

FlacTagger::~FlacTagger() = default;

FLAC__Metadata_Chain* FlacTagger::chain() {
    if (!chain_) {
        throw std::logic_error("FLAC tag session already finalized: " + path_.string());
    }
    return chain_.get();
}

void FlacTagger::append_block(MetadataPtr block) {
    const auto it = make_iterator(chain());
    while (FLAC__metadata_iterator_next(it.get())) {
    }
    if (!FLAC__metadata_iterator_insert_block_after(it.get(), block.get())) {
        fail(ErrorKind::Io, "cannot append metadata block to the chain of " + path_.string());
    }
    // the chain owns the block now
    block.release();
}

void FlacTagger::remove_loaded_comment_block() {
    const auto it = make_iterator(chain());
    do {
        if (FLAC__metadata_iterator_get_block_type(it.get()) == FLAC__METADATA_TYPE_VORBIS_COMMENT) {
            if (!FLAC__metadata_iterator_delete_block(it.get(), false)) {
                fail(ErrorKind::Io, "cannot remove the previous VORBIS_COMMENT block of " + path_.string());
            }
            Logger::log(LogLevel::Debug, "FLAC: Dropped the VORBIS_COMMENT block read at load time.", tagger_tag());
            return;
        }
    } while (FLAC__metadata_iterator_next(it.get()));
}

void FlacTagger::add_picture(const CoverPicture& cover, const ImageInfo& info) {
    chain();

    MetadataPtr block(FLAC__metadata_object_new(FLAC__METADATA_TYPE_PICTURE));
    if (!block) {
        throw std::bad_alloc();
    }

    auto& picture = block->data.picture;
    picture.type = static_cast<FLAC__StreamMetadata_Picture_Type>(cover.picture_type);
    picture.width = info.width;
    picture.height = info.height;
    picture.depth = info.depth;
    picture.colors = info.colors;

    std::string mime = cover.mime_type;
    if (!FLAC__metadata_object_picture_set_mime_type(block.get(), mime.data(), true)) {
        fail(ErrorKind::PictureEncode, "illegal picture mime type: '" + cover.mime_type + "'");
    }

    std::string description = cover.description;
    if (!FLAC__metadata_object_picture_set_description(
            block.get(), reinterpret_cast<FLAC__byte*>(description.data()), true)) {
        fail(ErrorKind::PictureEncode, "illegal picture description: '" + cover.description + "'");
    }

    // copy=true: libFLAC takes its own copy of the payload
    if (!FLAC__metadata_object_picture_set_data(
            block.get(), const_cast<FLAC__byte*>(cover.data.data()),
            static_cast<FLAC__uint32>(cover.data.size()), true)) {
        throw std::bad_alloc();
    }

    const char* violation = nullptr;
    if (!FLAC__metadata_object_picture_is_legal(block.get(), &violation)) {
        fail(ErrorKind::PictureEncode,
             std::string("illegal picture block: ") + (violation ? violation : "unknown reason"));
    }

    append_block(std::move(block));
    Logger::log(LogLevel::Debug,
                "FLAC: Appended PICTURE block (" + cover.mime_type + ", " + std::to_string(cover.data.size()) + " bytes).",
                tagger_tag());
}

void FlacTagger::set_cover(const std::span<const unsigned char> data, const std::string_view mime_type) {
    chain();
    const ImageInfo info = read_image_info(data, mime_type);
    add_picture(make_embedded_cover(data, mime_type), info);
}

void FlacTagger::set_cover_url(const std::string_view url) {
    add_picture(make_url_cover(url), ImageInfo{});
}

void FlacTagger::set_title(const std::string_view title) {
    chain();
    if (comments_.has(kFieldTitle)) {
        Logger::log(LogLevel::Debug, "FLAC: TITLE already present, kept.", tagger_tag());
        return;
    }
    comments_.add(kFieldTitle, title);
}

void FlacTagger::set_album(const std::string_view album) {
    chain();
    if (comments_.has(kFieldAlbum)) {
        Logger::log(LogLevel::Debug, "FLAC: ALBUM already present, kept.", tagger_tag());
        return;
    }
    comments_.add(kFieldAlbum, album);
}

void FlacTagger::set_artist(const std::vector<std::string>& artists) {
    chain();
    if (comments_.has(kFieldArtist)) {
        Logger::log(LogLevel::Debug, "FLAC: ARTIST already present, kept.", tagger_tag());
        return;
    }
    // all or nothing
    for (const auto& artist : artists) {
        VorbisComment::check_entry(kFieldArtist, artist);
    }
    for (const auto& artist : artists) {
        comments_.add(kFieldArtist, artist);
    }
}

void FlacTagger::set_comment(std::string_view) {
    Logger::log(LogLevel::Debug, "FLAC: Comment field is not written for FLAC, ignored.", tagger_tag());
}

void FlacTagger::finalize() {
    auto* ch = chain();

    Logger::log(LogLevel::Info, "FLAC: Rewriting metadata of: " + path_.string(), tagger_tag());

    if (options_.replace_comment_block && had_comment_block_) {
        remove_loaded_comment_block();
    }
    append_block(comments_.to_block());

    if (options_.flac_use_padding) {
        // padding must sit at the end for libFLAC to absorb the size change
        FLAC__metadata_chain_sort_padding(ch);
    }

    const bool written = FLAC__metadata_chain_write(ch, options_.flac_use_padding, options_.flac_preserve_file_stats);
    const auto status = FLAC__metadata_chain_status(ch);
    chain_.reset();

    if (!written) {
        fail(ErrorKind::Io, "failed to write " + path_.string() + " (" + status_string(status) + ")");
    }
}

} // namespace tagmerge
