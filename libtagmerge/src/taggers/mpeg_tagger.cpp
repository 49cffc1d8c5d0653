//
// Created by Giuseppe Francione on 19/10/26.
//

#include "../../include/mpeg_tagger.hpp"
#include "../../include/logger.hpp"
#include "../../include/tag_error.hpp"
#include <stdexcept>
#include <system_error>
#include <taglib/mpegfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/attachedpictureframe.h>
#include <taglib/commentsframe.h>
#include <taglib/textidentificationframe.h>
#include <taglib/tbytevector.h>
#include <taglib/tstringlist.h>

namespace tagmerge {
namespace fs = std::filesystem;

static const char* tagger_tag() {
    return "mpeg_tagger";
}

namespace {

// language code written on comment frames
constexpr const char* kCommentLanguage = "XXX";

TagLib::String to_tstring(const std::string_view s) {
    return TagLib::String(std::string(s), TagLib::String::UTF8);
}

[[noreturn]] void fail(const ErrorKind kind, const std::string& msg) {
    Logger::log(LogLevel::Error, "MP3: " + msg, tagger_tag());
    throw TagError(kind, msg);
}

TagLib::ID3v2::Version id3v2_version_for(const int version) {
    return version == 3 ? TagLib::ID3v2::v3 : TagLib::ID3v2::v4;
}

} // namespace

MpegTagger::MpegTagger(fs::path path, const TaggerOptions& options)
    : path_(std::move(path)), options_(options) {
    Logger::log(LogLevel::Info, "MP3: Opening tag session for: " + path_.string(), tagger_tag());

    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) {
        fail(ErrorKind::Io, "no such file: " + path_.string());
    }

    // audio properties are not needed to edit the tag
#ifdef _WIN32
    file_ = std::make_unique<TagLib::MPEG::File>(path_.wstring().c_str(), false);
#else
    file_ = std::make_unique<TagLib::MPEG::File>(path_.string().c_str(), false);
#endif
    if (!file_->isOpen()) {
        file_.reset();
        fail(ErrorKind::Io, "cannot open file: " + path_.string());
    }
    if (!file_->isValid()) {
        file_.reset();
        fail(ErrorKind::TagParse, "malformed tag data in: " + path_.string());
    }

    const bool had_tag = file_->hasID3v2Tag();
    tag_ = file_->ID3v2Tag(true);
    if (!tag_) {
        file_.reset();
        fail(ErrorKind::TagParse, "cannot create ID3v2 tag for: " + path_.string());
    }

    Logger::log(LogLevel::Debug,
                had_tag ? "MP3: Loaded existing ID3v2 tag (" + std::to_string(tag_->frameList().size()) + " frames)."
                        : std::string("MP3: No ID3v2 tag found, starting an empty one."),
                tagger_tag());
}

MpegTagger::~MpegTagger() = default;

TagLib::ID3v2::Tag& MpegTagger::tag() {
    if (!file_ || !tag_) {
        throw std::logic_error("MP3 tag session already finalized: " + path_.string());
    }
    return *tag_;
}

void MpegTagger::add_picture(const CoverPicture& cover) {
    auto& id3 = tag();

    auto* frame = new TagLib::ID3v2::AttachedPictureFrame;
    frame->setTextEncoding(TagLib::String::Latin1);
    frame->setMimeType(to_tstring(cover.mime_type));
    frame->setType(static_cast<TagLib::ID3v2::AttachedPictureFrame::Type>(cover.picture_type));
    frame->setDescription(to_tstring(cover.description));
    frame->setPicture(TagLib::ByteVector(reinterpret_cast<const char*>(cover.data.data()),
                                         static_cast<unsigned int>(cover.data.size())));
    id3.addFrame(frame);

    Logger::log(LogLevel::Debug,
                "MP3: Added APIC frame (" + cover.mime_type + ", " + std::to_string(cover.data.size()) + " bytes).",
                tagger_tag());
}

void MpegTagger::set_cover(const std::span<const unsigned char> data, const std::string_view mime_type) {
    add_picture(make_embedded_cover(data, mime_type));
}

void MpegTagger::set_cover_url(const std::string_view url) {
    add_picture(make_url_cover(url));
}

void MpegTagger::set_title(const std::string_view title) {
    auto& id3 = tag();
    if (!id3.title().isEmpty()) {
        Logger::log(LogLevel::Debug, "MP3: Title already present, kept.", tagger_tag());
        return;
    }
    id3.setTitle(to_tstring(title));
}

void MpegTagger::set_album(const std::string_view album) {
    auto& id3 = tag();
    if (!id3.album().isEmpty()) {
        Logger::log(LogLevel::Debug, "MP3: Album already present, kept.", tagger_tag());
        return;
    }
    id3.setAlbum(to_tstring(album));
}

void MpegTagger::set_artist(const std::vector<std::string>& artists) {
    auto& id3 = tag();
    if (!id3.frameList("TPE1").isEmpty()) {
        Logger::log(LogLevel::Debug, "MP3: Artist frame already present, kept.", tagger_tag());
        return;
    }
    if (artists.empty()) {
        return;
    }

    TagLib::StringList values;
    for (const auto& artist : artists) {
        values.append(to_tstring(artist));
    }

    auto* frame = new TagLib::ID3v2::TextIdentificationFrame("TPE1", TagLib::String::UTF8);
    frame->setText(values);
    id3.addFrame(frame);
}

void MpegTagger::set_comment(const std::string_view comment) {
    auto& id3 = tag();
    if (!id3.frameList("COMM").isEmpty()) {
        Logger::log(LogLevel::Debug, "MP3: Comment frame already present, kept.", tagger_tag());
        return;
    }

    auto* frame = new TagLib::ID3v2::CommentsFrame(TagLib::String::Latin1);
    frame->setLanguage(TagLib::ByteVector(kCommentLanguage));
    frame->setDescription(TagLib::String());
    frame->setText(to_tstring(comment));
    id3.addFrame(frame);
}

void MpegTagger::finalize() {
    tag();

    Logger::log(LogLevel::Info, "MP3: Writing ID3v2 tag to: " + path_.string(), tagger_tag());

    bool saved = false;
    {
        // closes the file on every exit path, including a failed save
        struct FileRelease {
            std::unique_ptr<TagLib::MPEG::File>& file;
            TagLib::ID3v2::Tag*& tag;
            ~FileRelease() {
                tag = nullptr;
                file.reset();
            }
        } release{file_, tag_};

        saved = file_->save(TagLib::MPEG::File::ID3v2,
                            TagLib::MPEG::File::StripNone,
                            id3v2_version_for(options_.id3v2_version),
                            TagLib::MPEG::File::DoNotDuplicate);
    }

    if (!saved) {
        fail(ErrorKind::Io, "failed to write ID3v2 tag to: " + path_.string());
    }
}

} // namespace tagmerge
