//
// Created by Giuseppe Francione on 19/10/26.
//

#include "../../include/vorbis_comment.hpp"
#include "../../include/logger.hpp"
#include "../../include/tag_error.hpp"
#include <FLAC/format.h>
#include <algorithm>
#include <cctype>
#include <new>

namespace tagmerge {

namespace {

bool iequals(const std::string_view s1, const std::string_view s2) {
    return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

std::string entry_to_string(const FLAC__StreamMetadata_VorbisComment_Entry& entry) {
    if (!entry.entry || entry.length == 0) {
        return {};
    }
    return {reinterpret_cast<const char*>(entry.entry), entry.length};
}

FLAC__StreamMetadata_VorbisComment_Entry string_to_entry(const std::string& s) {
    FLAC__StreamMetadata_VorbisComment_Entry entry;
    entry.length = static_cast<FLAC__uint32>(s.size());
    // libFLAC copies the bytes (copy=true), it never writes through this pointer
    entry.entry = reinterpret_cast<FLAC__byte*>(const_cast<char*>(s.data()));
    return entry;
}

} // namespace

VorbisComment::VorbisComment() : vendor_(FLAC__VENDOR_STRING) {}

VorbisComment::VorbisComment(std::string vendor) : vendor_(std::move(vendor)) {}

VorbisComment VorbisComment::from_block(const FLAC__StreamMetadata& block) {
    if (block.type != FLAC__METADATA_TYPE_VORBIS_COMMENT) {
        throw TagError(ErrorKind::TagParse, "metadata block is not a VORBIS_COMMENT block");
    }

    const auto& vc = block.data.vorbis_comment;
    VorbisComment result(entry_to_string(vc.vendor_string));
    result.entries_.reserve(vc.num_comments);
    for (FLAC__uint32 i = 0; i < vc.num_comments; ++i) {
        result.entries_.push_back(entry_to_string(vc.comments[i]));
    }
    result.loaded_count_ = result.entries_.size();

    // clone copies entries without validating them
    result.loaded_.reset(FLAC__metadata_object_clone(&block));
    if (!result.loaded_) {
        throw std::bad_alloc();
    }
    return result;
}

std::vector<std::string> VorbisComment::get(const std::string_view name) const {
    std::vector<std::string> values;
    for (const auto& entry : entries_) {
        const auto sep = entry.find('=');
        if (sep == std::string::npos) {
            Logger::log(LogLevel::Error, "malformed vorbis comment entry: '" + entry + "'", "flac_tagger");
            throw TagError(ErrorKind::TagParse, "malformed vorbis comment entry: '" + entry + "'");
        }
        if (iequals(std::string_view(entry).substr(0, sep), name)) {
            values.push_back(entry.substr(sep + 1));
        }
    }
    return values;
}

void VorbisComment::check_entry(const std::string_view name, const std::string_view value) {
    const std::string field(name);
    if (field.empty() || !FLAC__format_vorbiscomment_entry_name_is_legal(field.c_str())) {
        Logger::log(LogLevel::Error, "illegal vorbis comment field name: '" + field + "'", "flac_tagger");
        throw TagError(ErrorKind::TagParse, "illegal vorbis comment field name: '" + field + "'");
    }
    if (!FLAC__format_vorbiscomment_entry_value_is_legal(reinterpret_cast<const FLAC__byte*>(value.data()),
                                                         static_cast<FLAC__uint32>(value.size()))) {
        Logger::log(LogLevel::Error, "value of " + field + " is not valid UTF-8", "flac_tagger");
        throw TagError(ErrorKind::TagParse, "value of vorbis comment field " + field + " is not valid UTF-8");
    }
}

void VorbisComment::add(const std::string_view name, const std::string_view value) {
    check_entry(name, value);
    std::string entry(name);
    entry += '=';
    entry += value;
    entries_.push_back(std::move(entry));
}

MetadataPtr VorbisComment::to_block() const {
    MetadataPtr block(loaded_ ? FLAC__metadata_object_clone(loaded_.get())
                              : FLAC__metadata_object_new(FLAC__METADATA_TYPE_VORBIS_COMMENT));
    if (!block) {
        throw std::bad_alloc();
    }
    if (!loaded_ &&
        !FLAC__metadata_object_vorbiscomment_set_vendor_string(block.get(), string_to_entry(vendor_), true)) {
        throw TagError(ErrorKind::TagParse, "vorbis comment vendor string is not valid UTF-8");
    }
    // new entries passed check_entry(), so a refusal here is an allocation failure
    for (std::size_t i = loaded_count_; i < entries_.size(); ++i) {
        if (!FLAC__metadata_object_vorbiscomment_append_comment(block.get(), string_to_entry(entries_[i]), true)) {
            throw std::bad_alloc();
        }
    }
    return block;
}

} // namespace tagmerge
