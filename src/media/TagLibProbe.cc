/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/6/2024.
//

#include "TagLibProbe.hh"

#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/tpropertymap.h>
#include <taglib/audioproperties.h>
#include <taglib/mpegfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/flacfile.h>
#include <taglib/mp4file.h>
#include <taglib/mp4tag.h>
#include <taglib/vorbisfile.h>
#include <taglib/opusfile.h>
#include <taglib/xiphcomment.h>
#include <taglib/wavfile.h>

#include <cstdlib>

namespace atd {
namespace {

TagLib::FileRef open(const fs::path& file, bool read_properties)
{
	TagLib::FileRef ref{file.c_str(), read_properties};
	if (ref.isNull())
		BOOST_THROW_EXCEPTION(MediaProbe::Error() << Message{"unsupported or unreadable audio file"} << Path{file});
	return ref;
}

std::optional<std::string> text(const TagLib::String& str)
{
	auto utf8 = str.to8Bit(true);
	if (utf8.empty())
		return std::nullopt;
	return utf8;
}

std::optional<std::string> property(const TagLib::PropertyMap& props, const char *key)
{
	auto it = props.find(key);
	if (it == props.end() || it->second.isEmpty())
		return std::nullopt;
	return text(it->second.front());
}

// "3/12" -> 3
std::optional<int> number(const std::optional<std::string>& str)
{
	if (!str)
		return std::nullopt;

	auto value = std::atoi(str->c_str());
	return value > 0 ? std::optional<int>{value} : std::nullopt;
}

bool has_apic(TagLib::ID3v2::Tag *tag)
{
	return tag && !tag->frameList("APIC").isEmpty();
}

} // end of local namespace

TagInfo TagLibProbe::read_tags(const fs::path& file) const
{
	auto ref = open(file, false);
	auto props = ref.file()->properties();

	TagInfo result;
	result.artist       = property(props, "ARTIST");
	result.title        = property(props, "TITLE");
	result.album        = property(props, "ALBUM");
	result.album_artist = property(props, "ALBUMARTIST");
	result.track        = number(property(props, "TRACKNUMBER"));
	result.disc         = number(property(props, "DISCNUMBER"));

	// keep only the year of "2004-05-01"
	if (auto date = property(props, "DATE"); date && date->size() >= 4)
		result.year = date->substr(0, 4);

	return result;
}

StreamInfo TagLibProbe::probe(const fs::path& file) const
{
	auto ref = open(file, true);

	StreamInfo result;
	if (auto prop = ref.audioProperties())
	{
		result.duration     = prop->lengthInMilliseconds() / 1000.0;
		result.bitrate      = prop->bitrate();
		result.sample_rate  = prop->sampleRate();
		result.channels     = prop->channels();
	}

	auto f = ref.file();
	if (dynamic_cast<TagLib::MPEG::File*>(f))
		result.codec = "mp3";
	else if (dynamic_cast<TagLib::FLAC::File*>(f))
		result.codec = "flac";
	else if (dynamic_cast<TagLib::MP4::File*>(f))
		result.codec = "mp4";
	else if (dynamic_cast<TagLib::Ogg::Vorbis::File*>(f))
		result.codec = "vorbis";
	else if (dynamic_cast<TagLib::Ogg::Opus::File*>(f))
		result.codec = "opus";
	else if (dynamic_cast<TagLib::RIFF::WAV::File*>(f))
		result.codec = "pcm";

	return result;
}

bool TagLibProbe::has_embedded_art(const fs::path& file) const
{
	auto ref = open(file, false);
	auto f = ref.file();

	if (auto mpeg = dynamic_cast<TagLib::MPEG::File*>(f))
		return mpeg->hasID3v2Tag() && has_apic(mpeg->ID3v2Tag());

	if (auto flac = dynamic_cast<TagLib::FLAC::File*>(f))
		return !flac->pictureList().isEmpty() || (flac->hasID3v2Tag() && has_apic(flac->ID3v2Tag()));

	if (auto mp4 = dynamic_cast<TagLib::MP4::File*>(f))
		return mp4->tag() && mp4->tag()->contains("covr");

	if (auto xiph = dynamic_cast<TagLib::Ogg::XiphComment*>(f->tag()))
		return !xiph->pictureList().isEmpty();

	if (auto wav = dynamic_cast<TagLib::RIFF::WAV::File*>(f))
		return wav->hasID3v2Tag() && has_apic(wav->ID3v2Tag());

	return false;
}

} // end of namespace
