#include "audio/audio_io.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>

namespace subdub {
namespace AudioIO {

namespace {

int formatFlags(TrackFormat format) {
    switch (format) {
    case TrackFormat::Flac:
        return SF_FORMAT_FLAC | SF_FORMAT_PCM_16;
    case TrackFormat::OggOpus:
        return SF_FORMAT_OGG | SF_FORMAT_OPUS;
    case TrackFormat::Wav:
    default:
        return SF_FORMAT_WAV | SF_FORMAT_FLOAT;
    }
}

}  // namespace

bool parseTrackFormat(const std::string& name, TrackFormat& format) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "wav") {
        format = TrackFormat::Wav;
        return true;
    }
    if (lower == "flac") {
        format = TrackFormat::Flac;
        return true;
    }
    if (lower == "ogg" || lower == "opus") {
        format = TrackFormat::OggOpus;
        return true;
    }
    return false;
}

const char* trackFormatToString(TrackFormat format) {
    switch (format) {
    case TrackFormat::Flac:
        return "flac";
    case TrackFormat::OggOpus:
        return "opus";
    case TrackFormat::Wav:
    default:
        return "wav";
    }
}

std::string extensionOf(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// AudioReader implementation
AudioReader::AudioReader() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

AudioReader::~AudioReader() {
    close();
}

bool AudioReader::open(const std::string& filename) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open(filename.c_str(), SFM_READ, &info_);
    if (!file_) {
        LOG_ERROR("Error opening audio file: {}", filename);
        LOG_ERROR("libsndfile error: {}", sf_strerror(nullptr));
        return false;
    }
    path_ = filename;

    LOG_TRACE("Opened {} ({} Hz, {} ch, {} frames)", filename, info_.samplerate, info_.channels,
              static_cast<long long>(info_.frames));
    return true;
}

void AudioReader::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

bool AudioReader::readAll(audio::SampleBuffer& output) {
    if (!file_) {
        LOG_ERROR("Error: File not opened");
        return false;
    }

    output.sampleRate = info_.samplerate;
    output.channels = info_.channels;
    output.samples.assign(static_cast<std::size_t>(info_.frames) * info_.channels, 0.0f);

    sf_count_t framesRead = sf_readf_float(file_, output.samples.data(), info_.frames);
    if (framesRead != info_.frames) {
        LOG_ERROR("Incomplete read of {}: expected {} frames, read {}", path_,
                  static_cast<long long>(info_.frames), static_cast<long long>(framesRead));
        return false;
    }
    return true;
}

// AudioWriter implementation
AudioWriter::AudioWriter() : file_(nullptr) {
    std::memset(&info_, 0, sizeof(info_));
}

AudioWriter::~AudioWriter() {
    close();
}

bool AudioWriter::open(const std::string& filename, int sampleRate, int channels,
                       TrackFormat format) {
    close();
    std::memset(&info_, 0, sizeof(info_));
    info_.samplerate = sampleRate;
    info_.channels = channels;
    info_.format = formatFlags(format);

    if (!sf_format_check(&info_)) {
        LOG_ERROR("libsndfile cannot write {} at {} Hz / {} ch", trackFormatToString(format),
                  sampleRate, channels);
        return false;
    }

    file_ = sf_open(filename.c_str(), SFM_WRITE, &info_);
    if (!file_) {
        LOG_ERROR("Error opening output file: {}", filename);
        LOG_ERROR("libsndfile error: {}", sf_strerror(nullptr));
        return false;
    }
    if (format == TrackFormat::Wav) {
        // PEAK chunk carries a timestamp; without it identical input gives identical files.
        sf_command(file_, SFC_SET_ADD_PEAK_CHUNK, nullptr, SF_FALSE);
    }
    path_ = filename;
    return true;
}

bool AudioWriter::close() {
    if (!file_) {
        return true;
    }
    int rc = sf_close(file_);
    file_ = nullptr;
    if (rc != 0) {
        LOG_ERROR("Failed to finalize {}: {}", path_, sf_error_number(rc));
        return false;
    }
    return true;
}

bool AudioWriter::writeAll(const audio::SampleBuffer& input) {
    return writeBlock(input.samples.data(), static_cast<sf_count_t>(input.frames()));
}

bool AudioWriter::writeBlock(const float* buffer, sf_count_t frames) {
    if (!file_) {
        LOG_ERROR("Error: File not opened");
        return false;
    }
    if (frames == 0) {
        return true;
    }

    sf_count_t framesWritten = sf_writef_float(file_, buffer, frames);
    if (framesWritten != frames) {
        LOG_ERROR("Short write to {}: expected {} frames, wrote {}", path_,
                  static_cast<long long>(frames), static_cast<long long>(framesWritten));
        return false;
    }
    return true;
}

bool readAudioFile(const std::string& path, audio::SampleBuffer& output) {
    AudioReader reader;
    if (!reader.open(path)) {
        return false;
    }
    return reader.readAll(output);
}

bool writeAudioFile(const std::string& path, const audio::SampleBuffer& input,
                    TrackFormat format) {
    AudioWriter writer;
    if (!writer.open(path, input.sampleRate, input.channels, format)) {
        return false;
    }
    if (!writer.writeAll(input)) {
        writer.close();
        return false;
    }
    return writer.close();
}

}  // namespace AudioIO
}  // namespace subdub
