#ifndef SUBDUB_AUDIO_IO_H
#define SUBDUB_AUDIO_IO_H

#include "audio/sample_buffer.h"

#include <sndfile.h>
#include <string>

namespace subdub {
namespace AudioIO {

enum class TrackFormat { Wav, Flac, OggOpus };

// Parse "wav" / "flac" / "ogg" / "opus" (case-insensitive). Returns false for anything else.
bool parseTrackFormat(const std::string& name, TrackFormat& format);
const char* trackFormatToString(TrackFormat format);

// Lowercase extension of `path` without the dot ("" when there is none).
std::string extensionOf(const std::string& path);

class AudioReader {
   public:
    AudioReader();
    ~AudioReader();

    AudioReader(const AudioReader&) = delete;
    AudioReader& operator=(const AudioReader&) = delete;

    bool open(const std::string& filename);
    void close();

    int getSampleRate() const {
        return info_.samplerate;
    }
    int getChannels() const {
        return info_.channels;
    }
    sf_count_t getFrames() const {
        return info_.frames;
    }

    bool readAll(audio::SampleBuffer& output);

   private:
    SNDFILE* file_;
    SF_INFO info_;
    std::string path_;
};

class AudioWriter {
   public:
    AudioWriter();
    ~AudioWriter();

    AudioWriter(const AudioWriter&) = delete;
    AudioWriter& operator=(const AudioWriter&) = delete;

    bool open(const std::string& filename, int sampleRate, int channels,
              TrackFormat format = TrackFormat::Wav);
    // Returns false if the file could not be finalized on disk.
    bool close();

    bool writeAll(const audio::SampleBuffer& input);
    bool writeBlock(const float* buffer, sf_count_t frames);

   private:
    SNDFILE* file_;
    SF_INFO info_;
    std::string path_;
};

// One-shot helpers used by the segment store and the track writer.
bool readAudioFile(const std::string& path, audio::SampleBuffer& output);
bool writeAudioFile(const std::string& path, const audio::SampleBuffer& input,
                    TrackFormat format = TrackFormat::Wav);

}  // namespace AudioIO
}  // namespace subdub

#endif  // SUBDUB_AUDIO_IO_H
