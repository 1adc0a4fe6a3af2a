#pragma once

#include "audio/sample_buffer.h"

#include <cstddef>
#include <filesystem>
#include <string>

namespace subdub {
namespace synthesis {

// On-disk state of a run inside its working directory:
//   raw_<position>_<hash>.wav   one segment per synthesized cue (resume)
//   cache/cache_<hash>.wav      one file per distinct cue text
//
// Writes go to a temporary name first and are renamed into place, so a file
// that exists is always complete.
class SegmentStore {
   public:
    explicit SegmentStore(std::filesystem::path workDir);

    // Creates the working and cache directories.
    bool prepare();

    const std::filesystem::path& workDir() const {
        return workDir_;
    }

    std::filesystem::path segmentPath(std::size_t position, const std::string& textHash) const;
    std::filesystem::path cachePath(const std::string& textHash) const;

    // False when the file is missing, unreadable or holds no samples.
    bool loadSegment(std::size_t position, const std::string& textHash,
                     audio::SampleBuffer& out) const;
    bool saveSegment(std::size_t position, const std::string& textHash,
                     const audio::SampleBuffer& buffer) const;

    bool loadCached(const std::string& textHash, audio::SampleBuffer& out) const;
    bool saveCached(const std::string& textHash, const audio::SampleBuffer& buffer) const;

    // Deletes the whole working directory.
    bool removeAll() const;

   private:
    bool loadFile(const std::filesystem::path& path, audio::SampleBuffer& out) const;
    bool saveFile(const std::filesystem::path& path, const audio::SampleBuffer& buffer) const;

    std::filesystem::path workDir_;
};

}  // namespace synthesis
}  // namespace subdub
