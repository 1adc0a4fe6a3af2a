#include "synthesis/segment_store.h"

#include "audio/audio_io.h"
#include "logging/logger.h"

#include <system_error>

namespace subdub {
namespace synthesis {

namespace fs = std::filesystem;

SegmentStore::SegmentStore(fs::path workDir) : workDir_(std::move(workDir)) {}

bool SegmentStore::prepare() {
    std::error_code ec;
    fs::create_directories(workDir_ / "cache", ec);
    if (ec) {
        LOG_ERROR("Cannot create working directory {}: {}", workDir_.string(), ec.message());
        return false;
    }
    return true;
}

fs::path SegmentStore::segmentPath(std::size_t position, const std::string& textHash) const {
    return workDir_ / ("raw_" + std::to_string(position) + "_" + textHash + ".wav");
}

fs::path SegmentStore::cachePath(const std::string& textHash) const {
    return workDir_ / "cache" / ("cache_" + textHash + ".wav");
}

bool SegmentStore::loadFile(const fs::path& path, audio::SampleBuffer& out) const {
    std::error_code ec;
    if (!fs::exists(path, ec) || fs::file_size(path, ec) == 0 || ec) {
        return false;
    }
    audio::SampleBuffer loaded;
    if (!AudioIO::readAudioFile(path.string(), loaded) || loaded.empty()) {
        LOG_WARN("Ignoring unreadable segment file {}", path.string());
        return false;
    }
    out = std::move(loaded);
    return true;
}

bool SegmentStore::saveFile(const fs::path& path, const audio::SampleBuffer& buffer) const {
    fs::path tmpPath = path;
    tmpPath += ".tmp";
    if (!AudioIO::writeAudioFile(tmpPath.string(), buffer, AudioIO::TrackFormat::Wav)) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        return false;
    }
    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        LOG_ERROR("Cannot move {} into place: {}", path.string(), ec.message());
        fs::remove(tmpPath, ec);
        return false;
    }
    return true;
}

bool SegmentStore::loadSegment(std::size_t position, const std::string& textHash,
                               audio::SampleBuffer& out) const {
    return loadFile(segmentPath(position, textHash), out);
}

bool SegmentStore::saveSegment(std::size_t position, const std::string& textHash,
                               const audio::SampleBuffer& buffer) const {
    return saveFile(segmentPath(position, textHash), buffer);
}

bool SegmentStore::loadCached(const std::string& textHash, audio::SampleBuffer& out) const {
    return loadFile(cachePath(textHash), out);
}

bool SegmentStore::saveCached(const std::string& textHash,
                              const audio::SampleBuffer& buffer) const {
    return saveFile(cachePath(textHash), buffer);
}

bool SegmentStore::removeAll() const {
    std::error_code ec;
    fs::remove_all(workDir_, ec);
    if (ec) {
        LOG_WARN("Cannot remove working directory {}: {}", workDir_.string(), ec.message());
        return false;
    }
    LOG_DEBUG("Removed working directory {}", workDir_.string());
    return true;
}

}  // namespace synthesis
}  // namespace subdub
