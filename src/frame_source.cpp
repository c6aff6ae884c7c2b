#include "frame_source.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include "image_io.hpp"

namespace qrdrop::recv {

namespace fs = std::filesystem;

bool ImageDirSource::open(const FrameSourceConfig& cfg) {
    cfg_     = cfg;
    decoder_ = OpticalDecoder(cfg.encoding, cfg.verbose);
    files_.clear();
    index_ = 0;

    std::error_code ec;
    fs::directory_iterator it(cfg_.image_dir, ec);
    if (ec) {
        std::fprintf(stderr, "[frames] cannot read directory '%s': %s\n",
                     cfg_.image_dir.c_str(), ec.message().c_str());
        return false;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        std::string name = it->path().filename().string();
        if (ImageLoader::is_supported(name)) {
            files_.push_back(std::move(name));
        }
    }
    if (ec) {
        std::fprintf(stderr, "[frames] listing '%s' stopped early: %s\n",
                     cfg_.image_dir.c_str(), ec.message().c_str());
        return false;
    }
    std::sort(files_.begin(), files_.end());

    std::printf("[frames] %zu images in %s\n", files_.size(),
                cfg_.image_dir.c_str());
    return true;
}

std::optional<ScannedFrame> ImageDirSource::next() {
    if (index_ >= files_.size()) return std::nullopt;

    ScannedFrame frame;
    frame.label = files_[index_++];

    std::string path = (fs::path(cfg_.image_dir) / frame.label).string();
    auto loaded = ImageLoader::load(path);
    if (!loaded.ok) {
        std::fprintf(stderr, "[frames] %s: %s\n", frame.label.c_str(),
                     loaded.error.c_str());
        return frame;
    }

    frame.payload = decoder_.decode(loaded.raster);
    if (!frame.payload && cfg_.verbose) {
        std::printf("[frames] %s: no code found\n", frame.label.c_str());
    }
    return frame;
}

} // namespace qrdrop::recv
